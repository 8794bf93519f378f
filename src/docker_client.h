#ifndef DOCKER_CLIENT_H_
#define DOCKER_CLIENT_H_

#include <string>
#include <stdexcept>

#include <nlohmann/json.hpp>

// A failed call to the daemon. status is the HTTP status, or -1 when no
// response arrived.
class DockerError : public std::runtime_error {
 public:
  int status;
  DockerError(int status_, const std::string& msg) : std::runtime_error(msg), status(status_) {}
};

// Hijacked attach connection carrying the container's stdin
class AttachedStream {
  int fd_;
 public:
  explicit AttachedStream(int fd) : fd_(fd) {}
  AttachedStream(AttachedStream&& x) noexcept : fd_(x.fd_) { x.fd_ = -1; }
  AttachedStream(const AttachedStream&) = delete;
  AttachedStream& operator=(const AttachedStream&) = delete;
  ~AttachedStream();

  void Write(const std::string& data);
  // half-close; the container then sees end of input
  void CloseWrite();
};

struct WaitResult {
  long status_code;
  std::string error; // daemon-reported wait error, usually empty
};

// Docker Engine API over a unix socket. Each call opens its own connection,
// so one client may be used from several threads.
class DockerClient {
  std::string socket_path_;
 public:
  explicit DockerClient(std::string socket_path) : socket_path_(std::move(socket_path)) {}
  const std::string& SocketPath() const { return socket_path_; }

  // true if the daemon answers; never throws
  bool Ping();
  bool ImageExists(const std::string& image);
  void PullImage(const std::string& image);
  // returns the container id
  std::string CreateContainer(const nlohmann::json& body);
  AttachedStream AttachStdin(const std::string& id);
  void StartContainer(const std::string& id);
  // blocks until the container stops
  WaitResult WaitContainer(const std::string& id);
  // false if the container was already stopped or gone
  bool StopContainer(const std::string& id, int grace_seconds);
  void KillContainer(const std::string& id);
  void RemoveContainer(const std::string& id);
  // raw multiplexed stdout/stderr stream
  std::string ContainerLogs(const std::string& id);
  bool ContainerOOMKilled(const std::string& id);
};

#endif  // DOCKER_CLIENT_H_
