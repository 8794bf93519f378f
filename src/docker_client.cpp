#include "docker_client.h"

#include <unistd.h>
#include <sys/un.h>
#include <sys/socket.h>

#include <cstdio>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <spdlog/spdlog.h>

#include "http_utils.h"

namespace {

constexpr time_t kDefaultReadTimeoutSec = 60;
constexpr time_t kPullReadTimeoutSec = 1800;
// a wait returns only when the container stops; the caller bounds it
constexpr time_t kWaitReadTimeoutSec = 86400;
constexpr size_t kMaxHeaderSize = 16384;

httplib::Client MakeClient(const std::string& socket_path, time_t read_timeout = kDefaultReadTimeoutSec) {
  httplib::Client cli(socket_path);
  cli.set_address_family(AF_UNIX);
  // the daemon rejects a socket path as Host
  cli.set_default_headers({{"Host", "localhost"}});
  cli.set_read_timeout(read_timeout, 0);
  return cli;
}

std::string DaemonMessage(const std::string& body) {
  auto json = nlohmann::json::parse(body, nullptr, false);
  if (json.is_object() && json.contains("message") && json["message"].is_string()) {
    return json["message"].get<std::string>();
  }
  return body;
}

[[noreturn]] void Fail(const std::string& what, const httplib::Result& res) {
  std::string msg = what + ": " + DescribeResult(res);
  if (res && !res->body.empty()) msg += ": " + DaemonMessage(res->body);
  throw DockerError(res ? res->status : -1, msg);
}

std::string ContainerPath(const std::string& id, const char* action) {
  return "/containers/" + id + action;
}

// "name[:tag]" or "name@digest"; registry ports do not count as a tag
std::pair<std::string, std::string> SplitImageRef(const std::string& image) {
  if (image.find('@') != std::string::npos) return {image, ""};
  size_t colon = image.rfind(':');
  size_t slash = image.rfind('/');
  if (colon == std::string::npos || (slash != std::string::npos && colon < slash)) {
    return {image, "latest"};
  }
  return {image.substr(0, colon), image.substr(colon + 1)};
}

} // namespace

AttachedStream::~AttachedStream() {
  if (fd_ >= 0) close(fd_);
}

void AttachedStream::Write(const std::string& data) {
  size_t off = 0;
  while (off < data.size()) {
    ssize_t n = send(fd_, data.data() + off, data.size() - off, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw DockerError(-1, std::string("Failed writing container stdin: ") + strerror(errno));
    }
    off += n;
  }
}

void AttachedStream::CloseWrite() {
  if (fd_ >= 0 && shutdown(fd_, SHUT_WR) < 0) {
    spdlog::warn("Failed closing container stdin: {}", strerror(errno));
  }
}

bool DockerClient::Ping() {
  auto cli = MakeClient(socket_path_);
  cli.set_connection_timeout(2, 0);
  return IsSuccess(HTTPRequest<HTTPGet>(cli, "/_ping"));
}

bool DockerClient::ImageExists(const std::string& image) {
  auto cli = MakeClient(socket_path_);
  auto res = HTTPRequest<HTTPGet>(cli, "/images/" + image + "/json");
  if (res && res->status == 404) return false;
  if (!IsSuccess(res)) Fail("Failed inspecting image " + image, res);
  return true;
}

void DockerClient::PullImage(const std::string& image) {
  auto ref = SplitImageRef(image);
  httplib::Params params = {{"fromImage", ref.first}};
  if (!ref.second.empty()) params.emplace("tag", ref.second);
  auto cli = MakeClient(socket_path_, kPullReadTimeoutSec);
  spdlog::info("Pulling image {}", image);
  auto res = HTTPRequest<HTTPPost>(cli, httplib::append_query_params("/images/create", params),
                                   std::string(), "application/json");
  if (!IsSuccess(res)) Fail("Failed pulling image " + image, res);
  // progress stream; failures show up as an "error" line with status 200
  std::istringstream lines(res->body);
  for (std::string line; std::getline(lines, line);) {
    if (line.empty()) continue;
    auto json = nlohmann::json::parse(line, nullptr, false);
    if (json.is_object() && json.contains("error")) {
      throw DockerError(res->status, "Failed pulling image " + image + ": " + json["error"].dump());
    }
  }
  spdlog::info("Pulled image {}", image);
}

std::string DockerClient::CreateContainer(const nlohmann::json& body) {
  auto cli = MakeClient(socket_path_);
  auto res = HTTPRequest<HTTPPost>(cli, "/containers/create", body.dump(), "application/json");
  if (!IsSuccess(res)) Fail("Failed creating container", res);
  auto json = nlohmann::json::parse(res->body, nullptr, false);
  if (!json.is_object() || !json.contains("Id") || !json["Id"].is_string()) {
    throw DockerError(res->status, "Unexpected container create response: " + res->body);
  }
  return json["Id"].get<std::string>();
}

AttachedStream DockerClient::AttachStdin(const std::string& id) {
  sockaddr_un addr = {};
  addr.sun_family = AF_UNIX;
  if (socket_path_.size() >= sizeof(addr.sun_path)) {
    throw DockerError(-1, "Docker socket path too long: " + socket_path_);
  }
  strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);
  int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) throw DockerError(-1, std::string("Failed creating socket: ") + strerror(errno));
  AttachedStream stream(fd);
  if (connect(fd, (sockaddr*)&addr, sizeof(addr)) < 0) {
    throw DockerError(-1, "Failed connecting to " + socket_path_ + ": " + strerror(errno));
  }

  std::string path = ContainerPath(id, "/attach?stream=1&stdin=1");
  spdlog::debug("POST {} (hijacked)", path);
  stream.Write(fmt::format(
      "POST {} HTTP/1.1\r\nHost: localhost\r\nConnection: Upgrade\r\nUpgrade: tcp\r\n"
      "Content-Length: 0\r\n\r\n", path));

  std::string header;
  while (header.find("\r\n\r\n") == std::string::npos) {
    char buf[512];
    ssize_t n = recv(fd, buf, sizeof(buf), 0);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0 || header.size() > kMaxHeaderSize) {
      throw DockerError(-1, "Failed attaching to container " + id + ": connection closed");
    }
    header.append(buf, n);
  }
  int status = -1;
  if (sscanf(header.c_str(), "HTTP/%*s %d", &status) != 1 || (status != 101 && status != 200)) {
    throw DockerError(status, "Failed attaching to container " + id + ": " +
                      header.substr(0, header.find("\r\n")));
  }
  return stream;
}

void DockerClient::StartContainer(const std::string& id) {
  auto cli = MakeClient(socket_path_);
  auto res = HTTPRequest<HTTPPost>(cli, ContainerPath(id, "/start"), std::string(), "application/json");
  // 304: already started
  if (res && res->status == 304) return;
  if (!IsSuccess(res)) Fail("Failed starting container " + id, res);
}

WaitResult DockerClient::WaitContainer(const std::string& id) {
  auto cli = MakeClient(socket_path_, kWaitReadTimeoutSec);
  auto res = HTTPRequest<HTTPPost>(cli, ContainerPath(id, "/wait"), std::string(), "application/json");
  if (!IsSuccess(res)) Fail("Failed waiting for container " + id, res);
  auto json = nlohmann::json::parse(res->body, nullptr, false);
  if (!json.is_object() || !json.contains("StatusCode") || !json["StatusCode"].is_number()) {
    throw DockerError(res->status, "Unexpected container wait response: " + res->body);
  }
  WaitResult ret{json["StatusCode"].get<long>(), ""};
  if (json.contains("Error") && json["Error"].is_object()) {
    ret.error = json["Error"].value("Message", "");
  }
  return ret;
}

bool DockerClient::StopContainer(const std::string& id, int grace_seconds) {
  auto cli = MakeClient(socket_path_, kDefaultReadTimeoutSec + grace_seconds);
  auto res = HTTPRequest<HTTPPost>(cli,
      httplib::append_query_params(ContainerPath(id, "/stop"), {{"t", std::to_string(grace_seconds)}}),
      std::string(), "application/json");
  if (res && (res->status == 304 || res->status == 404)) return false;
  if (!IsSuccess(res)) Fail("Failed stopping container " + id, res);
  return true;
}

void DockerClient::KillContainer(const std::string& id) {
  auto cli = MakeClient(socket_path_);
  auto res = HTTPRequest<HTTPPost>(cli, ContainerPath(id, "/kill"), std::string(), "application/json");
  if (!IsSuccess(res)) Fail("Failed killing container " + id, res);
}

void DockerClient::RemoveContainer(const std::string& id) {
  auto cli = MakeClient(socket_path_);
  auto res = HTTPRequest<HTTPDelete>(cli,
      httplib::append_query_params(ContainerPath(id, ""), {{"force", "1"}, {"v", "1"}}));
  if (res && res->status == 404) return;
  if (!IsSuccess(res)) Fail("Failed removing container " + id, res);
}

std::string DockerClient::ContainerLogs(const std::string& id) {
  auto cli = MakeClient(socket_path_);
  auto res = HTTPRequest<HTTPGet>(cli,
      httplib::append_query_params(ContainerPath(id, "/logs"), {{"stdout", "1"}, {"stderr", "1"}}));
  if (!IsSuccess(res)) Fail("Failed fetching logs of container " + id, res);
  return res->body;
}

bool DockerClient::ContainerOOMKilled(const std::string& id) {
  auto cli = MakeClient(socket_path_);
  auto res = HTTPRequest<HTTPGet>(cli, ContainerPath(id, "/json"));
  if (!IsSuccess(res)) Fail("Failed inspecting container " + id, res);
  auto json = nlohmann::json::parse(res->body, nullptr, false);
  if (!json.is_object() || !json.contains("State") || !json["State"].is_object()) return false;
  return json["State"].value("OOMKilled", false);
}
