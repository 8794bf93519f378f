#ifndef CONTAINER_EXEC_H_
#define CONTAINER_EXEC_H_

#include <string>
#include <optional>
#include <filesystem>

#include <nlohmann/json.hpp>

#include "command.h"

class DockerClient;

#define ENUM_CONTAINER_STATE_ \
  X(CREATED, "created") \
  X(STARTED, "started") \
  X(EXITED, "exited") \
  X(TIMED_OUT, "timed out") \
  X(REMOVED, "removed")
enum class ContainerState {
#define X(name, str) name,
  ENUM_CONTAINER_STATE_
#undef X
};

struct ContainerRunOptions {
  long timeout_ms;
  std::optional<long> memory_limit_mb;
  std::optional<std::string> stdin_data;
  // host directory bind-mounted at kContainerWorkspace
  std::filesystem::path workspace;
  std::optional<int> uid, gid;
  bool preserve_container;
  std::string docker_socket;

  ContainerRunOptions() : timeout_ms(0), preserve_container(false) {}
};

// grace period of the stop request sent after a timeout
constexpr int kStopGraceSec = 2;

// Engine API create body; unset policy fields are left out
nlohmann::json ContainerCreateBody(const SecurityPolicy&, const PreparedCommand&, const ContainerRunOptions&);

// Applies the pull policy; throws RuntimeError
void EnsureImage(DockerClient&, const SecurityPolicy&);

// One container per call: create, attach stdin, start, wait (bounded by the
// timeout), collect logs, remove.
ExecutionResult ContainerExec(const SecurityPolicy&, const PreparedCommand&, const ContainerRunOptions&);

#endif  // CONTAINER_EXEC_H_
