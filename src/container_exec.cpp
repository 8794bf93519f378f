#include "container_exec.h"

#include <chrono>
#include <future>

#include <spdlog/spdlog.h>

#include "paths.h"
#include "utils.h"
#include "log_stream.h"
#include "docker_client.h"

namespace {

constexpr long kStoppedWaitMs = 10000;

const char* ContainerStateName(ContainerState state) {
  switch (state) {
#define X(name, str) case ContainerState::name: return str;
    ENUM_CONTAINER_STATE_
#undef X
  }
  __builtin_unreachable();
}

void LogState(const std::string& id, ContainerState state) {
  spdlog::debug("Container {} {}", id.substr(0, 12), ContainerStateName(state));
}

// Removes the container when the run ends, however it ends
class ContainerGuard {
  DockerClient& client_;
  std::string id_;
  bool preserve_;
  bool done_;
 public:
  ContainerGuard(DockerClient& client, std::string id, bool preserve) :
      client_(client), id_(std::move(id)), preserve_(preserve), done_(false) {}
  ContainerGuard(const ContainerGuard&) = delete;
  ContainerGuard& operator=(const ContainerGuard&) = delete;
  ~ContainerGuard() { Remove(); }

  void Remove() {
    if (done_) return;
    done_ = true;
    if (preserve_) {
      spdlog::info("Keeping container {} for inspection", id_);
      return;
    }
    try {
      client_.RemoveContainer(id_);
      LogState(id_, ContainerState::REMOVED);
    } catch (const DockerError& e) {
      spdlog::warn("Failed removing container {}: {}", id_, e.what());
    }
  }
};

// never throws; the run already failed with a timeout
void StopAfterTimeout(DockerClient& client, const std::string& id) {
  try {
    client.StopContainer(id, kStopGraceSec);
    return;
  } catch (const DockerError& e) {
    spdlog::warn("Failed stopping container {}, killing: {}", id, e.what());
  }
  try {
    client.KillContainer(id);
  } catch (const DockerError& e) {
    spdlog::warn("Failed killing container {}: {}", id, e.what());
  }
}

DemuxedLogs FetchLogs(DockerClient& client, const std::string& id) {
  return DemuxLogStream(client.ContainerLogs(id));
}

// RuntimeError carrying whatever output the container produced
RuntimeError RunFailure(DockerClient& client, const std::string& id, const std::string& msg,
                        const std::string& cause, const std::string& cmdline) {
  DemuxedLogs logs;
  try {
    logs = FetchLogs(client, id);
  } catch (const DockerError& e) {
    spdlog::warn("Failed collecting output of container {}: {}", id, e.what());
  }
  return RuntimeError(msg, cause, cmdline, std::move(logs.stdout_text), std::move(logs.stderr_text));
}

} // namespace

nlohmann::json ContainerCreateBody(const SecurityPolicy& policy, const PreparedCommand& prepared,
                                   const ContainerRunOptions& opt) {
  nlohmann::json body = {{"Image", policy.image}};
  if (auto cmd = std::get_if<ExplicitCommand>(&prepared.command)) {
    nlohmann::json cmdline = nlohmann::json::array({cmd->executable});
    for (auto& i : cmd->args) cmdline.push_back(i);
    body["Cmd"] = cmdline;
  } else {
    auto& args = std::get<ImageDefaultCommand>(prepared.command).args;
    if (!args.empty()) body["Cmd"] = args;
  }
  body["WorkingDir"] = prepared.workdir.string();
  nlohmann::json env = nlohmann::json::array();
  for (auto& i : prepared.env) env.push_back(i.first + '=' + i.second);
  body["Env"] = env;

  bool has_stdin = opt.stdin_data.has_value();
  body["AttachStdin"] = has_stdin;
  body["OpenStdin"] = has_stdin;
  body["StdinOnce"] = has_stdin;
  body["Tty"] = false;
  if (opt.uid) {
    body["User"] = opt.gid ? fmt::format("{}:{}", *opt.uid, *opt.gid) : std::to_string(*opt.uid);
  }

  nlohmann::json host = {
    {"Binds", {fmt::format("{}:{}:{}", opt.workspace.string(), kContainerWorkspace,
                           MountModeName(policy.workspace_mount_mode))}},
  };
  if (!policy.network_mode.empty()) host["NetworkMode"] = policy.network_mode;
  if (opt.memory_limit_mb) host["Memory"] = *opt.memory_limit_mb * 1024 * 1024;
  if (policy.cpu_shares) host["CpuShares"] = *policy.cpu_shares;
  if (policy.cpu_period) host["CpuPeriod"] = *policy.cpu_period;
  if (policy.cpu_quota) host["CpuQuota"] = *policy.cpu_quota;
  if (policy.pids_limit) host["PidsLimit"] = *policy.pids_limit;
  if (!policy.cap_drop.empty()) host["CapDrop"] = policy.cap_drop;
  if (!policy.cap_add.empty()) host["CapAdd"] = policy.cap_add;
  if (policy.no_new_privileges.value_or(false)) host["SecurityOpt"] = {"no-new-privileges"};
  if (policy.readonly_rootfs) host["ReadonlyRootfs"] = *policy.readonly_rootfs;
  body["HostConfig"] = host;
  return body;
}

void EnsureImage(DockerClient& client, const SecurityPolicy& policy) {
  const std::string& image = policy.image;
  try {
    switch (policy.pull_policy) {
      case PullPolicy::ALWAYS:
        client.PullImage(image);
        return;
      case PullPolicy::IF_NOT_PRESENT:
        if (!client.ImageExists(image)) client.PullImage(image);
        return;
      case PullPolicy::NEVER:
        if (!client.ImageExists(image)) {
          throw RuntimeError("Image " + image + " is not present locally",
                             "pull policy is " + std::string(PullPolicyName(policy.pull_policy)));
        }
        return;
    }
  } catch (const DockerError& e) {
    throw RuntimeError("Failed to prepare image " + image, e.what());
  }
}

ExecutionResult ContainerExec(const SecurityPolicy& policy, const PreparedCommand& prepared,
                              const ContainerRunOptions& opt) {
  std::string cmdline = FormatCommandLine(prepared.command);
  DockerClient client(opt.docker_socket);
  EnsureImage(client, policy);

  std::string id;
  try {
    id = client.CreateContainer(ContainerCreateBody(policy, prepared, opt));
  } catch (const DockerError& e) {
    throw RuntimeError("Failed to create container", e.what(), cmdline);
  }
  LogState(id, ContainerState::CREATED);
  ContainerGuard guard(client, id, opt.preserve_container);

  auto start = std::chrono::steady_clock::now();
  try {
    std::optional<AttachedStream> input;
    if (opt.stdin_data) input.emplace(client.AttachStdin(id));
    start = std::chrono::steady_clock::now();
    client.StartContainer(id);
    LogState(id, ContainerState::STARTED);
    if (input) {
      input->Write(*opt.stdin_data);
      input->CloseWrite();
    }
  } catch (const DockerError& e) {
    throw RunFailure(client, id, "Failed to start container", e.what(), cmdline);
  }

  auto waiter = std::async(std::launch::async, [&client, id]() { return client.WaitContainer(id); });
  auto deadline = start + std::chrono::milliseconds(opt.timeout_ms);
  if (waiter.wait_until(deadline) != std::future_status::ready) {
    long duration = ElapsedMs(start);
    LogState(id, ContainerState::TIMED_OUT);
    StopAfterTimeout(client, id);
    DemuxedLogs logs;
    if (waiter.wait_for(std::chrono::milliseconds(kStoppedWaitMs)) == std::future_status::ready) {
      try {
        logs = FetchLogs(client, id);
      } catch (const DockerError& e) {
        spdlog::warn("Failed collecting output of timed out container {}: {}", id, e.what());
      }
    }
    // unblocks the waiter if the container refused to stop
    guard.Remove();
    throw TimeoutError(fmt::format("Execution timed out after {} ms", opt.timeout_ms),
        opt.timeout_ms, duration, std::move(logs.stdout_text), std::move(logs.stderr_text));
  }

  ExecutionResult result;
  WaitResult wait_result;
  DemuxedLogs logs;
  try {
    wait_result = waiter.get();
  } catch (const DockerError& e) {
    throw RunFailure(client, id, "Failed waiting for container", e.what(), cmdline);
  }
  result.duration_ms = ElapsedMs(start);
  LogState(id, ContainerState::EXITED);
  try {
    logs = FetchLogs(client, id);
  } catch (const DockerError& e) {
    throw RuntimeError("Failed to collect container output", e.what(), cmdline);
  }
  if (!wait_result.error.empty()) logs.stderr_text += "\nContainer Exit Error: " + wait_result.error;

  if (opt.memory_limit_mb) {
    bool oom = false;
    try {
      oom = client.ContainerOOMKilled(id);
    } catch (const DockerError& e) {
      spdlog::warn("Failed inspecting container {}: {}", id, e.what());
    }
    if (oom) {
      throw MemoryLimitError(
          fmt::format("Container exceeded its memory limit of {} MB", *opt.memory_limit_mb),
          *opt.memory_limit_mb, std::move(logs.stdout_text), std::move(logs.stderr_text));
    }
  }
  result.stdout_text = std::move(logs.stdout_text);
  result.stderr_text = std::move(logs.stderr_text);
  result.exit_code = (int)wait_result.status_code;
  spdlog::debug("Container {} finished in {} ms: exit_code={}", id.substr(0, 12),
                result.duration_ms, *result.exit_code);
  return result;
}
