#ifndef INCLUDE_RUNBOX_ENVIRONMENT_H_
#define INCLUDE_RUNBOX_ENVIRONMENT_H_

#include <map>
#include <set>
#include <memory>
#include <string>
#include <vector>
#include <future>
#include <utility>
#include <optional>
#include <filesystem>

#define ENUM_LANGUAGE_ \
  X(JAVASCRIPT, "javascript") \
  X(TYPESCRIPT, "typescript") \
  X(PYTHON, "python")
enum class Language {
#define X(name, str) name,
  ENUM_LANGUAGE_
#undef X
};

#define ENUM_BACKEND_ \
  X(PROCESS, "process") \
  X(CONTAINER, "container")
enum class Backend {
#define X(name, str) name,
  ENUM_BACKEND_
#undef X
};

#define ENUM_PULL_POLICY_ \
  X(ALWAYS, "Always") \
  X(IF_NOT_PRESENT, "IfNotPresent") \
  X(NEVER, "Never")
enum class PullPolicy {
#define X(name, str) name,
  ENUM_PULL_POLICY_
#undef X
};

#define ENUM_MOUNT_MODE_ \
  X(RW, "rw") \
  X(RO, "ro")
enum class MountMode {
#define X(name, str) name,
  ENUM_MOUNT_MODE_
#undef X
};

using EnvMap = std::map<std::string, std::string>;

// cap_drop entry meaning "every capability"
extern const char kCapabilityAll[];

class LanguageOptions {
 public:
  // empty means the engine default
  std::string python_path, node_path, tsc_path;
  std::optional<long> process_limit;
  // identity override; process backend on Unix hosts and container user spec
  std::optional<int> uid, gid;
  // diagnostics: do not remove the container after the run
  bool preserve_container;

  LanguageOptions() : preserve_container(false) {}
};

// Container isolation controls. Unset fields keep the runtime defaults.
class SecurityPolicy {
 public:
  std::string image;
  PullPolicy pull_policy;
  std::string network_mode;
  MountMode workspace_mount_mode;
  std::optional<long> cpu_shares, cpu_period, cpu_quota;
  std::optional<long> pids_limit;
  std::vector<std::string> cap_drop; // may contain kCapabilityAll
  std::vector<std::string> cap_add;
  std::optional<bool> no_new_privileges;
  std::optional<bool> readonly_rootfs;

  SecurityPolicy() :
      pull_policy(PullPolicy::IF_NOT_PRESENT),
      workspace_mount_mode(MountMode::RW) {}
};

class EnvironmentConfig {
 public:
  Language language;
  Backend backend;
  long timeout_ms;
  std::optional<long> memory_limit_mb;
  EnvMap env;
  std::optional<std::string> stdin_data;
  LanguageOptions language_options;
  SecurityPolicy security_policy;
  // container daemon control socket
  std::string docker_socket;

  EnvironmentConfig();
};

// Per-call overrides; each field independently replaces the environment default
class ExecuteOptions {
 public:
  std::optional<long> timeout_ms;
  std::optional<long> memory_limit_mb;
  std::optional<EnvMap> env;
  std::optional<std::string> stdin_data;
};

class ExecutionResult {
 public:
  std::string stdout_text, stderr_text;
  // graceful exit: exit_code set, signal empty; forced termination: signal set
  std::optional<int> exit_code;
  std::optional<std::string> signal;
  long duration_ms;

  ExecutionResult() : duration_ms(0) {}
};

class ToolchainResolver;

// Owns one scratch workspace directory. Not copyable; the directory is only
// removed by Delete().
class Environment {
  std::filesystem::path workspace_;
  EnvironmentConfig config_;
  std::set<std::filesystem::path> files_;
  std::unique_ptr<ToolchainResolver> toolchain_;
  bool deleted_;

  Environment(EnvironmentConfig&& config, std::filesystem::path&& workspace);
  void CheckAlive_() const;
 public:
  // Validates the config and allocates the workspace under the resolved temp root
  static Environment Create(EnvironmentConfig config);

  Environment(Environment&&) noexcept;
  Environment& operator=(Environment&&) noexcept;
  Environment(const Environment&) = delete;
  Environment& operator=(const Environment&) = delete;
  ~Environment();

  const std::filesystem::path& Workspace() const { return workspace_; }
  const EnvironmentConfig& Config() const { return config_; }
  const std::set<std::filesystem::path>& Files() const { return files_; }
  ToolchainResolver& Toolchain() { return *toolchain_; }

  // path must be relative and must not contain ".." segments
  void AddFile(const std::filesystem::path& path, const std::string& content);
  void AddFiles(const std::vector<std::pair<std::filesystem::path, std::string>>& files);

  // command empty = engine default interpreter
  ExecutionResult Execute(const std::string& command, const std::vector<std::string>& args,
                          const ExecuteOptions& options = {});
  // Runs Execute on its own thread. The call works on this object, so the
  // Environment must not be moved, deleted or destroyed until every returned
  // future is ready.
  std::future<ExecutionResult> ExecuteAsync(std::string command, std::vector<std::string> args,
                                            ExecuteOptions options = {});

  // Recursive forced removal; safe to call more than once, never throws
  void Delete();
  bool Deleted() const { return deleted_; }
};

#endif  // INCLUDE_RUNBOX_ENVIRONMENT_H_
