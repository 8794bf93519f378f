#include <runbox/environment.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <spdlog/spdlog.h>

#include "paths.h"
#include "utils.h"
#include "engines.h"
#include "toolchain.h"
#include "process_exec.h"
#include "container_exec.h"

namespace {

constexpr long kDefaultTimeoutMs = 10000;
constexpr char kDefaultDockerSocket[] = "/var/run/docker.sock";

std::string DefaultDockerSocket() {
  const char* host = getenv("DOCKER_HOST");
  const std::string kUnixScheme = "unix://";
  if (host && strncmp(host, kUnixScheme.c_str(), kUnixScheme.size()) == 0) {
    return host + kUnixScheme.size();
  }
  return kDefaultDockerSocket;
}

void CheckPositive(const char* name, const std::optional<long>& value) {
  if (value && *value <= 0) {
    throw ConfigurationError(fmt::format("{} must be a positive number, got {}", name, *value));
  }
}

void ValidateConfig(const EnvironmentConfig& config) {
  switch (config.language) {
    case Language::JAVASCRIPT:
    case Language::TYPESCRIPT:
    case Language::PYTHON:
      break;
    default:
      throw ConfigurationError("Unsupported language");
  }
  if (config.backend != Backend::PROCESS && config.backend != Backend::CONTAINER) {
    throw ConfigurationError("Unsupported backend");
  }
  CheckPositive("timeout_ms", config.timeout_ms);
  CheckPositive("memory_limit_mb", config.memory_limit_mb);
  CheckPositive("process_limit", config.language_options.process_limit);
  const auto& policy = config.security_policy;
  CheckPositive("cpu_shares", policy.cpu_shares);
  CheckPositive("cpu_period", policy.cpu_period);
  CheckPositive("cpu_quota", policy.cpu_quota);
  CheckPositive("pids_limit", policy.pids_limit);
  if (config.backend == Backend::CONTAINER) {
    if (policy.image.empty()) throw ConfigurationError("The container backend needs an image");
    if (config.docker_socket.empty()) throw ConfigurationError("The container backend needs a daemon socket");
  }
}

// relative, non-traversing, naming a file
fs::path NormalizeStagedPath(const fs::path& path) {
  if (path.empty()) throw ConfigurationError("File path must not be empty");
  if (path.is_absolute() || path.has_root_path()) {
    throw ConfigurationError("File path must be relative: " + path.string());
  }
  fs::path norm = path.lexically_normal();
  for (auto& i : norm) {
    if (i == "..") throw ConfigurationError("File path must stay inside the workspace: " + path.string());
  }
  if (norm == "." || !norm.has_filename()) {
    throw ConfigurationError("File path must name a file: " + path.string());
  }
  return norm;
}

} // namespace

EnvironmentConfig::EnvironmentConfig() :
    language(Language::JAVASCRIPT),
    backend(Backend::PROCESS),
    timeout_ms(kDefaultTimeoutMs),
    docker_socket(DefaultDockerSocket()) {}

Environment::Environment(EnvironmentConfig&& config, fs::path&& workspace) :
    workspace_(std::move(workspace)),
    config_(std::move(config)),
    toolchain_(std::make_unique<ToolchainResolver>()),
    deleted_(false) {}

// a moved-from Environment behaves as deleted and owns nothing
Environment::Environment(Environment&& x) noexcept :
    workspace_(std::move(x.workspace_)),
    config_(std::move(x.config_)),
    files_(std::move(x.files_)),
    toolchain_(std::move(x.toolchain_)),
    deleted_(x.deleted_) {
  x.deleted_ = true;
}

Environment& Environment::operator=(Environment&& x) noexcept {
  if (this == &x) return *this;
  workspace_ = std::move(x.workspace_);
  config_ = std::move(x.config_);
  files_ = std::move(x.files_);
  toolchain_ = std::move(x.toolchain_);
  deleted_ = x.deleted_;
  x.deleted_ = true;
  return *this;
}

Environment::~Environment() = default;

Environment Environment::Create(EnvironmentConfig config) {
  ValidateConfig(config);
  std::string tmpl = (TempRoot() / (std::string(kWorkspacePrefix) + "XXXXXX")).string();
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  if (!mkdtemp(buf.data())) {
    throw RuntimeError("Failed to create workspace", strerror(errno), tmpl);
  }
  fs::path workspace(buf.data());
  // identity overrides must still be able to enter the workspace
  SetPerms(workspace, kPerm755);
  spdlog::debug("Created workspace {} language={} backend={}", workspace.c_str(),
                LanguageName(config.language), BackendName(config.backend));
  return Environment(std::move(config), std::move(workspace));
}

void Environment::CheckAlive_() const {
  if (deleted_) throw ConfigurationError("Environment has been deleted: " + workspace_.string());
}

void Environment::AddFile(const fs::path& path, const std::string& content) {
  CheckAlive_();
  fs::path rel = NormalizeStagedPath(path);
  fs::path target = workspace_ / rel;
  if (rel.has_parent_path() && !CreateDirs(target.parent_path())) {
    throw RuntimeError("Failed to stage " + rel.string(), "cannot create parent directories");
  }
  if (!WriteFile(target, content, kPerm755)) {
    throw RuntimeError("Failed to stage " + rel.string(), strerror(errno));
  }
  files_.insert(rel);
  spdlog::debug("Staged {} ({} bytes)", rel.c_str(), content.size());
}

void Environment::AddFiles(const std::vector<std::pair<fs::path, std::string>>& files) {
  for (auto& i : files) AddFile(i.first, i.second);
}

ExecutionResult Environment::Execute(const std::string& command, const std::vector<std::string>& args,
                                     const ExecuteOptions& options) {
  CheckAlive_();
  CheckPositive("timeout_ms", options.timeout_ms);
  CheckPositive("memory_limit_mb", options.memory_limit_mb);

  RunOptions opts;
  opts.timeout_ms = options.timeout_ms.value_or(config_.timeout_ms);
  opts.memory_limit_mb = options.memory_limit_mb ? options.memory_limit_mb : config_.memory_limit_mb;
  opts.env = options.env ? *options.env : config_.env;
  opts.stdin_data = options.stdin_data ? options.stdin_data : config_.stdin_data;

  LanguageEngine engine = SelectEngine(config_.language, config_.backend);
  PrepareResult prepared_or_error = PrepareCommand(engine, *this, command, args, opts);
  if (auto err = std::get_if<CompilationError>(&prepared_or_error)) throw *err;
  auto& prepared = std::get<PreparedCommand>(prepared_or_error);
  spdlog::debug("Run {} in {}", FormatCommandLine(prepared.command), prepared.workdir.c_str());

  const auto& lang = config_.language_options;
  ExecutionResult result;
  if (config_.backend == Backend::CONTAINER) {
    ContainerRunOptions copt;
    copt.timeout_ms = opts.timeout_ms;
    copt.memory_limit_mb = opts.memory_limit_mb;
    copt.stdin_data = opts.stdin_data;
    copt.workspace = workspace_;
    copt.uid = lang.uid;
    copt.gid = lang.gid;
    copt.preserve_container = lang.preserve_container;
    copt.docker_socket = config_.docker_socket;
    result = ContainerExec(config_.security_policy, prepared, copt);
  } else {
    ProcessOptions popt;
    popt.timeout_ms = opts.timeout_ms;
    popt.stdin_data = opts.stdin_data;
    popt.uid = lang.uid;
    popt.gid = lang.gid;
    result = ProcessExec(prepared, popt);
  }
  spdlog::info("Executed {} with {}: exit_code={} signal={} duration={}ms", workspace_.c_str(),
               EngineName(engine), result.exit_code ? std::to_string(*result.exit_code) : "-",
               result.signal ? *result.signal : "-", result.duration_ms);
  return result;
}

std::future<ExecutionResult> Environment::ExecuteAsync(
    std::string command, std::vector<std::string> args, ExecuteOptions options) {
  return std::async(std::launch::async,
      [this, command = std::move(command), args = std::move(args), options = std::move(options)]() {
        return Execute(command, args, options);
      });
}

void Environment::Delete() {
  if (deleted_) return;
  deleted_ = true;
  if (workspace_.empty()) return;
  if (RemoveAll(workspace_)) {
    spdlog::debug("Deleted workspace {}", workspace_.c_str());
  }
}
