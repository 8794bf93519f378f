#include "engines.h"

#include <cstdlib>
#include <cstring>

#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "paths.h"
#include "utils.h"
#include "rlimit.h"
#include "toolchain.h"
#include "process_exec.h"

const char* const kEnvAllowlist[] = {"PATH", "LANG", "TMPDIR", "HOME", "USER", nullptr};

namespace {

constexpr long kCompileTimeoutMs = 60000;

#if defined(__unix__) || defined(__APPLE__)
constexpr bool kUnixHost = true;
#else
constexpr bool kUnixHost = false;
#endif

std::string SearchPath(const EnvMap& env) {
  auto it = env.find("PATH");
  return it == env.end() ? std::string() : it->second;
}

std::string PickInterpreter(const std::string& command, const std::string& configured,
                            const char* fallback) {
  if (!command.empty()) return command;
  if (!configured.empty()) return configured;
  return fallback;
}

std::vector<std::string> ContainerArgs(const fs::path& workspace, const std::vector<std::string>& args) {
  std::vector<std::string> ret;
  ret.reserve(args.size());
  for (auto& i : args) ret.push_back(InsideContainer(workspace, i).string());
  return ret;
}

// the image's own entrypoint is used only when nothing points elsewhere
bool UseImageDefault(const Environment& environment, const std::string& command,
                     const std::string& configured) {
  return command.empty() && configured.empty() && environment.Files().empty();
}

bool IsTsSource(const fs::path& path) {
  auto ext = path.extension();
  return ext == ".ts" || ext == ".mts" || ext == ".cts";
}

fs::path ReadOutDir(const fs::path& config_path) {
  std::string content;
  if (!ReadFile(config_path, content)) return kTsDefaultOutDir;
  try {
    // tsconfig permits comments
    auto conf = nlohmann::json::parse(content, nullptr, true, true);
    if (conf.is_object() && conf.contains("compilerOptions")) {
      auto& opts = conf["compilerOptions"];
      if (opts.is_object() && opts.contains("outDir") && opts["outDir"].is_string()) {
        return fs::path(opts["outDir"].get<std::string>()).lexically_normal();
      }
    }
  } catch (nlohmann::json::exception& e) {
    spdlog::warn("Cannot parse {}, assuming outDir {}: {}", config_path.c_str(), kTsDefaultOutDir, e.what());
  }
  return kTsDefaultOutDir;
}

std::vector<std::string> CompiledArgs(Environment& environment, const fs::path& out_dir,
                                      const std::vector<std::string>& args) {
  size_t idx = TsEntrypointIndex(args);
  std::vector<std::string> ret = args;
  fs::path emitted = EmittedScriptPath(environment.Workspace(), out_dir, args[idx]);
  SetPerms(environment.Workspace() / emitted, kPerm755);
  ret[idx] = emitted.string();
  return ret;
}

} // namespace

EnvMap SanitizedEnv(const EnvMap& overrides) {
  EnvMap env;
  for (size_t i = 0; kEnvAllowlist[i]; i++) {
    const char* val = getenv(kEnvAllowlist[i]);
    if (val) env[kEnvAllowlist[i]] = val;
  }
  for (auto& i : overrides) env[i.first] = i.second;
  return env;
}

std::string FormatCommandLine(const CommandLine& command) {
  if (auto cmd = std::get_if<ExplicitCommand>(&command)) {
    return FormatCommandLine(cmd->executable, cmd->args);
  }
  auto& image_default = std::get<ImageDefaultCommand>(command);
  return FormatCommandLine("<image default>", image_default.args);
}

std::vector<std::string> NodeArgs(const RunOptions& opts, const std::vector<std::string>& args) {
  std::vector<std::string> ret;
  if (opts.memory_limit_mb) ret.push_back("--max-old-space-size=" + std::to_string(*opts.memory_limit_mb));
  ret.insert(ret.end(), args.begin(), args.end());
  return ret;
}

size_t TsEntrypointIndex(const std::vector<std::string>& args) {
  for (size_t i = 0; i < args.size(); i++) {
    if (IsTsSource(args[i])) return i;
  }
  throw ConfigurationError("TypeScript execution needs the entrypoint .ts file among the arguments");
}

fs::path EmittedScriptPath(const fs::path& workspace, const fs::path& out_dir, const fs::path& source) {
  fs::path rel = source.is_absolute() ? source.lexically_relative(workspace) : source;
  rel = rel.lexically_normal();
  auto ext = rel.extension();
  if (ext == ".mts") {
    rel.replace_extension(".mjs");
  } else if (ext == ".cts") {
    rel.replace_extension(".cjs");
  } else {
    rel.replace_extension(".js");
  }
  fs::path out = out_dir.is_absolute() ? out_dir.lexically_relative(workspace) : out_dir;
  return (out / rel).lexically_normal();
}

std::variant<fs::path, CompilationError> CompileTypeScript(Environment& environment, const RunOptions& opts) {
  const fs::path& workspace = environment.Workspace();
  const auto& lang = environment.Config().language_options;
  fs::path config_path = TsConfigPath(workspace);
  fs::path out_dir = kTsDefaultOutDir;

  std::error_code ec;
  if (fs::exists(config_path, ec)) {
    out_dir = ReadOutDir(config_path);
  } else {
    nlohmann::json conf = {
      {"compilerOptions", {
        {"target", "es2020"},
        {"module", "commonjs"},
        {"outDir", static_cast<const char*>(kTsDefaultOutDir)},
        {"rootDir", "."},
      }},
      {"include", {"**/*.ts"}},
    };
    if (!WriteFile(config_path, conf.dump(2))) {
      throw RuntimeError("Failed to write compiler configuration", strerror(errno), config_path.string());
    }
  }
  if (!CreateDirs(workspace / out_dir)) {
    throw RuntimeError("Failed to create compiler output directory", strerror(errno), (workspace / out_dir).string());
  }

  EnvMap env = SanitizedEnv(opts.env);
  std::string tsc = lang.tsc_path.empty() ? "tsc" : lang.tsc_path;
  std::vector<std::string> tsc_args = {"-p", config_path.string()};
  if (fs::path(tsc).filename() == "npx") tsc_args.insert(tsc_args.begin(), "tsc");
  PreparedCommand compile{
    ExplicitCommand{environment.Toolchain().ResolveOrName(tsc, SearchPath(env)), tsc_args},
    env, workspace};

  ProcessOptions popt;
  popt.timeout_ms = kCompileTimeoutMs;
  ExecutionResult res;
  try {
    res = ProcessExec(compile, popt);
  } catch (const RuntimeError& e) {
    return CompilationError("TypeScript compilation failed", "", "Failed to spawn tsc: " + e.cause);
  } catch (const TimeoutError& e) {
    return CompilationError("TypeScript compilation timed out", e.stdout_text, e.stderr_text);
  }
  if (res.exit_code != 0) {
    spdlog::info("TypeScript compilation failed in {}: {}", workspace.c_str(),
                 res.signal ? *res.signal : std::to_string(*res.exit_code));
    // tsc reports diagnostics on stdout
    std::string err = res.stderr_text.empty() ? res.stdout_text : res.stderr_text;
    return CompilationError("TypeScript compilation failed", res.stdout_text, err);
  }
  spdlog::info("TypeScript compilation successful: {}", workspace.c_str());
  return out_dir;
}

PrepareResult JavaScriptProcessEngine::Prepare(
    Environment& environment, const std::string& command,
    const std::vector<std::string>& args, const RunOptions& opts) const {
  EnvMap env = SanitizedEnv(opts.env);
  std::string node = PickInterpreter(command, environment.Config().language_options.node_path, "node");
  node = environment.Toolchain().ResolveOrName(node, SearchPath(env));
  return PreparedCommand{ExplicitCommand{node, NodeArgs(opts, args)}, env, environment.Workspace()};
}

PrepareResult JavaScriptContainerEngine::Prepare(
    Environment& environment, const std::string& command,
    const std::vector<std::string>& args, const RunOptions& opts) const {
  const auto& lang = environment.Config().language_options;
  // the image's own ENV stays in effect; only the caller's variables are added
  const EnvMap& env = opts.env;
  auto mapped = ContainerArgs(environment.Workspace(), args);
  if (UseImageDefault(environment, command, lang.node_path)) {
    return PreparedCommand{ImageDefaultCommand{mapped}, env, kContainerWorkspace};
  }
  std::string node = PickInterpreter(command, lang.node_path, "node");
  return PreparedCommand{ExplicitCommand{node, NodeArgs(opts, mapped)}, env, kContainerWorkspace};
}

PrepareResult TypeScriptProcessEngine::Prepare(
    Environment& environment, const std::string& command,
    const std::vector<std::string>& args, const RunOptions& opts) const {
  TsEntrypointIndex(args);
  auto compiled = CompileTypeScript(environment, opts);
  if (auto err = std::get_if<CompilationError>(&compiled)) return *err;
  auto new_args = CompiledArgs(environment, std::get<fs::path>(compiled), args);
  return JavaScriptProcessEngine().Prepare(environment, command, new_args, opts);
}

PrepareResult TypeScriptContainerEngine::Prepare(
    Environment& environment, const std::string& command,
    const std::vector<std::string>& args, const RunOptions& opts) const {
  TsEntrypointIndex(args);
  auto compiled = CompileTypeScript(environment, opts);
  if (auto err = std::get_if<CompilationError>(&compiled)) return *err;
  auto new_args = CompiledArgs(environment, std::get<fs::path>(compiled), args);
  return JavaScriptContainerEngine().Prepare(environment, command, new_args, opts);
}

PrepareResult PythonProcessEngine::Prepare(
    Environment& environment, const std::string& command,
    const std::vector<std::string>& args, const RunOptions& opts) const {
  const auto& lang = environment.Config().language_options;
  EnvMap env = SanitizedEnv(opts.env);
  std::string python = PickInterpreter(command, lang.python_path, "python3");
  python = environment.Toolchain().ResolveOrName(python, SearchPath(env));
  if (!kUnixHost || (!opts.memory_limit_mb && !lang.process_limit)) {
    return PreparedCommand{ExplicitCommand{python, args}, env, environment.Workspace()};
  }
  // runbox-rlimit applies the ceilings and then execs the interpreter
  nlohmann::json exec_args = nlohmann::json::array();
  exec_args.push_back(python);
  for (auto& i : args) exec_args.push_back(i);
  env[kRlimitArgsEnv] = exec_args.dump();
  if (opts.memory_limit_mb) env[kRlimitMemoryEnv] = std::to_string(*opts.memory_limit_mb);
  if (lang.process_limit) env[kRlimitProcessEnv] = std::to_string(*lang.process_limit);
  return PreparedCommand{ExplicitCommand{RlimitHelperPath().string(), {}}, env, environment.Workspace()};
}

PrepareResult PythonContainerEngine::Prepare(
    Environment& environment, const std::string& command,
    const std::vector<std::string>& args, const RunOptions& opts) const {
  const auto& lang = environment.Config().language_options;
  // the image's own ENV stays in effect; only the caller's variables are added
  const EnvMap& env = opts.env;
  auto mapped = ContainerArgs(environment.Workspace(), args);
  if (UseImageDefault(environment, command, lang.python_path)) {
    return PreparedCommand{ImageDefaultCommand{mapped}, env, kContainerWorkspace};
  }
  std::string python = PickInterpreter(command, lang.python_path, "python3");
  return PreparedCommand{ExplicitCommand{python, mapped}, env, kContainerWorkspace};
}

LanguageEngine SelectEngine(Language language, Backend backend) {
  bool container = backend == Backend::CONTAINER;
  switch (language) {
    case Language::JAVASCRIPT:
      if (container) return JavaScriptContainerEngine();
      return JavaScriptProcessEngine();
    case Language::TYPESCRIPT:
      if (container) return TypeScriptContainerEngine();
      return TypeScriptProcessEngine();
    case Language::PYTHON:
      if (container) return PythonContainerEngine();
      return PythonProcessEngine();
  }
  __builtin_unreachable();
}

const char* EngineName(const LanguageEngine& engine) {
  static const char* const kNames[] = {
    "javascript-process", "javascript-container",
    "typescript-process", "typescript-container",
    "python-process", "python-container",
  };
  return kNames[engine.index()];
}

PrepareResult PrepareCommand(const LanguageEngine& engine, Environment& environment,
                             const std::string& command, const std::vector<std::string>& args,
                             const RunOptions& opts) {
  spdlog::debug("Prepare with {}: command={} args={}", EngineName(engine), command, fmt::join(args, " "));
  return std::visit([&](const auto& e) { return e.Prepare(environment, command, args, opts); }, engine);
}
