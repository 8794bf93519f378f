#include <cstdio>
#include <fstream>
#include <sstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <runbox/paths.h>
#include <runbox/utils.h>
#include <runbox/errors.h>
#include <runbox/logger.h>
#include <runbox/environment.h>

namespace {

constexpr char kDefaultConfig[] = "/etc/runbox.conf";
constexpr int kExitTimeout = 124;
constexpr int kExitFailure = 1;
constexpr int kExitConfiguration = 2;

struct CliOptions {
  EnvironmentConfig config;
  std::vector<std::string> files;
  std::string command;
  std::vector<std::string> args;
  bool keep_workspace = false;
};

std::optional<long> ParseLong(const std::string& key, const std::string& str) {
  if (str.empty()) return std::nullopt;
  size_t pos = 0;
  long ret = 0;
  try {
    ret = std::stol(str, &pos);
  } catch (const std::logic_error&) {
    pos = 0;
  }
  if (pos != str.size()) throw ConfigurationError(fmt::format("{}: not a number: {}", key, str));
  return ret;
}

std::optional<bool> ParseBool(const std::string& key, const std::string& str) {
  if (str.empty()) return std::nullopt;
  if (str == "1" || str == "true" || str == "yes" || str == "on") return true;
  if (str == "0" || str == "false" || str == "no" || str == "off") return false;
  throw ConfigurationError(fmt::format("{}: not a boolean: {}", key, str));
}

std::vector<std::string> SplitList(const std::string& str) {
  std::vector<std::string> ret;
  std::istringstream ss(str);
  for (std::string item; std::getline(ss, item, ',');) {
    item.erase(0, item.find_first_not_of(" \t"));
    item.erase(item.find_last_not_of(" \t") + 1);
    if (item.size()) ret.push_back(item);
  }
  return ret;
}

#define READ_OPTIONAL(parse, sec, key, dest) \
  if (auto val = parse(key, ini[sec][key] | "")) dest = *val;

bool ParseConfig(const fs::path& conf_path, EnvironmentConfig& config) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  auto& lang = config.language_options;
  auto& policy = config.security_policy;

  std::string language = ini[""]["language"] | "";
  if (language.size()) {
    auto val = GetLanguage(language);
    if (!val) throw ConfigurationError("Unsupported language " + language);
    config.language = *val;
  }
  std::string backend = ini[""]["backend"] | "";
  if (backend.size()) {
    auto val = GetBackend(backend);
    if (!val) throw ConfigurationError("Unsupported backend " + backend);
    config.backend = *val;
  }
  READ_OPTIONAL(ParseLong, "", "timeout_ms", config.timeout_ms);
  READ_OPTIONAL(ParseLong, "", "memory_limit_mb", config.memory_limit_mb);
  READ_OPTIONAL(ParseLong, "", "process_limit", lang.process_limit);
  READ_OPTIONAL(ParseLong, "", "uid", lang.uid);
  READ_OPTIONAL(ParseLong, "", "gid", lang.gid);
  lang.python_path = ini[""]["python_path"] | lang.python_path;
  lang.node_path = ini[""]["node_path"] | lang.node_path;
  lang.tsc_path = ini[""]["tsc_path"] | lang.tsc_path;
  config.docker_socket = ini[""]["docker_socket"] | config.docker_socket;

  policy.image = ini["container"]["image"] | policy.image;
  std::string pull_policy = ini["container"]["pull_policy"] | "";
  if (pull_policy.size()) {
    auto val = GetPullPolicy(pull_policy);
    if (!val) throw ConfigurationError("Unknown pull policy " + pull_policy);
    policy.pull_policy = *val;
  }
  policy.network_mode = ini["container"]["network_mode"] | policy.network_mode;
  std::string mount_mode = ini["container"]["workspace_mount_mode"] | "";
  if (mount_mode.size()) {
    auto val = GetMountMode(mount_mode);
    if (!val) throw ConfigurationError("Unknown workspace mount mode " + mount_mode);
    policy.workspace_mount_mode = *val;
  }
  READ_OPTIONAL(ParseLong, "container", "cpu_shares", policy.cpu_shares);
  READ_OPTIONAL(ParseLong, "container", "cpu_period", policy.cpu_period);
  READ_OPTIONAL(ParseLong, "container", "cpu_quota", policy.cpu_quota);
  READ_OPTIONAL(ParseLong, "container", "pids_limit", policy.pids_limit);
  READ_OPTIONAL(ParseBool, "container", "no_new_privileges", policy.no_new_privileges);
  READ_OPTIONAL(ParseBool, "container", "readonly_rootfs", policy.readonly_rootfs);
  READ_OPTIONAL(ParseBool, "container", "preserve", lang.preserve_container);
  policy.cap_drop = SplitList(ini["container"]["cap_drop"] | "");
  policy.cap_add = SplitList(ini["container"]["cap_add"] | "");
  return true;
}

#undef READ_OPTIONAL

std::string ReadStdinSource(const std::string& path) {
  std::istream* in = &std::cin;
  std::ifstream fin;
  if (path != "-") {
    fin.open(path, std::ios::binary);
    if (!fin) throw ConfigurationError("Cannot open stdin file " + path);
    in = &fin;
  }
  std::ostringstream ss;
  ss << in->rdbuf();
  return ss.str();
}

CliOptions ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "runbox");
  parser.add_argument("-c", "--config")
    .default_value(std::string(kDefaultConfig))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-l", "--language")
    .help("javascript, typescript or python");
  parser.add_argument("-b", "--backend")
    .help("process or container");
  parser.add_argument("-i", "--image")
    .help("Container image");
  parser.add_argument("-t", "--timeout")
    .scan<'d', long>()
    .help("Timeout in milliseconds");
  parser.add_argument("-m", "--memory")
    .scan<'d', long>()
    .help("Memory limit in MB");
  parser.add_argument("-f", "--file")
    .append().default_value(std::vector<std::string>{})
    .help("Host file to stage into the workspace under its file name");
  parser.add_argument("-e", "--env")
    .append().default_value(std::vector<std::string>{})
    .help("KEY=VALUE passed to the program");
  parser.add_argument("--stdin")
    .help("File fed to the program's standard input (- for our own)");
  parser.add_argument("--keep-workspace")
    .default_value(false)
    .implicit_value(true)
    .help("Do not delete the workspace afterwards");
  parser.add_argument("command")
    .help("Interpreter to run; empty string for the language default");
  parser.add_argument("args")
    .remaining()
    .help("Arguments passed to the interpreter");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(kExitConfiguration);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }

  CliOptions opts;
  EnvironmentConfig& config = opts.config;
  std::string config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file, config) && config_file != kDefaultConfig) {
    throw ConfigurationError("Failed to read configuration file " + config_file);
  }
  if (auto val = parser.present("--language")) {
    auto language = GetLanguage(*val);
    if (!language) throw ConfigurationError("Unsupported language " + *val);
    config.language = *language;
  }
  if (auto val = parser.present("--backend")) {
    auto backend = GetBackend(*val);
    if (!backend) throw ConfigurationError("Unsupported backend " + *val);
    config.backend = *backend;
  }
  if (auto val = parser.present("--image")) config.security_policy.image = *val;
  if (auto val = parser.present<long>("--timeout")) config.timeout_ms = *val;
  if (auto val = parser.present<long>("--memory")) config.memory_limit_mb = *val;
  for (auto& i : parser.get<std::vector<std::string>>("--env")) {
    size_t eq = i.find('=');
    if (eq == std::string::npos || eq == 0) throw ConfigurationError("Expected KEY=VALUE, got " + i);
    config.env[i.substr(0, eq)] = i.substr(eq + 1);
  }
  if (auto val = parser.present("--stdin")) config.stdin_data = ReadStdinSource(*val);
  opts.files = parser.get<std::vector<std::string>>("--file");
  opts.keep_workspace = parser["--keep-workspace"] == true;
  opts.command = parser.get<std::string>("command");
  if (auto val = parser.present<std::vector<std::string>>("args")) opts.args = *val;
  return opts;
}

int Run(CliOptions& opts) {
  Environment env = Environment::Create(opts.config);
  int ret = kExitFailure;
  try {
    for (auto& i : opts.files) {
      std::ifstream fin(i, std::ios::binary);
      if (!fin) throw ConfigurationError("Cannot read " + i);
      std::ostringstream ss;
      ss << fin.rdbuf();
      env.AddFile(fs::path(i).filename(), ss.str());
    }
    ExecutionResult res = env.Execute(opts.command, opts.args);
    fwrite(res.stdout_text.data(), 1, res.stdout_text.size(), stdout);
    fwrite(res.stderr_text.data(), 1, res.stderr_text.size(), stderr);
    if (res.signal) {
      spdlog::error("Program terminated by {}", *res.signal);
    } else if (res.exit_code) {
      ret = *res.exit_code;
    }
  } catch (const TimeoutError& e) {
    fwrite(e.stdout_text.data(), 1, e.stdout_text.size(), stdout);
    fwrite(e.stderr_text.data(), 1, e.stderr_text.size(), stderr);
    spdlog::error("{}", e.what());
    ret = kExitTimeout;
  } catch (const CompilationError& e) {
    fwrite(e.compiler_stdout.data(), 1, e.compiler_stdout.size(), stdout);
    fwrite(e.compiler_stderr.data(), 1, e.compiler_stderr.size(), stderr);
    spdlog::error("{}", e.what());
  } catch (const RuntimeError& e) {
    spdlog::error("{}: {} ({})", e.what(), e.cause, e.command);
  } catch (const MemoryLimitError& e) {
    fwrite(e.stdout_text.data(), 1, e.stdout_text.size(), stdout);
    fwrite(e.stderr_text.data(), 1, e.stderr_text.size(), stderr);
    spdlog::error("{}", e.what());
  } catch (const ConfigurationError& e) {
    spdlog::error("{}", e.what());
    ret = kExitConfiguration;
  }
  if (opts.keep_workspace) {
    spdlog::warn("Workspace kept at {}", env.Workspace().c_str());
  } else {
    env.Delete();
  }
  return ret;
}

} // namespace

int main(int argc, char** argv) {
  InitLogger();
  try {
    CliOptions opts = ParseArgs(argc, argv);
    return Run(opts);
  } catch (const ConfigurationError& e) {
    spdlog::error("{}", e.what());
    return kExitConfiguration;
  } catch (const RuntimeError& e) {
    spdlog::error("{}: {}", e.what(), e.cause);
    return kExitFailure;
  }
}
