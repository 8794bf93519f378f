#include "utils.h"

#include <signal.h>
#include <cstring>
#include <fstream>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

const char kCapabilityAll[] = "ALL";

#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define ENUM_NAME_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define ENUM_PARSE_FUNCTION(DEF, typ, mac) \
  DEF(const std::string& str) { \
    mac \
    return std::nullopt; \
  }
#define X_PARSE(cls, x, y, ...) if (str == y) return cls::x;

#define X(...) X_RETURN_ARG2(Language, __VA_ARGS__)
ENUM_NAME_FUNCTION(const char* LanguageName, Language, ENUM_LANGUAGE_)
#undef X
#define X(...) X_PARSE(Language, __VA_ARGS__)
ENUM_PARSE_FUNCTION(std::optional<Language> GetLanguage, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG2(Backend, __VA_ARGS__)
ENUM_NAME_FUNCTION(const char* BackendName, Backend, ENUM_BACKEND_)
#undef X

std::optional<Backend> GetBackend(const std::string& str) {
#define X(...) X_PARSE(Backend, __VA_ARGS__)
  ENUM_BACKEND_
#undef X
  if (str == "docker") return Backend::CONTAINER;
  return std::nullopt;
}

#define X(...) X_RETURN_ARG2(PullPolicy, __VA_ARGS__)
ENUM_NAME_FUNCTION(const char* PullPolicyName, PullPolicy, ENUM_PULL_POLICY_)
#undef X
#define X(...) X_PARSE(PullPolicy, __VA_ARGS__)
ENUM_PARSE_FUNCTION(std::optional<PullPolicy> GetPullPolicy, PullPolicy, ENUM_PULL_POLICY_)
#undef X

#define X(...) X_RETURN_ARG2(MountMode, __VA_ARGS__)
ENUM_NAME_FUNCTION(const char* MountModeName, MountMode, ENUM_MOUNT_MODE_)
#undef X
#define X(...) X_PARSE(MountMode, __VA_ARGS__)
ENUM_PARSE_FUNCTION(std::optional<MountMode> GetMountMode, MountMode, ENUM_MOUNT_MODE_)
#undef X

#undef ENUM_NAME_FUNCTION
#undef ENUM_PARSE_FUNCTION
#undef X_RETURN_ARG2
#undef X_PARSE

#define ENUM_SIGNAL_ \
  X(SIGHUP) X(SIGINT) X(SIGQUIT) X(SIGILL) X(SIGTRAP) X(SIGABRT) X(SIGBUS) \
  X(SIGFPE) X(SIGKILL) X(SIGUSR1) X(SIGSEGV) X(SIGUSR2) X(SIGPIPE) X(SIGALRM) \
  X(SIGTERM) X(SIGCHLD) X(SIGCONT) X(SIGSTOP) X(SIGTSTP) X(SIGTTIN) X(SIGTTOU) \
  X(SIGURG) X(SIGXCPU) X(SIGXFSZ) X(SIGVTALRM) X(SIGPROF) X(SIGWINCH) X(SIGIO) \
  X(SIGSYS)

std::string SignalName(int signo) {
  switch (signo) {
#define X(name) case name: return #name;
    ENUM_SIGNAL_
#undef X
  }
  return "SIG" + std::to_string(signo);
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write file {} ({} bytes)", path.c_str(), content.size());
  std::error_code ec;
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.write(content.data(), content.size())) {
      spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permissions of {}: {}", path.c_str(), strerror(ec.value()));
    return false;
  }
  return true;
}

bool ReadFile(const fs::path& path, std::string& content) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) {
    spdlog::warn("Failed reading {}: {}", path.c_str(), strerror(errno));
    return false;
  }
  content.assign(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  return true;
}

bool SetPerms(const fs::path& path, fs::perms perms) {
  std::error_code ec;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permissions of {}: {}", path.c_str(), strerror(ec.value()));
    return false;
  }
  return true;
}

std::string FormatCommandLine(const std::string& executable, const std::vector<std::string>& args) {
  if (executable.empty()) return fmt::format("{}", fmt::join(args, " "));
  if (args.empty()) return executable;
  return fmt::format("{} {}", executable, fmt::join(args, " "));
}
