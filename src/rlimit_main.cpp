#include <errno.h>
#include <unistd.h>
#include <sys/resource.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "rlimit.h"

namespace {

bool ParseLimit(const char* str, long& value) {
  char* end = nullptr;
  errno = 0;
  value = strtol(str, &end, 10);
  return errno == 0 && end != str && *end == '\0' && value > 0;
}

void ApplyLimit(const char* name, int resource, rlim_t value) {
  struct rlimit lim = {value, value};
  if (setrlimit(resource, &lim) < 0) {
    fprintf(stderr, "runbox-rlimit: cannot set %s: %s\n", name, strerror(errno));
  }
}

} // namespace

int main() {
  const char* mem = getenv(kRlimitMemoryEnv);
  const char* proc = getenv(kRlimitProcessEnv);
  const char* raw_args = getenv(kRlimitArgsEnv);
  long value;
  if (mem && ParseLimit(mem, value)) ApplyLimit("RLIMIT_AS", RLIMIT_AS, (rlim_t)value * 1024 * 1024);
  if (proc && ParseLimit(proc, value)) ApplyLimit("RLIMIT_NPROC", RLIMIT_NPROC, (rlim_t)value);
  if (!raw_args) {
    fprintf(stderr, "runbox-rlimit: %s is not set\n", kRlimitArgsEnv);
    return kRlimitNoArgs;
  }

  auto json = nlohmann::json::parse(raw_args, nullptr, false);
  std::vector<std::string> args;
  if (json.is_array()) {
    for (auto& i : json) {
      if (!i.is_string()) {
        args.clear();
        break;
      }
      args.push_back(i.get<std::string>());
    }
  }
  if (args.empty()) {
    fprintf(stderr, "runbox-rlimit: %s must be a non-empty JSON array of strings\n", kRlimitArgsEnv);
    return kRlimitBadArgs;
  }

  // the interpreter must not see the wrapper's contract
  unsetenv(kRlimitMemoryEnv);
  unsetenv(kRlimitProcessEnv);
  unsetenv(kRlimitArgsEnv);

  std::vector<char*> argv;
  for (auto& i : args) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  execvp(argv[0], argv.data());
  int err = errno;
  fprintf(stderr, "runbox-rlimit: cannot execute %s: %s\n", argv[0], strerror(err));
  return err == ENOENT ? kRlimitNotFound : kRlimitExecFailed;
}
