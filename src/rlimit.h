#ifndef RLIMIT_H_
#define RLIMIT_H_

// Contract between the Python process engine and runbox-rlimit.
// The true command line travels as a JSON array of strings.
constexpr char kRlimitMemoryEnv[] = "RUNBOX_MEMORY_LIMIT_MB";
constexpr char kRlimitProcessEnv[] = "RUNBOX_PROCESS_LIMIT";
constexpr char kRlimitArgsEnv[] = "RUNBOX_EXEC_ARGS";

// runbox-rlimit exit statuses when it cannot hand off
constexpr int kRlimitNoArgs = 120;
constexpr int kRlimitBadArgs = 121;
constexpr int kRlimitExecFailed = 126;
constexpr int kRlimitNotFound = 127;

#endif  // RLIMIT_H_
