#ifndef PROCESS_EXEC_H_
#define PROCESS_EXEC_H_

#include <string>
#include <optional>

#include "command.h"

struct ProcessOptions {
  long timeout_ms;
  std::optional<std::string> stdin_data;
  std::optional<int> uid, gid;

  ProcessOptions() : timeout_ms(0) {}
};

// time between SIGTERM and SIGKILL once the deadline passes
constexpr long kKillGraceMs = 500;

// Runs an ExplicitCommand as a host child process in its own process group.
// Throws TimeoutError after the deadline (with the partial output), and
// RuntimeError if the child could not be started.
// The first call sets SIGPIPE to SIG_IGN for the whole host process, so a
// child that closes stdin early surfaces as EPIPE on the write instead of
// killing the host. Children get the default disposition back before exec.
ExecutionResult ProcessExec(const PreparedCommand&, const ProcessOptions&);

#endif  // PROCESS_EXEC_H_
