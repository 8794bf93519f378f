#ifndef INCLUDE_RUNBOX_ERRORS_H_
#define INCLUDE_RUNBOX_ERRORS_H_

#include <string>
#include <utility>
#include <stdexcept>

class RunboxError : public std::runtime_error {
 public:
  explicit RunboxError(const std::string& msg) : std::runtime_error(msg) {}
};

// Invalid input detected before any process or container exists
class ConfigurationError : public RunboxError {
 public:
  explicit ConfigurationError(const std::string& msg) : RunboxError(msg) {}
};

// Host-side compile step failed; nothing was executed
class CompilationError : public RunboxError {
 public:
  std::string compiler_stdout, compiler_stderr;

  CompilationError(const std::string& msg, std::string out, std::string err) :
      RunboxError(msg),
      compiler_stdout(std::move(out)),
      compiler_stderr(std::move(err)) {}
};

class TimeoutError : public RunboxError {
 public:
  long configured_timeout_ms;
  long actual_duration_ms;
  // output captured before termination
  std::string stdout_text, stderr_text;

  TimeoutError(const std::string& msg, long configured, long actual,
               std::string out = "", std::string err = "") :
      RunboxError(msg),
      configured_timeout_ms(configured),
      actual_duration_ms(actual),
      stdout_text(std::move(out)),
      stderr_text(std::move(err)) {}
};

// Infrastructure failure: spawn, image pull, container create/attach, daemon I/O
class RuntimeError : public RunboxError {
 public:
  std::string cause;
  std::string command; // attempted command line, may be empty
  std::string stdout_text, stderr_text;

  RuntimeError(const std::string& msg, std::string cause_, std::string command_ = "",
               std::string out = "", std::string err = "") :
      RunboxError(msg),
      cause(std::move(cause_)),
      command(std::move(command_)),
      stdout_text(std::move(out)),
      stderr_text(std::move(err)) {}
};

// Raised only when the runtime reports a memory kill explicitly
class MemoryLimitError : public RunboxError {
 public:
  long configured_limit_mb;
  std::string stdout_text, stderr_text;

  MemoryLimitError(const std::string& msg, long limit_mb,
                   std::string out = "", std::string err = "") :
      RunboxError(msg),
      configured_limit_mb(limit_mb),
      stdout_text(std::move(out)),
      stderr_text(std::move(err)) {}
};

#endif  // INCLUDE_RUNBOX_ERRORS_H_
