#include "process_exec.h"

#include <grp.h>
#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>

#include <mutex>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>

#include <spdlog/spdlog.h>

#include "utils.h"

extern char** environ;

namespace {

constexpr long kPollIntervalMs = 10;
constexpr size_t kReadBufferSize = 65536;

#define ENUM_SPAWN_STAGE_ \
  X(CHDIR, "chdir") \
  X(SETGID, "setgid") \
  X(SETUID, "setuid") \
  X(EXEC, "exec")
enum class SpawnStage {
#define X(name, str) name,
  ENUM_SPAWN_STAGE_
#undef X
};

const char* SpawnStageName(SpawnStage stage) {
  switch (stage) {
#define X(name, str) case SpawnStage::name: return str;
    ENUM_SPAWN_STAGE_
#undef X
  }
  __builtin_unreachable();
}

// reported by the child over the status pipe when it fails before exec
struct SpawnFailure {
  SpawnStage stage;
  int err;
};

class Pipe {
 public:
  int fd[2] = {-1, -1};

  ~Pipe() {
    CloseRead();
    CloseWrite();
  }
  bool Open() { return pipe2(fd, O_CLOEXEC) == 0; }
  void CloseRead() {
    if (fd[0] >= 0) close(fd[0]);
    fd[0] = -1;
  }
  void CloseWrite() {
    if (fd[1] >= 0) close(fd[1]);
    fd[1] = -1;
  }
};

void IgnoreSigpipe() {
  static std::once_flag flag;
  std::call_once(flag, []() { signal(SIGPIPE, SIG_IGN); });
}

bool SetNonBlock(int fd) {
  int flags = fcntl(fd, F_GETFL);
  return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) >= 0;
}

[[noreturn]] void ChildFail(int status_fd, SpawnStage stage) {
  SpawnFailure failure{stage, errno};
  IGNORE_RETURN(write(status_fd, &failure, sizeof(failure)));
  _exit(127);
}

// false on EOF or a read error
bool DrainFd(int fd, std::string& buf) {
  char tmp[kReadBufferSize];
  while (true) {
    ssize_t n = read(fd, tmp, sizeof(tmp));
    if (n > 0) {
      buf.append(tmp, n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
    return false;
  }
}

void SignalGroup(pid_t pid, int signo) {
  if (kill(-pid, signo) < 0 && kill(pid, signo) < 0 && errno != ESRCH) {
    spdlog::warn("Failed sending {} to pid {}: {}", SignalName(signo), pid, strerror(errno));
  }
}

} // namespace

ExecutionResult ProcessExec(const PreparedCommand& prepared, const ProcessOptions& opt) {
  auto cmd = std::get_if<ExplicitCommand>(&prepared.command);
  if (!cmd) throw ConfigurationError("The process backend needs an explicit command to run");
  std::string cmdline = FormatCommandLine(prepared.command);
  IgnoreSigpipe();

  // everything the child touches is built before fork
  std::vector<std::string> env_strs;
  for (auto& i : prepared.env) env_strs.push_back(i.first + '=' + i.second);
  std::vector<char*> envp, argv;
  for (auto& i : env_strs) envp.push_back(const_cast<char*>(i.c_str()));
  envp.push_back(nullptr);
  argv.push_back(const_cast<char*>(cmd->executable.c_str()));
  for (auto& i : cmd->args) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  std::string workdir = prepared.workdir.string();

  Pipe in, out, err, status;
  if (!in.Open() || !out.Open() || !err.Open() || !status.Open()) {
    throw RuntimeError("Failed to spawn process", strerror(errno), cmdline);
  }

  auto start = std::chrono::steady_clock::now();
  pid_t pid = fork();
  if (pid < 0) throw RuntimeError("Failed to spawn process", strerror(errno), cmdline);
  if (pid == 0) {
    setpgid(0, 0);
    signal(SIGPIPE, SIG_DFL);
    dup2(in.fd[0], 0);
    dup2(out.fd[1], 1);
    dup2(err.fd[1], 2);
    if (chdir(workdir.c_str()) < 0) ChildFail(status.fd[1], SpawnStage::CHDIR);
    if (opt.gid && (setgroups(0, nullptr) < 0 || setgid(*opt.gid) < 0)) {
      ChildFail(status.fd[1], SpawnStage::SETGID);
    }
    if (opt.uid && setuid(*opt.uid) < 0) ChildFail(status.fd[1], SpawnStage::SETUID);
    environ = envp.data();
    execvp(argv[0], argv.data());
    ChildFail(status.fd[1], SpawnStage::EXEC);
  }
  setpgid(pid, pid);
  spdlog::debug("ProcessExec pid={} workdir={} command={}", pid, workdir, cmdline);
  in.CloseRead();
  out.CloseWrite();
  err.CloseWrite();
  status.CloseWrite();

  {
    // the status pipe closes on a successful exec
    SpawnFailure failure;
    ssize_t n;
    do {
      n = read(status.fd[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    if (n == (ssize_t)sizeof(failure)) {
      waitpid(pid, nullptr, 0);
      throw RuntimeError("Failed to spawn process",
          fmt::format("{}: {}", SpawnStageName(failure.stage), strerror(failure.err)), cmdline);
    }
  }

  const std::string stdin_data = opt.stdin_data ? *opt.stdin_data : std::string();
  size_t stdin_off = 0;
  if (stdin_data.empty() || !SetNonBlock(in.fd[1])) in.CloseWrite();
  if (!SetNonBlock(out.fd[0]) || !SetNonBlock(err.fd[0])) {
    spdlog::warn("Failed setting output pipes non-blocking: {}", strerror(errno));
  }

  ExecutionResult result;
  auto deadline = start + std::chrono::milliseconds(opt.timeout_ms);
  auto kill_at = deadline + std::chrono::milliseconds(kKillGraceMs);
  bool exited = false, timed_out = false, killed = false;
  int wstatus = 0;
  while (true) {
    pid_t waited = waitpid(pid, &wstatus, WNOHANG);
    if (waited == pid) {
      exited = true;
    } else if (waited < 0 && errno != EINTR) {
      spdlog::warn("waitpid {} failed: {}", pid, strerror(errno));
      exited = true;
    }
    if (exited) {
      // whatever the child wrote is in the pipe buffers by now
      if (out.fd[0] >= 0) DrainFd(out.fd[0], result.stdout_text);
      if (err.fd[0] >= 0) DrainFd(err.fd[0], result.stderr_text);
      break;
    }

    auto now = std::chrono::steady_clock::now();
    if (!timed_out && now >= deadline) {
      timed_out = true;
      spdlog::debug("pid {} exceeded {} ms, terminating", pid, opt.timeout_ms);
      SignalGroup(pid, SIGTERM);
    }
    if (timed_out && !killed && now >= kill_at) {
      killed = true;
      SignalGroup(pid, SIGKILL);
    }

    struct pollfd fds[3];
    int nfds = 0;
    if (out.fd[0] >= 0) fds[nfds++] = {out.fd[0], POLLIN, 0};
    if (err.fd[0] >= 0) fds[nfds++] = {err.fd[0], POLLIN, 0};
    if (in.fd[1] >= 0) fds[nfds++] = {in.fd[1], POLLOUT, 0};
    long wait_ms = kPollIntervalMs;
    if (!timed_out) {
      long left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
      wait_ms = std::max(0L, std::min(wait_ms, left));
    }
    if (poll(fds, nfds, wait_ms) < 0 && errno != EINTR) {
      spdlog::warn("poll failed: {}", strerror(errno));
    }

    if (out.fd[0] >= 0 && !DrainFd(out.fd[0], result.stdout_text)) out.CloseRead();
    if (err.fd[0] >= 0 && !DrainFd(err.fd[0], result.stderr_text)) err.CloseRead();
    if (in.fd[1] >= 0) {
      ssize_t n = write(in.fd[1], stdin_data.data() + stdin_off, stdin_data.size() - stdin_off);
      if (n > 0) stdin_off += n;
      if (stdin_off == stdin_data.size()) {
        in.CloseWrite();
      } else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
        // EPIPE: the child stopped reading
        spdlog::debug("stdin of pid {} closed early: {}", pid, strerror(errno));
        in.CloseWrite();
      }
    }
  }
  result.duration_ms = ElapsedMs(start);

  if (timed_out) {
    throw TimeoutError(fmt::format("Execution timed out after {} ms", opt.timeout_ms),
        opt.timeout_ms, result.duration_ms,
        std::move(result.stdout_text), std::move(result.stderr_text));
  }
  if (WIFEXITED(wstatus)) {
    result.exit_code = WEXITSTATUS(wstatus);
  } else if (WIFSIGNALED(wstatus)) {
    result.signal = SignalName(WTERMSIG(wstatus));
  }
  spdlog::debug("pid {} finished in {} ms: exit_code={} signal={}", pid, result.duration_ms,
                result.exit_code ? std::to_string(*result.exit_code) : "-",
                result.signal ? *result.signal : "-");
  return result;
}
