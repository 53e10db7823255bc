#include "sandbox.h"

#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <mutex>
#include <chrono>
#include <cstring>
#include <optional>
#include <algorithm>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <execbox/executor.h>
#include "utils.h"

namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t kReadChunk = 65536;
constexpr long kPollSliceMs = 50;
// exec failures are reported to the parent through this descriptor (close-on-exec)
constexpr int kReportFd = 3;

std::once_flag sigpipe_once;

inline void CloseFd(int& fd) {
  if (fd >= 0) close(fd);
  fd = -1;
}

inline void KillGroup(pid_t pid) {
  if (killpg(pid, SIGKILL) < 0 && errno != ESRCH) {
    spdlog::warn("Failed killing process group {}: {}", pid, strerror(errno));
  }
}

// false on EOF or error; bytes beyond limit are read and dropped
bool ReadChunk(int fd, std::string& buf, size_t limit, bool& truncated) {
  char chunk[kReadChunk];
  ssize_t n = read(fd, chunk, sizeof(chunk));
  if (n < 0) return errno == EINTR || errno == EAGAIN;
  if (n == 0) return false;
  size_t keep = n;
  if (limit && buf.size() + keep > limit) {
    keep = limit - buf.size();
    truncated = true;
  }
  buf.append(chunk, keep);
  return true;
}

// runs in the forked child: async-signal-safe calls only
[[noreturn]] void ExecChild(const SandboxOptions& opt, char* const* argv, char* const* envp,
                            int in_fd, int out_fd, int err_fd, int report_fd) {
  int err;
  sigset_t set;
  struct sigaction act{};
  setpgid(0, 0);
  // the mask and ignored dispositions survive execve
  sigemptyset(&set);
  sigprocmask(SIG_SETMASK, &set, nullptr);
  act.sa_handler = SIG_DFL;
  sigaction(SIGPIPE, &act, nullptr);
  if (dup2(in_fd, 0) < 0 || dup2(out_fd, 1) < 0 || dup2(err_fd, 2) < 0) goto err;
  if (dup2(report_fd, kReportFd) < 0 || fcntl(kReportFd, F_SETFD, FD_CLOEXEC) < 0) goto err;
  if (CloseFrom(kReportFd + 1) < 0) goto err;
  if (chdir(opt.workdir.c_str()) < 0) goto err;
  execve(argv[0], argv, envp);
err:
  err = errno;
  IGNORE_RETURN(write(kReportFd, &err, sizeof(err)));
  _exit(127);
}

} // namespace

SandboxResult SandboxExec(const SandboxOptions& opt) {
  // a child closing its stdin early must not kill the harness
  std::call_once(sigpipe_once, []() { signal(SIGPIPE, SIG_IGN); });
  if (opt.command.empty()) throw ExecutionError("Empty command");

  // prepared before fork; the child may not allocate
  std::vector<char*> argv, envp;
  for (auto& i : opt.command) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  for (auto& i : opt.envs) envp.push_back(const_cast<char*>(i.c_str()));
  envp.push_back(nullptr);

  int inpipe[2] = {-1, -1}, outpipe[2] = {-1, -1}, errpipe[2] = {-1, -1}, reportpipe[2] = {-1, -1};
  auto CloseAll = [&]() {
    for (int* p : {inpipe, outpipe, errpipe, reportpipe}) {
      CloseFd(p[0]);
      CloseFd(p[1]);
    }
  };
  if (pipe2(inpipe, O_CLOEXEC) < 0 || pipe2(outpipe, O_CLOEXEC) < 0 ||
      pipe2(errpipe, O_CLOEXEC) < 0 || pipe2(reportpipe, O_CLOEXEC) < 0) {
    int err = errno;
    CloseAll();
    throw ExecutionError(fmt::format("Failed creating pipes: {}", strerror(err)));
  }

  spdlog::debug("SandboxExec command={} workdir={}", fmt::format("{}", opt.command), opt.workdir);
  auto start = Clock::now();
  pid_t pid = fork();
  if (pid < 0) {
    int err = errno;
    CloseAll();
    throw ExecutionError(fmt::format("Failed forking: {}", strerror(err)));
  }
  if (pid == 0) {
    ExecChild(opt, argv.data(), envp.data(), inpipe[0], outpipe[1], errpipe[1], reportpipe[1]);
  }
  setpgid(pid, pid); // may lose the race against execve; the child sets it as well
  CloseFd(inpipe[0]);
  CloseFd(outpipe[1]);
  CloseFd(errpipe[1]);
  CloseFd(reportpipe[1]);
  {
    int err = 0;
    ssize_t n;
    do {
      n = read(reportpipe[0], &err, sizeof(err));
    } while (n < 0 && errno == EINTR);
    CloseFd(reportpipe[0]);
    if (n == sizeof(err)) {
      while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR);
      CloseAll();
      throw ExecutionError(fmt::format("Failed executing {}: {}", opt.command[0], strerror(err)));
    }
  }

  SandboxResult ret;
  int& in_fd = inpipe[1];
  int& out_fd = outpipe[0];
  int& err_fd = errpipe[0];
  size_t written = 0;
  bool exited = false;
  std::optional<Clock::time_point> drain_until;
  auto deadline = start + std::chrono::microseconds(opt.wall_time);

  auto Abort = [&](const char* what) {
    int err = errno;
    if (!exited) {
      KillGroup(pid);
      while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR);
    }
    CloseAll();
    throw ExecutionError(fmt::format("{}: {}", what, strerror(err)));
  };

  if (opt.input.empty()) {
    CloseFd(in_fd);
  } else if (fcntl(in_fd, F_SETFL, O_NONBLOCK) < 0) {
    Abort("Failed setting up stdin");
  }

  while (true) {
    auto now = Clock::now();
    if (!exited) {
      siginfo_t info{};
      int r;
      // WNOWAIT keeps the leader a zombie, so the group id cannot be reused before killpg
      do {
        r = waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT);
      } while (r < 0 && errno == EINTR);
      if (r < 0) Abort("waitid failed");
      if (info.si_pid == pid) {
        // leftovers of the group may still hold the pipes open
        KillGroup(pid);
        while (waitpid(pid, &ret.status, 0) < 0 && errno == EINTR);
        exited = true;
        CloseFd(in_fd);
        drain_until = now + std::chrono::microseconds(opt.drain_time);
      }
    }
    if (!exited && opt.wall_time > 0 && now >= deadline) {
      spdlog::info("Process {} exceeded {} us, killing its process group", pid, opt.wall_time);
      ret.timed_out = true;
      KillGroup(pid);
      while (waitpid(pid, &ret.status, 0) < 0 && errno == EINTR);
      exited = true;
      CloseFd(in_fd);
      drain_until = now + std::chrono::microseconds(opt.drain_time);
    }
    if (exited && ((out_fd < 0 && err_fd < 0) || now >= *drain_until)) break;

    long slice = kPollSliceMs;
    if (!exited && opt.wall_time > 0) {
      long remain = std::chrono::ceil<std::chrono::milliseconds>(deadline - now).count();
      slice = std::clamp(remain, 0L, slice);
    }
    struct pollfd fds[3];
    int nfds = 0, in_idx = -1, out_idx = -1, err_idx = -1;
    if (in_fd >= 0) fds[in_idx = nfds++] = {in_fd, POLLOUT, 0};
    if (out_fd >= 0) fds[out_idx = nfds++] = {out_fd, POLLIN, 0};
    if (err_fd >= 0) fds[err_idx = nfds++] = {err_fd, POLLIN, 0};
    if (poll(fds, nfds, slice) < 0) {
      if (errno == EINTR) continue;
      Abort("poll failed");
    }
    if (in_idx >= 0 && fds[in_idx].revents) {
      if (fds[in_idx].revents & (POLLERR | POLLHUP)) {
        CloseFd(in_fd); // reader is gone
      } else {
        ssize_t n = write(in_fd, opt.input.data() + written, opt.input.size() - written);
        if (n > 0) written += n;
        if ((n < 0 && errno != EAGAIN && errno != EINTR) || written == opt.input.size()) {
          CloseFd(in_fd);
        }
      }
    }
    if (out_idx >= 0 && fds[out_idx].revents &&
        !ReadChunk(out_fd, ret.output, opt.output_limit, ret.output_truncated)) {
      CloseFd(out_fd);
    }
    if (err_idx >= 0 && fds[err_idx].revents &&
        !ReadChunk(err_fd, ret.error, opt.output_limit, ret.error_truncated)) {
      CloseFd(err_fd);
    }
  }
  CloseAll();
  ret.wall_time = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count();
  spdlog::debug("SandboxExec pid={} status={} timed_out={} wall_time={}us",
                pid, ret.status, ret.timed_out, ret.wall_time);
  return ret;
}
