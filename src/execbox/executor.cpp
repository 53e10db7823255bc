#include <execbox/executor.h>

#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cctype>
#include <cstring>
#include <algorithm>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <execbox/paths.h>
#include "sandbox.h"
#include "utils.h"

extern char** environ;

namespace {

// bytes read past the cap so that TruncateUtf8 can find the sequence boundary
constexpr size_t kUtf8Lookahead = 4;
constexpr int kScriptAttempts = 16;

const std::vector<std::string> kCredentialMarkers = {
  "SECRET", "TOKEN", "PASSWORD", "PASSWD", "CREDENTIAL", "API_KEY", "ACCESS_KEY", "PRIVATE_KEY",
};

bool IsCredential(const std::string& name) {
  if (std::find(kScrubEnv.begin(), kScrubEnv.end(), name) != kScrubEnv.end()) return true;
  std::string upper = name;
  for (auto& c : upper) c = toupper((unsigned char)c);
  for (auto& marker : kCredentialMarkers) {
    if (upper.find(marker) != std::string::npos) return true;
  }
  return false;
}

class WorkDirectory { // RAII transient directory
  fs::path path_;
  bool remove_;
 public:
  const fs::path& Path() const { return path_; }
  explicit WorkDirectory(const ExecutionJob& job) : remove_(false) {
    if (job.workdir) {
      path_ = *job.workdir;
      return;
    }
    path_ = MakeTempDir(TransientDirTemplate());
    if (path_.empty()) throw ExecutionError("Failed to create working directory");
    remove_ = job.stateless;
  }
  ~WorkDirectory() {
    if (remove_) RemoveAll(path_);
  }
  WorkDirectory(const WorkDirectory&) = delete;
  WorkDirectory& operator=(const WorkDirectory&) = delete;
};

class ScriptFile { // RAII script, removed after every run
  fs::path path_;
 public:
  const fs::path& Path() const { return path_; }
  ScriptFile(const fs::path& workdir, const std::string& code) {
    int fd = -1;
    for (int i = 0; i < kScriptAttempts && fd < 0; i++) {
      path_ = ScriptPath(workdir, RandomHex(8));
      fd = open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
      if (fd < 0 && errno != EEXIST) break;
    }
    if (fd < 0) {
      throw ExecutionError(fmt::format("Failed to create script {}: {}", path_.c_str(), strerror(errno)));
    }
    for (size_t written = 0; written < code.size();) {
      ssize_t n = write(fd, code.data() + written, code.size() - written);
      if (n < 0) {
        if (errno == EINTR) continue;
        int err = errno;
        close(fd);
        unlink(path_.c_str());
        throw ExecutionError(fmt::format("Failed to write script {}: {}", path_.c_str(), strerror(err)));
      }
      written += n;
    }
    close(fd);
  }
  ~ScriptFile() {
    if (unlink(path_.c_str()) < 0 && errno != ENOENT) {
      spdlog::warn("Failed deleting {}: {}", path_.c_str(), strerror(errno));
    }
  }
  ScriptFile(const ScriptFile&) = delete;
  ScriptFile& operator=(const ScriptFile&) = delete;
};

} // namespace

std::vector<std::string> SandboxEnvironment(const fs::path& workdir) {
  static const std::vector<std::string> kOverridden = {
    "HOME", "MPLCONFIGDIR", "XDG_CONFIG_HOME", "XDG_CACHE_HOME", "PYTHONIOENCODING", "PYTHONPATH",
  };
  std::vector<std::string> ret;
  std::string pythonpath = workdir.string();
  for (char** env = environ; env && *env; env++) {
    std::string item = *env;
    size_t eq = item.find('=');
    if (eq == std::string::npos) continue;
    std::string name = item.substr(0, eq);
    if (name == "PYTHONPATH" && eq + 1 < item.size()) pythonpath += ":" + item.substr(eq + 1);
    if (IsCredential(name)) continue;
    if (std::find(kOverridden.begin(), kOverridden.end(), name) != kOverridden.end()) continue;
    ret.push_back(std::move(item));
  }
  for (const char* name : {"HOME", "MPLCONFIGDIR", "XDG_CONFIG_HOME", "XDG_CACHE_HOME"}) {
    ret.push_back(std::string(name) + "=" + workdir.string());
  }
  ret.push_back("PYTHONIOENCODING=utf-8");
  ret.push_back("PYTHONPATH=" + pythonpath);
  return ret;
}

bool TruncateUtf8(std::string& str, size_t limit) {
  if (str.size() <= limit) return false;
  size_t cut = limit;
  // step back over at most 3 continuation bytes to the start of the sequence
  for (int i = 0; i < 3 && cut > 0 && ((unsigned char)str[cut] & 0xC0) == 0x80; i++) cut--;
  if (((unsigned char)str[cut] & 0xC0) == 0x80) cut = limit; // not valid UTF-8 anyway
  str.resize(cut);
  return true;
}

std::string TruncationMarker(long limit) {
  return fmt::format("\n\n[TRUNCATED] Output exceeded {:g} MB limit.", limit / 1048576.0);
}

std::string TimeoutMarker(long timeout_ms) {
  return fmt::format("\nExecution timed out after {:g}s", timeout_ms / 1000.0);
}

ExecutionResult ProcessExecutor::Run(const ExecutionJob& job) {
  if (kInterpreter.empty() || !fs::path(kInterpreter[0]).is_absolute()) {
    throw ExecutionError("Interpreter command must start with an absolute path");
  }
  long timeout_ms = job.timeout_ms > 0 ? job.timeout_ms : kDefaultTimeoutMs;
  WorkDirectory workdir(job);
  ScriptFile script(workdir.Path(), job.code);

  SandboxOptions opt;
  opt.command = kInterpreter;
  opt.command.push_back(script.Path().string());
  opt.envs = SandboxEnvironment(workdir.Path());
  opt.workdir = workdir.Path().string();
  opt.input = job.input;
  opt.wall_time = timeout_ms * 1000;
  opt.output_limit = kMaxOutputBytes > 0 ? kMaxOutputBytes + kUtf8Lookahead : 0;
  SandboxResult res = SandboxExec(opt);

  ExecutionResult ret;
  ret.output = std::move(res.output);
  ret.error = std::move(res.error);
  ret.timed_out = res.timed_out;
  ret.wall_time = res.wall_time;
  if (kMaxOutputBytes > 0) {
    ret.output_truncated = TruncateUtf8(ret.output, kMaxOutputBytes) || res.output_truncated;
    ret.error_truncated = TruncateUtf8(ret.error, kMaxOutputBytes) || res.error_truncated;
    if (ret.output_truncated) ret.output += TruncationMarker(kMaxOutputBytes);
    if (ret.error_truncated) ret.error += TruncationMarker(kMaxOutputBytes);
  }
  if (ret.timed_out) {
    ret.error += TimeoutMarker(timeout_ms);
    ret.exit_code = kTimeoutExitCode;
  } else if (WIFSIGNALED(res.status)) {
    ret.signal = WTERMSIG(res.status);
    ret.exit_code = 128 + ret.signal;
  } else {
    ret.exit_code = WEXITSTATUS(res.status);
  }
  spdlog::debug("Executed {} in {}: exit_code={} wall_time={}us",
                script.Path().filename().c_str(), workdir.Path().c_str(), ret.exit_code, ret.wall_time);
  return ret;
}
