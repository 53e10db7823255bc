#ifndef INCLUDE_EXECBOX_EXECUTOR_H_
#define INCLUDE_EXECBOX_EXECUTOR_H_

#include <string>
#include <cstdint>
#include <vector>
#include <optional>
#include <stdexcept>
#include <filesystem>

// Harness-level fault; fatal to one request only
class ExecutionError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Distinct from any status a process can exit with (0-255)
constexpr int kTimeoutExitCode = -1;

struct ExecutionJob {
  std::string code;
  std::string input;
  long timeout_ms;
  // a transient directory is created if empty
  std::optional<std::filesystem::path> workdir;
  // remove the transient directory afterwards
  bool stateless;

  ExecutionJob() : timeout_ms(0), stateless(true) {}
};

struct ExecutionResult {
  std::string output, error;
  int exit_code;
  int signal; // 0 if not terminated by a signal
  bool timed_out;
  bool output_truncated, error_truncated;
  int64_t wall_time; // us

  ExecutionResult() :
      exit_code(0), signal(0), timed_out(false),
      output_truncated(false), error_truncated(false), wall_time(0) {}
};

class Executor {
 public:
  virtual ~Executor() = default;
  // throws ExecutionError on harness faults
  virtual ExecutionResult Run(const ExecutionJob&) = 0;
};

// One interpreter process per job
class ProcessExecutor : public Executor {
 public:
  ExecutionResult Run(const ExecutionJob&) override;
};

// Environment of the interpreter process: the harness environment without credentials,
//   with home/config variables and the module search path pointing at workdir
std::vector<std::string> SandboxEnvironment(const std::filesystem::path& workdir);

// Cut str to at most limit bytes without splitting a UTF-8 sequence at the cut;
//   return true if anything was removed
bool TruncateUtf8(std::string& str, size_t limit);
std::string TruncationMarker(long limit);
std::string TimeoutMarker(long timeout_ms);

#endif  // INCLUDE_EXECBOX_EXECUTOR_H_
