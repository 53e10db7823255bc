#ifndef EXECBOX_SANDBOX_H_
#define EXECBOX_SANDBOX_H_

#include <string>
#include <vector>

struct SandboxResult {
  std::string output, error;
  int status; // as reported by waitpid
  bool timed_out;
  // the stream produced more than output_limit bytes; the rest was discarded
  bool output_truncated, error_truncated;
  long wall_time; // us

  SandboxResult() :
      status(0), timed_out(false),
      output_truncated(false), error_truncated(false), wall_time(0) {}
};

class SandboxOptions {
 public:
  std::vector<std::string> command; // command[0] must be an absolute path
  std::vector<std::string> envs;
  std::string workdir;
  std::string input; // fed through a pipe, then closed
  long wall_time; // us; 0 for unlimited
  size_t output_limit; // bytes kept per stream; 0 for unlimited
  long drain_time; // us to keep reading after the process is gone

  SandboxOptions() :
      wall_time(0),
      output_limit(0),
      drain_time(1'000'000) {}
};

// The process runs in its own process group; on timeout the whole group is killed.
// Stray processes left in the group after the main process exits are killed as well.
// Throws ExecutionError if the process cannot be started.
SandboxResult SandboxExec(const SandboxOptions&);

#endif  // EXECBOX_SANDBOX_H_
