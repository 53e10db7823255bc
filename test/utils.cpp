#include "utils.h"

#include <fstream>
#include <sstream>

ExecutionResult FakeExecutor::Run(const ExecutionJob& job) {
  std::lock_guard lck(mtx_);
  jobs.push_back(job);
  if (fail) throw ExecutionError("spawn failed");
  return result;
}

size_t FakeExecutor::Calls() {
  std::lock_guard lck(mtx_);
  return jobs.size();
}

std::shared_ptr<Session> CountingSessionStore::GetOrCreate(const std::string& id) {
  get_or_create_calls++;
  return InMemorySessionStore::GetOrCreate(id);
}

void CountingSessionStore::RecordExecution(Session& session) {
  record_calls++;
  InMemorySessionStore::RecordExecution(session);
}

size_t CountEntries(const std::filesystem::path& dir) {
  std::error_code ec;
  size_t ret = 0;
  for (auto it = std::filesystem::directory_iterator(dir, ec);
       !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    ret++;
  }
  return ret;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream fin(path);
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

ExecutionResult RunCode(const std::string& code, const std::string& input, long timeout_ms) {
  ProcessExecutor executor;
  ExecutionJob job;
  job.code = code;
  job.input = input;
  job.timeout_ms = timeout_ms;
  return executor.Run(job);
}
