#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <mutex>
#include <gtest/gtest.h>
#include <execbox/service.h>

// Records jobs instead of running them
class FakeExecutor : public Executor {
  std::mutex mtx_;
 public:
  std::vector<ExecutionJob> jobs;
  ExecutionResult result;
  bool fail;

  FakeExecutor() : fail(false) {}
  ExecutionResult Run(const ExecutionJob& job) override;
  size_t Calls();
};

// Session store that counts every call
class CountingSessionStore : public InMemorySessionStore {
 public:
  int get_or_create_calls = 0;
  int record_calls = 0;

  using InMemorySessionStore::InMemorySessionStore;
  std::shared_ptr<Session> GetOrCreate(const std::string& id) override;
  void RecordExecution(Session& session) override;
};

// Count entries directly under dir
size_t CountEntries(const std::filesystem::path& dir);

std::string ReadFile(const std::filesystem::path& path);

// Run code through a fresh ProcessExecutor in a transient directory
ExecutionResult RunCode(const std::string& code, const std::string& input = "", long timeout_ms = 10'000);

#endif // TEST_UTILS_H_
