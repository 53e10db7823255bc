#ifndef INCLUDE_EXECBOX_SESSION_H_
#define INCLUDE_EXECBOX_SESSION_H_

#include <mutex>
#include <atomic>
#include <memory>
#include <string>
#include <cstdint>
#include <vector>
#include <filesystem>
#include <unordered_map>

// Only files written into workdir persist between executions of a session;
//   every execution runs in a fresh interpreter process.
struct Session {
  std::string id;
  std::filesystem::path workdir;
  int64_t created_at; // UNIX timestamp, microseconds
  long seq; // creation order within the store
  std::atomic<int> cell_count;

  Session() : created_at(0), seq(0), cell_count(0) {}
};

struct SessionView {
  std::string id;
  int64_t created_at;
  int cell_count;
};

class SessionStore {
 public:
  virtual ~SessionStore() = default;

  // create the session and its directory on first reference
  virtual std::shared_ptr<Session> GetOrCreate(const std::string& id) = 0;
  // no-op for unknown ids
  virtual void Delete(const std::string& id) = 0;
  // ordered by creation
  virtual std::vector<SessionView> List() const = 0;
  virtual size_t Size() const = 0;
  // delete every session; called on shutdown
  virtual void Clear() = 0;

  virtual void RecordExecution(Session& session) { session.cell_count++; }
  // new session with a random id
  std::shared_ptr<Session> Create();
};

class InMemorySessionStore : public SessionStore {
  mutable std::mutex mtx_;
  std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
  std::filesystem::path root_;
  long seq_;
 public:
  InMemorySessionStore();
  explicit InMemorySessionStore(const std::filesystem::path& root);
  InMemorySessionStore(const InMemorySessionStore&) = delete;
  InMemorySessionStore& operator=(const InMemorySessionStore&) = delete;

  // throws ExecutionError if the directory cannot be created
  std::shared_ptr<Session> GetOrCreate(const std::string& id) override;
  void Delete(const std::string& id) override;
  std::vector<SessionView> List() const override;
  size_t Size() const override;
  void Clear() override;
};

#endif  // INCLUDE_EXECBOX_SESSION_H_
