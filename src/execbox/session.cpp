#include <execbox/session.h>

#include <algorithm>

#include <spdlog/spdlog.h>
#include <execbox/paths.h>
#include <execbox/executor.h>
#include "utils.h"

std::shared_ptr<Session> SessionStore::Create() {
  return GetOrCreate(NewSessionId());
}

InMemorySessionStore::InMemorySessionStore() : InMemorySessionStore(kWorkRoot) {}

InMemorySessionStore::InMemorySessionStore(const fs::path& root) : root_(root), seq_(0) {}

std::shared_ptr<Session> InMemorySessionStore::GetOrCreate(const std::string& id) {
  std::lock_guard lck(mtx_);
  if (auto it = sessions_.find(id); it != sessions_.end()) return it->second;
  fs::path workdir = MakeTempDir(root_ / SessionDirTemplate(id).filename());
  if (workdir.empty()) throw ExecutionError("Failed to create session directory");
  auto session = std::make_shared<Session>();
  session->id = id;
  session->workdir = workdir;
  session->created_at = CurrentTimestamp();
  session->seq = seq_++;
  sessions_.insert({id, session});
  spdlog::info("Created session {} -> {}", id.substr(0, 8), workdir.c_str());
  return session;
}

void InMemorySessionStore::Delete(const std::string& id) {
  std::shared_ptr<Session> session;
  {
    std::lock_guard lck(mtx_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
      spdlog::debug("Delete unknown session {}", id.substr(0, 8));
      return;
    }
    session = std::move(it->second);
    sessions_.erase(it);
  }
  // an already removed directory is fine
  RemoveAll(session->workdir);
  spdlog::info("Cleaned up session {}", id.substr(0, 8));
}

std::vector<SessionView> InMemorySessionStore::List() const {
  std::vector<std::pair<long, SessionView>> items;
  {
    std::lock_guard lck(mtx_);
    for (auto& [id, session] : sessions_) {
      items.push_back({session->seq, {id, session->created_at, session->cell_count.load()}});
    }
  }
  std::sort(items.begin(), items.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });
  std::vector<SessionView> ret;
  for (auto& i : items) ret.push_back(std::move(i.second));
  return ret;
}

size_t InMemorySessionStore::Size() const {
  std::lock_guard lck(mtx_);
  return sessions_.size();
}

void InMemorySessionStore::Clear() {
  std::unordered_map<std::string, std::shared_ptr<Session>> sessions;
  {
    std::lock_guard lck(mtx_);
    sessions.swap(sessions_);
  }
  for (auto& [id, session] : sessions) RemoveAll(session->workdir);
  spdlog::info("Cleaned up {} sessions", sessions.size());
}
