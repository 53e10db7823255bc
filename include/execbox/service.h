#ifndef INCLUDE_EXECBOX_SERVICE_H_
#define INCLUDE_EXECBOX_SERVICE_H_

#include <string>
#include <memory>
#include <optional>

#include "security.h"
#include "session.h"
#include "executor.h"

#define ENUM_OUTCOME_ \
  X(OK, "ok", "Completed") \
  X(FAILED, "failed", "Exited with nonzero status") \
  X(CRASHED, "crashed", "Terminated by signal") \
  X(TIMED_OUT, "timed_out", "Execution timed out") \
  X(REJECTED, "rejected", "Blocked by security policy") \
  X(INTERNAL_FAULT, "internal_fault", "Internal service error")
enum class Outcome {
#define X(name, abr, desc) name,
  ENUM_OUTCOME_
#undef X
};

// Canonical request; wire shapes are decoded into this before reaching the service
struct ExecutionRequest {
  std::string code;
  std::string input;
  long timeout_ms;
  std::optional<std::string> session_id;

  ExecutionRequest();
};

struct ExecutionEnvelope {
  std::string exec_id;
  std::string output, error;
  int exit_code;
  bool blocked;
  std::string block_reason;
  Outcome outcome;

  ExecutionEnvelope() : exit_code(0), blocked(false), outcome(Outcome::OK) {}
};

// min(timeout_ms, kMaxTimeoutMs); non-positive values get kDefaultTimeoutMs
long EffectiveTimeout(long timeout_ms);

class ExecutionService {
  const SecurityAnalyzer& analyzer_;
  SessionStore& sessions_;
  Executor& executor_;

  ExecutionEnvelope Run_(const std::string& exec_id, const ExecutionRequest& req);
 public:
  ExecutionService(const SecurityAnalyzer& analyzer, SessionStore& sessions, Executor& executor) :
      analyzer_(analyzer), sessions_(sessions), executor_(executor) {}

  // Never throws; harness faults come back as Outcome::INTERNAL_FAULT
  ExecutionEnvelope Execute(const ExecutionRequest& req);

  std::shared_ptr<Session> CreateSession();
  void DestroySession(const std::string& id);
  std::vector<SessionView> ListSessions() const;
  size_t SessionCount() const;
};

#endif  // INCLUDE_EXECBOX_SERVICE_H_
