#include <execbox/service.h>

#include <algorithm>

#include <spdlog/spdlog.h>
#include <execbox/paths.h>
#include <execbox/utils.h>

ExecutionRequest::ExecutionRequest() : timeout_ms(kDefaultTimeoutMs) {}

long EffectiveTimeout(long timeout_ms) {
  if (timeout_ms <= 0) timeout_ms = kDefaultTimeoutMs;
  return std::min(timeout_ms, kMaxTimeoutMs);
}

namespace {

Outcome Classify(const ExecutionResult& res) {
  if (res.timed_out) return Outcome::TIMED_OUT;
  if (res.signal) return Outcome::CRASHED;
  if (res.exit_code) return Outcome::FAILED;
  return Outcome::OK;
}

} // namespace

ExecutionEnvelope ExecutionService::Run_(const std::string& exec_id, const ExecutionRequest& req) {
  ExecutionEnvelope ret;
  ret.exec_id = exec_id;

  ExecutionJob job;
  job.code = req.code;
  job.input = req.input;
  job.timeout_ms = EffectiveTimeout(req.timeout_ms);

  SecurityVerdict verdict = analyzer_.Analyze(req.code);
  if (!verdict.safe) {
    spdlog::warn("[{}] Blocked: {}", exec_id, verdict.reason);
    ret.blocked = true;
    ret.block_reason = verdict.reason;
    ret.error = "Execution blocked by security policy: " + verdict.reason;
    ret.exit_code = 1;
    ret.outcome = Outcome::REJECTED;
    return ret;
  }

  std::shared_ptr<Session> session;
  if (req.session_id) {
    session = sessions_.GetOrCreate(*req.session_id);
    sessions_.RecordExecution(*session);
    job.workdir = session->workdir;
    job.stateless = false;
  }

  ExecutionResult res = executor_.Run(job);
  ret.output = std::move(res.output);
  ret.error = std::move(res.error);
  ret.exit_code = res.exit_code;
  ret.outcome = Classify(res);
  spdlog::info("[{}] {}: exit_code={} wall_time={}ms{}", exec_id, OutcomeDesc(ret.outcome),
               ret.exit_code, res.wall_time / 1000,
               session ? fmt::format(" session={} cell={}", session->id.substr(0, 8),
                                     session->cell_count.load()) : std::string());
  return ret;
}

ExecutionEnvelope ExecutionService::Execute(const ExecutionRequest& req) {
  std::string exec_id = NewExecutionId();
  spdlog::info("[{}] Received: {} bytes of code, timeout={}ms{}", exec_id, req.code.size(),
               req.timeout_ms, req.session_id ? ", session " + req.session_id->substr(0, 8) : "");
  try {
    return Run_(exec_id, req);
  } catch (std::exception& e) {
    spdlog::error("[{}] Internal fault: {}", exec_id, e.what());
    ExecutionEnvelope ret;
    ret.exec_id = exec_id;
    ret.error = "Internal Service Error";
    ret.exit_code = 1;
    ret.outcome = Outcome::INTERNAL_FAULT;
    return ret;
  }
}

std::shared_ptr<Session> ExecutionService::CreateSession() {
  return sessions_.Create();
}

void ExecutionService::DestroySession(const std::string& id) {
  sessions_.Delete(id);
}

std::vector<SessionView> ExecutionService::ListSessions() const {
  return sessions_.List();
}

size_t ExecutionService::SessionCount() const {
  return sessions_.Size();
}
