#include <execbox/wire.h>

#include <unistd.h>

#include <algorithm>

#include <spdlog/spdlog.h>
#include <execbox/paths.h>
#include <execbox/utils.h>

#ifndef EXECBOX_VERSION
#define EXECBOX_VERSION "unknown"
#endif

namespace {

using nlohmann::json;

// run_timeout may be sent as a float by some clients
// clamped to kMaxTimeoutMs before converting
long TimeoutField(const json& data) {
  for (const char* key : {"run_timeout", "timeout_ms"}) {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) continue;
    if (it->is_number_unsigned()) {
      return static_cast<long>(std::min<uint64_t>(it->get<uint64_t>(), kMaxTimeoutMs));
    }
    if (it->is_number_integer()) return std::min<long>(it->get<int64_t>(), kMaxTimeoutMs);
    double val = it->get<double>();
    if (!(val > 0)) return 0;
    return static_cast<long>(std::min<double>(val, kMaxTimeoutMs));
  }
  return kDefaultTimeoutMs;
}

std::vector<std::string> SortedBlockedModules() {
  std::vector<std::string> ret = DefaultBlockedModules();
  std::sort(ret.begin(), ret.end());
  return ret;
}

} // namespace

std::optional<ExecutionRequest> DecodeExecuteRequest(const std::string& body, std::string& error) {
  json data = json::parse(body, nullptr, false);
  if (data.is_discarded() || !data.is_object()) {
    error = "No JSON payload provided";
    return std::nullopt;
  }
  ExecutionRequest req;
  try {
    if (auto files = data.find("files"); files != data.end() && files->is_array() && !files->empty()) {
      req.code = (*files)[0].value("content", "");
    }
    if (req.code.empty() && data.contains("code") && !data["code"].is_null()) {
      req.code = data["code"].get<std::string>();
    }
    if (req.code.empty()) {
      error = "No code provided";
      return std::nullopt;
    }
    if (data.contains("stdin") && !data["stdin"].is_null()) {
      req.input = data["stdin"].get<std::string>();
    }
    req.timeout_ms = TimeoutField(data);
    if (data.contains("session_id") && !data["session_id"].is_null()) {
      req.session_id = data["session_id"].get<std::string>();
      if (req.session_id->empty()) req.session_id.reset();
    }
  } catch (json::exception& err) {
    spdlog::debug("Request decoding error: {}", err.what());
    error = std::string("Invalid request: ") + err.what();
    return std::nullopt;
  }
  return req;
}

json EnvelopeJSON(const ExecutionEnvelope& env, const std::optional<std::string>& session_id) {
  json ret{
      {"run", {{"stdout", env.output}, {"stderr", env.error}, {"code", env.exit_code}}},
      {"language", "python"},
      {"exec_id", env.exec_id},
      {"outcome", OutcomeName(env.outcome)}};
  if (session_id) ret["session_id"] = *session_id;
  if (env.blocked) {
    ret["blocked"] = true;
    ret["reason"] = env.block_reason;
  }
  return ret;
}

int EnvelopeStatus(const ExecutionEnvelope& env) {
  return env.outcome == Outcome::INTERNAL_FAULT ? 500 : 200;
}

json SessionCreatedJSON(const Session& session) {
  return json{
      {"session_id", session.id},
      {"created_at", FormatTimestamp(session.created_at)},
      {"status", "ready"}};
}

json SessionDeletedJSON(const std::string& id) {
  return json{{"status", "deleted"}, {"session_id", id}};
}

json SessionListJSON(const std::vector<SessionView>& sessions) {
  json items = json::array();
  for (auto& i : sessions) {
    items.push_back({{"id", i.id}, {"created_at", FormatTimestamp(i.created_at)}, {"cell_count", i.cell_count}});
  }
  return json{{"sessions", std::move(items)}, {"count", sessions.size()}};
}

json HealthJSON(size_t active_sessions) {
  return json{
      {"status", "ok"},
      {"service", "execbox"},
      {"version", EXECBOX_VERSION},
      {"active_sessions", active_sessions},
      {"security", {
          {"blocked_modules", SortedBlockedModules()},
          {"max_output_bytes", kMaxOutputBytes},
          {"max_timeout_sec", kMaxTimeoutMs / 1000.0},
          {"runs_as_root", geteuid() == 0}}},
      {"timestamp", FormatTimestamp(CurrentTimestamp())}};
}

json ErrorJSON(const std::string& message) {
  return json{{"error", message}};
}

std::string DumpJSON(const json& data) {
  return data.dump(-1, ' ', false, json::error_handler_t::replace);
}
