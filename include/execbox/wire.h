#ifndef INCLUDE_EXECBOX_WIRE_H_
#define INCLUDE_EXECBOX_WIRE_H_

#include <string>
#include <optional>

#include <nlohmann/json.hpp>
#include "service.h"

// Accepts both {"code": ...} and the Piston form {"files": [{"content": ...}]};
//   on failure returns nullopt and sets error.
std::optional<ExecutionRequest> DecodeExecuteRequest(const std::string& body, std::string& error);

nlohmann::json EnvelopeJSON(const ExecutionEnvelope&, const std::optional<std::string>& session_id);
// 500 for INTERNAL_FAULT, 200 otherwise
int EnvelopeStatus(const ExecutionEnvelope&);

nlohmann::json SessionCreatedJSON(const Session&);
nlohmann::json SessionDeletedJSON(const std::string& id);
nlohmann::json SessionListJSON(const std::vector<SessionView>&);
nlohmann::json HealthJSON(size_t active_sessions);
nlohmann::json ErrorJSON(const std::string& message);

// child output is not guaranteed to be valid UTF-8
std::string DumpJSON(const nlohmann::json&);

#endif  // INCLUDE_EXECBOX_WIRE_H_
