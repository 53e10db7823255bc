#ifndef INCLUDE_EXECBOX_UTILS_H_
#define INCLUDE_EXECBOX_UTILS_H_

#include <string>
#include <cstdint>

#include "service.h"

const char* OutcomeName(Outcome);
const char* OutcomeDesc(Outcome);

std::string NewExecutionId();
// random UUID (version 4)
std::string NewSessionId();

// UNIX timestamp, microseconds
int64_t CurrentTimestamp();
// ISO-8601 UTC, e.g. 2026-10-19T08:30:00.123456
std::string FormatTimestamp(int64_t timestamp);

#endif  // INCLUDE_EXECBOX_UTILS_H_
