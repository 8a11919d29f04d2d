#pragma once

#include <taskfed/core/types.h>

#include <optional>
#include <string>

namespace taskfed::time {

/**
 * @brief Format a time point as ISO 8601 UTC with millisecond precision.
 *
 * Example: "2024-05-01T12:00:00.250Z"
 */
std::string formatIso8601(TimePoint tp);

/**
 * @brief Parse an ISO 8601 timestamp.
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS", an optional ".fff" fraction (any number of
 * digits, truncated to milliseconds) and an optional "Z" or "+HH:MM"/"-HH:MM"
 * offset. A bare "YYYY-MM-DD" is read as midnight UTC.
 *
 * @return Parsed time point or nullopt if the string is not ISO 8601
 */
std::optional<TimePoint> parseIso8601(const std::string& isoStr);

/// Milliseconds since the Unix epoch
int64_t toEpochMillis(TimePoint tp);

TimePoint fromEpochMillis(int64_t millis);

} // namespace taskfed::time
