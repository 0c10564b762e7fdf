#pragma once

#include <chrono>
#include <string>
#include <arrow/result.h>

namespace parcel {

using Timestamp = std::chrono::system_clock::time_point;

inline Timestamp Now() { return std::chrono::system_clock::now(); }

/**
 * @brief Format as ISO-8601 UTC with microseconds,
 *        e.g. "2024-05-01T12:30:00.000250+00:00"
 */
std::string FormatIso8601(Timestamp ts);

/**
 * @brief Parse an ISO-8601 timestamp
 *
 * Accepts an optional fractional part (up to microsecond precision is
 * kept) and a trailing "Z" or "+HH:MM"/"-HH:MM" offset. A missing offset
 * is read as UTC.
 */
arrow::Result<Timestamp> ParseIso8601(const std::string& text);

} // namespace parcel
