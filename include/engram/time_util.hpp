#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace engram {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * Render a timestamp as UTC ISO-8601 ("2024-05-01T12:00:00.123456Z").
 * Six fractional digits are written unless the value carries sub-microsecond
 * precision, in which case nine are written, so parse(format(t)) == t.
 */
std::string format_iso8601(Timestamp ts);

/**
 * Parse "YYYY-MM-DDTHH:MM:SS[.f{1,9}][Z|+hh:mm|-hh:mm]". A missing zone
 * designator is read as UTC. Returns nullopt on any syntax error.
 */
std::optional<Timestamp> parse_iso8601(const std::string& text);

} // namespace engram
