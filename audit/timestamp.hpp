#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace auditstore {

// UTC instant with microsecond resolution.
using Timestamp = std::chrono::time_point<std::chrono::system_clock,
                                          std::chrono::microseconds>;

Timestamp now_utc();

std::int64_t to_epoch_micros(Timestamp ts);
Timestamp from_epoch_micros(std::int64_t micros);

// Seconds since the epoch; this is the primary key of the index container.
double to_epoch_seconds(Timestamp ts);

// ts minus the given number of whole days (negative days move forward).
// nullopt when the result would leave 0001-01-01 .. 9999-12-31 UTC.
std::optional<Timestamp> days_before(Timestamp ts, std::int64_t days);

// Renders "YYYY-MM-DDTHH:MM:SS.ffffff+00:00".
std::string to_iso8601(Timestamp ts);

// Accepts a date, or a date and time with optional fraction (up to six
// digits) and optional "Z" / "+HH:MM" / "-HH:MM" suffix. A missing offset
// is read as UTC. Throws ValidationError on malformed input.
Timestamp parse_iso8601(const std::string &text);

// "YYYYMMDD_HHMMSS", used in export file names.
std::string to_compact_stamp(Timestamp ts);

} // namespace auditstore
