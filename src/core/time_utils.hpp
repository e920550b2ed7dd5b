#pragma once

#include <string>
#include <optional>
#include <ctime>

// Parse an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS[.frac][Z|±HH:MM]).
// A timestamp without a zone is taken as UTC. Returns nullopt on parse failure.
std::optional<std::time_t> parse_iso_utc(const std::string& iso);

// Format as YYYY-MM-DDTHH:MM:SSZ.
std::string format_iso_utc(std::time_t t);

// Current time as YYYY-MM-DDTHH:MM:SSZ.
std::string now_iso();

// Hours from start to end; 0 if either fails to parse or end precedes start.
double hours_between(const std::string& start, const std::string& end);

// Seconds from start to end (may be negative); 0 on parse failure.
double seconds_between(const std::string& start, const std::string& end);

// Format the duration between two ISO timestamps.
// If end_time is empty, uses current time (for "still running" durations).
// Returns human-readable string like "2h35m", "14m22s", "8s", or "-" if start is empty.
std::string format_duration(const std::string& start_time, const std::string& end_time = "");

// "45s", "5m 30s", "2h 15m 0s", "3d 4h 5m"
std::string humanize_duration(double seconds);

// Format an ISO timestamp as "YYYY-MM-DD HH:MM UTC". "-" if empty, "?" on parse failure.
std::string format_timestamp(const std::string& iso_time);
