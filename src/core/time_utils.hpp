#pragma once

#include <chrono>
#include <string>

// Human-readable elapsed time: "2h35m", "14m22s", "8s". Negative → "0s".
std::string format_elapsed(std::chrono::seconds elapsed);

// Wall-clock time of day as "2:35pm" (local time).
std::string format_clock(std::chrono::system_clock::time_point when);

// Same for an ISO timestamp (YYYY-MM-DDTHH:MM:SS).
// Returns "-" if empty, "?" on parse failure.
std::string format_timestamp(const std::string& iso_time);
