#pragma once

#include <stash/result.hpp>
#include <cstdint>
#include <string>

namespace stash {

// Seconds since the Unix epoch, UTC
using Timestamp = int64_t;

Timestamp now_utc();

// "YYYY-MM-DDTHH:MM:SSZ"
std::string format_utc(Timestamp ts);

// Accepts "YYYY-MM-DDTHH:MM:SSZ", "YYYY-MM-DDTHH:MM:SS" and
// "YYYY-MM-DDTHH:MM:SS+00:00". Fractional seconds are truncated.
Result<Timestamp> parse_utc(const std::string& s);

// "YYYY-MM-DD" for the current UTC day
std::string today_utc();

} // namespace stash
