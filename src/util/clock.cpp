#include <stash/clock.hpp>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace stash {

Timestamp now_utc() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();
}

std::string format_utc(Timestamp ts) {
    std::time_t t = static_cast<std::time_t>(ts);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return buf;
}

Result<Timestamp> parse_utc(const std::string& s) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return StashError{StashError::Parse,
            "invalid timestamp '" + s + "'",
            "expected YYYY-MM-DDTHH:MM:SSZ"};
    }

    std::string rest = s.substr(static_cast<size_t>(consumed));
    // Drop fractional seconds
    if (!rest.empty() && rest[0] == '.') {
        size_t i = 1;
        while (i < rest.size() && rest[i] >= '0' && rest[i] <= '9') ++i;
        rest = rest.substr(i);
    }
    if (!rest.empty() && rest != "Z" && rest != "+00:00") {
        return StashError{StashError::Parse,
            "timestamp '" + s + "' is not UTC",
            "use a 'Z' suffix"};
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return StashError{StashError::Parse,
            "timestamp '" + s + "' is out of range"};
    }

    std::tm tm_utc{};
    tm_utc.tm_year = year - 1900;
    tm_utc.tm_mon = month - 1;
    tm_utc.tm_mday = day;
    tm_utc.tm_hour = hour;
    tm_utc.tm_min = minute;
    tm_utc.tm_sec = second;
    return Result<Timestamp>::ok(static_cast<Timestamp>(timegm(&tm_utc)));
}

std::string today_utc() {
    return format_utc(now_utc()).substr(0, 10);
}

} // namespace stash
