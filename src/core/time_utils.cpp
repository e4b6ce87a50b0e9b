#include "time_utils.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <cctype>
#include <ctime>

static std::string format_tm_clock(const struct tm& tm_buf) {
    // Format as "8:13pm" (12-hour with am/pm)
    char buf[16];
    std::strftime(buf, sizeof(buf), "%I:%M%p", &tm_buf);
    // Strip leading zero and lowercase am/pm: "08:13PM" → "8:13pm"
    std::string result(buf);
    if (!result.empty() && result[0] == '0') result.erase(0, 1);
    for (auto& c : result) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return result;
}

std::string format_elapsed(std::chrono::seconds elapsed) {
    long seconds = static_cast<long>(elapsed.count());
    if (seconds < 0) seconds = 0;
    long hours = seconds / 3600;
    long mins = (seconds % 3600) / 60;
    long secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_clock(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    return format_tm_clock(tm_buf);
}

std::string format_timestamp(const std::string& iso_time) {
    if (iso_time.empty()) return "-";

    std::time_t t = parse_iso_time(iso_time);
    if (t == 0) return "?";

    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    return format_tm_clock(tm_buf);
}
