#include "utils.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cctype>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::time_t parse_iso_time(const std::string& iso) {
    struct tm tm_buf = {};
    if (sscanf(iso.c_str(), "%d-%d-%dT%d:%d:%d",
               &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
               &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec) == 6) {
        tm_buf.tm_year -= 1900;
        tm_buf.tm_mon -= 1;
        tm_buf.tm_isdst = -1;
        return mktime(&tm_buf);
    }
    return 0;
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x80) c = static_cast<char>(std::tolower(uc));
    }
    return out;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos < text.size()) {
        auto nl = text.find('\n', pos);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(pos));
            break;
        }
        std::string line = text.substr(pos, nl - pos);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
        pos = nl + 1;
    }
    return lines;
}

size_t utf8_length(const std::string& s) {
    size_t count = 0;
    for (unsigned char c : s) {
        // Count every byte that is not a continuation byte (10xxxxxx)
        if ((c & 0xC0) != 0x80) count++;
    }
    return count;
}

std::string to_base36(uint64_t value) {
    static const char DIGITS[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (value == 0) return "0";
    std::string out;
    while (value > 0) {
        out.insert(out.begin(), DIGITS[value % 36]);
        value /= 36;
    }
    return out;
}

std::pair<std::string, std::string> split_first_word(const std::string& text) {
    std::string t = trimmed(text);
    auto space = t.find_first_of(" \t");
    if (space == std::string::npos) return {t, ""};
    return {t.substr(0, space), trimmed(t.substr(space + 1))};
}
