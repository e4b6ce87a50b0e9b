#include "chunker.hpp"

namespace {

bool is_continuation_byte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

std::vector<std::string> chunk_text(const std::string& text, size_t max_bytes) {
    if (max_bytes == 0 || text.size() <= max_bytes) return {text};

    std::vector<std::string> chunks;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t remaining = text.size() - pos;
        if (remaining <= max_bytes) {
            chunks.push_back(text.substr(pos));
            break;
        }

        size_t end = max_bytes;
        size_t nl = text.rfind('\n', pos + max_bytes);
        if (nl != std::string::npos && nl > pos && nl - pos > max_bytes / 2) {
            end = nl - pos;
        } else {
            while (end > 0 && is_continuation_byte(static_cast<unsigned char>(text[pos + end])))
                --end;
            // a single code point wider than the budget: take it whole
            if (end == 0) {
                end = 1;
                while (pos + end < text.size() &&
                       is_continuation_byte(static_cast<unsigned char>(text[pos + end])))
                    ++end;
            }
        }

        chunks.push_back(text.substr(pos, end));
        pos += end;
    }
    return chunks;
}
