#include "core/text_transforms.hpp"

#include <cstdint>

namespace kvtrace::text {

namespace {

/**
 * @brief Length of the well-formed UTF-8 sequence starting at @p pos
 * @return 1-4 for a valid sequence, 0 if the byte at @p pos starts none
 */
size_t valid_sequence_length(std::string_view s, size_t pos) {
    const auto b0 = static_cast<uint8_t>(s[pos]);
    if (b0 < 0x80) return 1;

    size_t len = 0;
    uint8_t lo = 0x80;
    uint8_t hi = 0xBF;

    if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        len = 3;
        if (b0 == 0xE0) lo = 0xA0;      // overlong
        else if (b0 == 0xED) hi = 0x9F; // surrogates
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        len = 4;
        if (b0 == 0xF0) lo = 0x90;      // overlong
        else if (b0 == 0xF4) hi = 0x8F; // > U+10FFFF
    } else {
        return 0;
    }

    if (pos + len > s.size()) return 0;

    // Second byte carries the tighter range, the rest are plain continuations
    const auto b1 = static_cast<uint8_t>(s[pos + 1]);
    if (b1 < lo || b1 > hi) return 0;
    for (size_t i = 2; i < len; ++i) {
        const auto b = static_cast<uint8_t>(s[pos + i]);
        if (b < 0x80 || b > 0xBF) return 0;
    }
    return len;
}

} // anonymous namespace

size_t char_count(std::string_view text) {
    size_t count = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t len = valid_sequence_length(text, pos);
        pos += (len == 0) ? 1 : len;
        ++count;
    }
    return count;
}

std::string truncate(std::string_view text, size_t max_length) {
    if (char_count(text) <= max_length) {
        return std::string(text);
    }

    const size_t keep = (max_length < kEllipsis.size())
        ? max_length
        : max_length - kEllipsis.size();

    // Byte offset just past the first `keep` characters
    size_t pos = 0;
    for (size_t kept = 0; kept < keep && pos < text.size(); ++kept) {
        const size_t len = valid_sequence_length(text, pos);
        pos += (len == 0) ? 1 : len;
    }

    std::string result(text.substr(0, pos));
    if (max_length >= kEllipsis.size()) {
        result.append(kEllipsis);
    }
    return result;
}

bool is_valid_utf8(std::string_view text) {
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t len = valid_sequence_length(text, pos);
        if (len == 0) return false;
        pos += len;
    }
    return true;
}

std::string utf8_encode(std::string_view text) {
    if (is_valid_utf8(text)) {
        return std::string(text);
    }

    std::string result;
    result.reserve(text.size());
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t len = valid_sequence_length(text, pos);
        if (len == 0) {
            ++pos;
            continue;
        }
        result.append(text.substr(pos, len));
        pos += len;
    }
    return result;
}

} // namespace kvtrace::text
