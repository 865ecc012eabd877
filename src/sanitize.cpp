/**
 * Handfont — Input sanitizer implementation
 */

#include "sanitize.h"

#include <cstdint>
#include <unicode/uchar.h>
#include <unicode/utf8.h>

static bool is_allowed_code_point(UChar32 c) {
    if (c == ' ' || c == '-' || c == '_') return true;
    if (u_isalpha(c)) return true;

    switch (u_charType(c)) {
        case U_DECIMAL_DIGIT_NUMBER:
        case U_LETTER_NUMBER:
        case U_OTHER_NUMBER:
            return true;
        default:
            return false;
    }
}

std::string sanitize_text(const std::string& value) {
    std::string out;
    out.reserve(value.size());

    const auto* bytes = reinterpret_cast<const uint8_t*>(value.data());
    const auto length = static_cast<int32_t>(value.size());
    int32_t i = 0;

    while (i < length) {
        int32_t start = i;
        UChar32 c;
        U8_NEXT(bytes, i, length, c);

        // c < 0: malformed sequence, skipped as a whole
        if (c >= 0 && is_allowed_code_point(c)) out.append(value, start, i - start);
    }

    size_t first = out.find_first_not_of(' ');
    if (first == std::string::npos) return "";
    size_t last = out.find_last_not_of(' ');
    return out.substr(first, last - first + 1);
}

bool is_sanitized_key(const std::string& value) {
    if (value.empty()) return false;
    return sanitize_text(value) == value;
}
