#include "zw/tui/unicode_handler.hpp"
#include <algorithm>
#include <cstdint>
#include <limits>
#include <unicode/uchar.h>
#include <unicode/utf.h>
#include <unicode/utf8.h>

namespace zw::tui {

std::u32string UnicodeHandler::decodeUtf8(std::string_view utf8_text) {
    std::u32string result;
    result.reserve(utf8_text.size());

    // ICU's UTF-8 macros index with int32_t; decode in chunks for larger inputs
    const auto* bytes = reinterpret_cast<const uint8_t*>(utf8_text.data());
    size_t remaining = utf8_text.size();
    while (remaining > 0) {
        int32_t length = static_cast<int32_t>(
            std::min<size_t>(remaining, std::numeric_limits<int32_t>::max()));
        int32_t idx = 0;
        while (idx < length) {
            UChar32 codepoint;
            U8_NEXT(bytes, idx, length, codepoint);
            result.push_back(codepoint < 0 ? kReplacementCharacter
                                           : static_cast<char32_t>(codepoint));
        }
        bytes += idx;
        remaining -= static_cast<size_t>(idx);
    }

    return result;
}

std::string UnicodeHandler::encodeUtf8(std::u32string_view text) {
    std::string result;
    result.reserve(text.size());
    for (char32_t ch : text) {
        appendUtf8(result, ch);
    }
    return result;
}

void UnicodeHandler::appendUtf8(std::string& out, char32_t codepoint) {
    UChar32 c = static_cast<UChar32>(codepoint);
    if (!isValidScalar(c)) {
        c = static_cast<UChar32>(kReplacementCharacter);
    }

    uint8_t buffer[U8_MAX_LENGTH];
    int32_t length = 0;
    U8_APPEND_UNSAFE(buffer, length, c);
    out.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(length));
}

size_t UnicodeHandler::codePointCount(std::string_view utf8_text) {
    return decodeUtf8(utf8_text).size();
}

bool UnicodeHandler::isPrintable(char32_t codepoint) {
    UChar32 c = static_cast<UChar32>(codepoint);
    if (!isValidScalar(c)) {
        return false;
    }
    return u_isprint(c) != 0;
}

bool UnicodeHandler::isValidScalar(UChar32 codepoint) {
    return codepoint >= 0 && codepoint <= 0x10FFFF && !U_IS_SURROGATE(codepoint);
}

} // namespace zw::tui
