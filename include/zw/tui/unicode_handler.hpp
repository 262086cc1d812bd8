#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unicode/umachine.h>

namespace zw::tui {

/**
 * @brief UTF-8 <-> code point conversion with ICU
 *
 * Line storage works on code points; everything that crosses the editor
 * boundary is UTF-8. Malformed input bytes decode to U+FFFD and invalid
 * code points (surrogates, values above U+10FFFF) encode as U+FFFD.
 */
class UnicodeHandler {
public:
    static constexpr char32_t kReplacementCharacter = U'\uFFFD';

    /**
     * @brief Decode UTF-8 text into code points
     * @param utf8_text UTF-8 encoded text
     * @return Decoded code points
     */
    static std::u32string decodeUtf8(std::string_view utf8_text);

    /**
     * @brief Encode code points as UTF-8
     * @param text Code points to encode
     * @return UTF-8 encoded text
     */
    static std::string encodeUtf8(std::u32string_view text);

    /**
     * @brief Append a single code point to a UTF-8 string
     */
    static void appendUtf8(std::string& out, char32_t codepoint);

    /**
     * @brief Number of code points in UTF-8 text
     */
    static size_t codePointCount(std::string_view utf8_text);

    /**
     * @brief Whether a code point is printable (graphic or space)
     */
    static bool isPrintable(char32_t codepoint);

    // Space and horizontal tab, the characters auto-indent copies
    static bool isIndentChar(char32_t codepoint) {
        return codepoint == U' ' || codepoint == U'\t';
    }

private:
    static bool isValidScalar(UChar32 codepoint);
};

} // namespace zw::tui
