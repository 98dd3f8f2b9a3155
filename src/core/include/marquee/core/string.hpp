#pragma once

#include "types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace marquee {

// ============================================================================
// Unicode utilities
// ============================================================================

namespace unicode {

using CodePoint = char32_t;

// Substituted for every malformed UTF-8 sequence
constexpr CodePoint REPLACEMENT_CHARACTER = 0xFFFD;
constexpr CodePoint MAX_CODE_POINT = 0x10FFFF;

// Scalar values only: surrogates and anything past U+10FFFF are rejected
[[nodiscard]] constexpr bool is_valid(CodePoint cp) {
    return cp <= MAX_CODE_POINT && !(cp >= 0xD800 && cp <= 0xDFFF);
}

[[nodiscard]] constexpr bool is_ascii_upper(CodePoint cp) {
    return cp >= 'A' && cp <= 'Z';
}

[[nodiscard]] constexpr bool is_ascii_lower(CodePoint cp) {
    return cp >= 'a' && cp <= 'z';
}

// Whitespace that separates words when wrapping (ASCII plus NBSP and the
// common Unicode space separators).
[[nodiscard]] constexpr bool is_whitespace(CodePoint cp) {
    return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' ||
           cp == '\f' || cp == '\v' || cp == 0x00A0 || cp == 0x1680 ||
           (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 || cp == 0x2029 ||
           cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

[[nodiscard]] constexpr CodePoint to_ascii_lower(CodePoint cp) {
    return is_ascii_upper(cp) ? cp + 0x20 : cp;
}

// Uppercase for ASCII and the Latin-1 supplement; other code points pass
// through unchanged.
[[nodiscard]] constexpr CodePoint to_upper(CodePoint cp) {
    if (is_ascii_lower(cp) || (cp >= 0xE0 && cp <= 0xFE && cp != 0xF7)) {
        return cp - 0x20;
    }
    return cp;
}

// Walks a UTF-8 buffer one code point at a time. Malformed input never
// stops the walk: each bad sequence yields one REPLACEMENT_CHARACTER and the
// reader resumes at the first byte that could start a new sequence.
class Utf8Reader {
public:
    explicit Utf8Reader(std::string_view text) : m_text(text) {}

    [[nodiscard]] bool at_end() const { return m_offset >= m_text.size(); }
    [[nodiscard]] usize offset() const { return m_offset; }

    // Precondition: !at_end()
    CodePoint next();

private:
    std::string_view m_text;
    usize m_offset{0};
};

} // namespace unicode

// ============================================================================
// UTF-8 string helpers
// ============================================================================

// Decode a whole UTF-8 string; malformed sequences become U+FFFD.
[[nodiscard]] std::vector<unicode::CodePoint> decode_utf8(std::string_view text);

[[nodiscard]] std::string encode_utf8(const std::vector<unicode::CodePoint>& code_points);

void append_utf8(std::string& out, unicode::CodePoint cp);

[[nodiscard]] usize code_point_count(std::string_view text);

// Split on runs of whitespace, dropping empty pieces.
[[nodiscard]] std::vector<std::string> split_whitespace(std::string_view text);

// Split on '\n' ("\r\n" is treated as one break). Keeps empty lines.
[[nodiscard]] std::vector<std::string> split_lines(std::string_view text);

[[nodiscard]] std::string join(const std::vector<std::string>& parts, std::string_view separator);

[[nodiscard]] std::string to_upper(std::string_view text);
[[nodiscard]] std::string to_ascii_lower(std::string_view text);
[[nodiscard]] std::string trim(std::string_view text);
[[nodiscard]] bool equals_ignore_case(std::string_view a, std::string_view b);

} // namespace marquee
