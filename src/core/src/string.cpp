#include "marquee/core/string.hpp"

namespace marquee {

namespace unicode {

namespace {

// Sequence length announced by a lead byte, 0 for bytes that cannot lead
constexpr usize sequence_length(u8 lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

constexpr bool is_continuation(u8 byte) {
    return (byte & 0xC0) == 0x80;
}

// Smallest code point that needs a sequence of the given length
constexpr CodePoint MIN_FOR_LENGTH[5] = {0, 0, 0x80, 0x800, 0x10000};

} // anonymous namespace

CodePoint Utf8Reader::next() {
    const auto lead = static_cast<u8>(m_text[m_offset]);
    const usize length = sequence_length(lead);

    if (length == 0) {
        ++m_offset;
        return REPLACEMENT_CHARACTER;
    }
    if (length == 1) {
        ++m_offset;
        return lead;
    }

    CodePoint cp = lead & (0x7F >> length);
    usize consumed = 1;
    while (consumed < length && m_offset + consumed < m_text.size()) {
        const auto byte = static_cast<u8>(m_text[m_offset + consumed]);
        if (!is_continuation(byte)) {
            break;
        }
        cp = (cp << 6) | (byte & 0x3F);
        ++consumed;
    }

    m_offset += consumed;
    if (consumed < length || cp < MIN_FOR_LENGTH[length] || !is_valid(cp)) {
        return REPLACEMENT_CHARACTER;
    }
    return cp;
}

} // namespace unicode

// ============================================================================
// String helpers
// ============================================================================

std::vector<unicode::CodePoint> decode_utf8(std::string_view text) {
    std::vector<unicode::CodePoint> result;
    result.reserve(text.size());

    unicode::Utf8Reader reader(text);
    while (!reader.at_end()) {
        result.push_back(reader.next());
    }
    return result;
}

void append_utf8(std::string& out, unicode::CodePoint cp) {
    static constexpr u8 LEAD_MARK[4] = {0x00, 0xC0, 0xE0, 0xF0};

    if (!unicode::is_valid(cp)) {
        cp = unicode::REPLACEMENT_CHARACTER;
    }

    const usize tail = cp < 0x80 ? 0 : cp < 0x800 ? 1 : cp < 0x10000 ? 2 : 3;
    char bytes[4];
    for (usize i = tail; i > 0; --i) {
        bytes[i] = static_cast<char>(0x80 | (cp & 0x3F));
        cp >>= 6;
    }
    bytes[0] = static_cast<char>(LEAD_MARK[tail] | cp);
    out.append(bytes, tail + 1);
}

std::string encode_utf8(const std::vector<unicode::CodePoint>& code_points) {
    std::string out;
    out.reserve(code_points.size());
    for (auto cp : code_points) {
        append_utf8(out, cp);
    }
    return out;
}

usize code_point_count(std::string_view text) {
    usize count = 0;
    unicode::Utf8Reader reader(text);
    while (!reader.at_end()) {
        reader.next();
        ++count;
    }
    return count;
}

std::vector<std::string> split_whitespace(std::string_view text) {
    std::vector<std::string> words;
    std::string current;

    for (auto cp : decode_utf8(text)) {
        if (unicode::is_whitespace(cp)) {
            if (!current.empty()) {
                words.push_back(std::move(current));
                current.clear();
            }
        } else {
            append_utf8(current, cp);
        }
    }

    if (!current.empty()) {
        words.push_back(std::move(current));
    }
    return words;
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    usize start = 0;

    while (true) {
        usize pos = text.find('\n', start);
        if (pos == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        usize end = pos;
        if (end > start && text[end - 1] == '\r') {
            --end;
        }
        lines.emplace_back(text.substr(start, end - start));
        start = pos + 1;
    }
    return lines;
}

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
    std::string out;
    for (usize i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out.append(separator);
        }
        out.append(parts[i]);
    }
    return out;
}

std::string to_upper(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (auto cp : decode_utf8(text)) {
        append_utf8(out, unicode::to_upper(cp));
    }
    return out;
}

std::string to_ascii_lower(std::string_view text) {
    std::string out(text);
    for (auto& c : out) {
        c = static_cast<char>(unicode::to_ascii_lower(static_cast<u8>(c)));
    }
    return out;
}

std::string trim(std::string_view text) {
    usize start = 0;
    usize end = text.size();
    auto is_space = [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    };
    while (start < end && is_space(text[start])) ++start;
    while (end > start && is_space(text[end - 1])) --end;
    return std::string(text.substr(start, end - start));
}

bool equals_ignore_case(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (usize i = 0; i < a.size(); ++i) {
        if (unicode::to_ascii_lower(static_cast<u8>(a[i])) !=
            unicode::to_ascii_lower(static_cast<u8>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace marquee
