#pragma once

#include "types.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace glyphic {

// ============================================================================
// Unicode utilities
// ============================================================================

namespace unicode {

using CodePoint = char32_t;

constexpr CodePoint REPLACEMENT_CHARACTER = 0xFFFD;
constexpr CodePoint INVALID_CODE_POINT = 0xFFFFFFFF;

[[nodiscard]] constexpr bool is_valid(CodePoint cp) {
    return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
}

[[nodiscard]] constexpr bool is_ascii_digit(CodePoint cp) {
    return cp >= '0' && cp <= '9';
}

// White_Space characters plus the byte order mark, the set used by
// trimming and word splitting
[[nodiscard]] constexpr bool is_whitespace(CodePoint cp) {
    switch (cp) {
        case 0x0009: case 0x000A: case 0x000B: case 0x000C: case 0x000D:
        case 0x0020: case 0x00A0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F:
        case 0x3000: case 0xFEFF:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

[[nodiscard]] constexpr bool is_ascii_hex_digit(CodePoint cp) {
    return is_ascii_digit(cp) ||
           (cp >= 'A' && cp <= 'F') ||
           (cp >= 'a' && cp <= 'f');
}

[[nodiscard]] constexpr CodePoint to_ascii_lower(CodePoint cp) {
    if (cp >= 'A' && cp <= 'Z') {
        return cp + ('a' - 'A');
    }
    return cp;
}

struct Utf8DecodeResult {
    CodePoint code_point;
    usize bytes_consumed;
};

[[nodiscard]] Utf8DecodeResult utf8_decode(const char* data, usize length);

} // namespace unicode

// ============================================================================
// String - UTF-8 encoded string with utilities
// ============================================================================

class String {
public:
    using const_iterator = std::string::const_iterator;

    String() = default;
    String(const char* str);
    String(const char* str, usize length);
    String(std::string str);
    String(std::string_view sv);

    [[nodiscard]] const char* c_str() const noexcept { return m_data.c_str(); }
    [[nodiscard]] const char* data() const noexcept { return m_data.data(); }
    [[nodiscard]] usize size() const noexcept { return m_data.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_data.empty(); }

    [[nodiscard]] std::string_view view() const noexcept {
        return std::string_view(m_data);
    }

    [[nodiscard]] const std::string& std_string() const noexcept {
        return m_data;
    }

    const_iterator begin() const { return m_data.begin(); }
    const_iterator end() const { return m_data.end(); }

    // Decodes the whole string; malformed sequences become U+FFFD
    [[nodiscard]] std::vector<unicode::CodePoint> code_points() const;

    [[nodiscard]] String substring(usize start, usize length = std::string::npos) const;
    [[nodiscard]] bool starts_with(const String& prefix) const;

    [[nodiscard]] String to_lowercase() const;
    [[nodiscard]] String trim() const;
    [[nodiscard]] bool is_blank() const;

    // Every occurrence of the delimiter splits, so adjacent delimiters
    // produce empty pieces
    [[nodiscard]] std::vector<String> split(char delimiter) const;

    // Splits on runs of whitespace, never producing empty pieces
    [[nodiscard]] std::vector<String> split_whitespace() const;

    [[nodiscard]] bool operator==(const String& other) const {
        return m_data == other.m_data;
    }

    [[nodiscard]] bool operator!=(const String& other) const {
        return m_data != other.m_data;
    }

    String operator+(const String& other) const;
    String& operator+=(const String& other);
    String& operator+=(std::string_view sv);
    String& operator+=(const char* str);

    char operator[](usize index) const { return m_data[index]; }

private:
    std::string m_data;
};

inline String operator""_s(const char* str, std::size_t len) {
    return String(str, len);
}

struct StringHash {
    std::size_t operator()(const String& s) const {
        return std::hash<std::string>{}(s.std_string());
    }
};

} // namespace glyphic
