#include "glyphic/core/string.hpp"
#include <algorithm>

namespace glyphic {

// ============================================================================
// UTF-8 implementation
// ============================================================================

namespace unicode {

Utf8DecodeResult utf8_decode(const char* data, usize length) {
    if (length == 0 || data == nullptr) {
        return {INVALID_CODE_POINT, 0};
    }

    auto byte = static_cast<u8>(data[0]);

    // Single byte (ASCII)
    if ((byte & 0x80) == 0) {
        return {static_cast<CodePoint>(byte), 1};
    }

    usize seq_len;
    CodePoint cp;

    if ((byte & 0xE0) == 0xC0) {
        seq_len = 2;
        cp = byte & 0x1F;
    } else if ((byte & 0xF0) == 0xE0) {
        seq_len = 3;
        cp = byte & 0x0F;
    } else if ((byte & 0xF8) == 0xF0) {
        seq_len = 4;
        cp = byte & 0x07;
    } else {
        return {REPLACEMENT_CHARACTER, 1};
    }

    if (length < seq_len) {
        return {REPLACEMENT_CHARACTER, length};
    }

    for (usize i = 1; i < seq_len; ++i) {
        byte = static_cast<u8>(data[i]);
        if ((byte & 0xC0) != 0x80) {
            return {REPLACEMENT_CHARACTER, i};
        }
        cp = (cp << 6) | (byte & 0x3F);
    }

    if (!is_valid(cp)) {
        return {REPLACEMENT_CHARACTER, seq_len};
    }

    // Overlong encodings
    if ((seq_len == 2 && cp < 0x80) ||
        (seq_len == 3 && cp < 0x800) ||
        (seq_len == 4 && cp < 0x10000)) {
        return {REPLACEMENT_CHARACTER, seq_len};
    }

    return {cp, seq_len};
}

} // namespace unicode

// ============================================================================
// String implementation
// ============================================================================

namespace {

// Calls fn(code_point, byte_offset, byte_length) for each decoded code point
template<typename Fn>
void for_each_code_point(const std::string& data, Fn&& fn) {
    usize offset = 0;
    while (offset < data.size()) {
        auto decoded = unicode::utf8_decode(data.data() + offset, data.size() - offset);
        usize length = std::max<usize>(decoded.bytes_consumed, 1);
        fn(decoded.code_point, offset, length);
        offset += length;
    }
}

} // namespace

String::String(const char* str) : m_data(str ? str : "") {}

String::String(const char* str, usize length) : m_data(str, length) {}

String::String(std::string str) : m_data(std::move(str)) {}

String::String(std::string_view sv) : m_data(sv) {}

std::vector<unicode::CodePoint> String::code_points() const {
    std::vector<unicode::CodePoint> result;
    result.reserve(m_data.size());
    for_each_code_point(m_data, [&](unicode::CodePoint cp, usize, usize) {
        result.push_back(cp);
    });
    return result;
}

String String::substring(usize start, usize length) const {
    return String(m_data.substr(start, length));
}

bool String::starts_with(const String& prefix) const {
    return m_data.starts_with(prefix.m_data);
}

String String::to_lowercase() const {
    String result;
    result.m_data.reserve(m_data.size());
    for (char c : m_data) {
        result.m_data.push_back(static_cast<char>(
            unicode::to_ascii_lower(static_cast<u8>(c))));
    }
    return result;
}

String String::trim() const {
    usize start = m_data.size();
    usize end = 0;
    for_each_code_point(m_data, [&](unicode::CodePoint cp, usize offset, usize length) {
        if (!unicode::is_whitespace(cp)) {
            start = std::min(start, offset);
            end = offset + length;
        }
    });
    if (start >= end) {
        return String();
    }
    return String(m_data.substr(start, end - start));
}

bool String::is_blank() const {
    bool blank = true;
    for_each_code_point(m_data, [&](unicode::CodePoint cp, usize, usize) {
        blank = blank && unicode::is_whitespace(cp);
    });
    return blank;
}

std::vector<String> String::split(char delimiter) const {
    std::vector<String> result;
    usize start = 0;
    usize end = m_data.find(delimiter);

    while (end != std::string::npos) {
        result.emplace_back(m_data.substr(start, end - start));
        start = end + 1;
        end = m_data.find(delimiter, start);
    }

    result.emplace_back(m_data.substr(start));
    return result;
}

std::vector<String> String::split_whitespace() const {
    std::vector<String> result;
    usize word_start = 0;
    bool in_word = false;
    for_each_code_point(m_data, [&](unicode::CodePoint cp, usize offset, usize) {
        if (unicode::is_whitespace(cp)) {
            if (in_word) {
                result.emplace_back(m_data.substr(word_start, offset - word_start));
                in_word = false;
            }
        } else if (!in_word) {
            word_start = offset;
            in_word = true;
        }
    });
    if (in_word) {
        result.emplace_back(m_data.substr(word_start));
    }
    return result;
}

String String::operator+(const String& other) const {
    return String(m_data + other.m_data);
}

String& String::operator+=(const String& other) {
    m_data += other.m_data;
    return *this;
}

String& String::operator+=(std::string_view sv) {
    m_data += sv;
    return *this;
}

String& String::operator+=(const char* str) {
    if (str) {
        m_data += str;
    }
    return *this;
}

} // namespace glyphic
