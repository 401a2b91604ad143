/**
 * Style descriptor and value parsing
 */

#include "glyphic/layout/style.hpp"
#include "glyphic/core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string>
#include <unordered_map>

namespace glyphic::layout {

namespace {

u8 hex_value(char c) {
    if (c >= '0' && c <= '9') return static_cast<u8>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<u8>(c - 'a' + 10);
    return static_cast<u8>(c - 'A' + 10);
}

u8 hex_byte(const String& hex, usize index) {
    return static_cast<u8>(hex_value(hex[index]) * 16 + hex_value(hex[index + 1]));
}

// Single digit channels expand by repetition, #abc == #aabbcc
u8 hex_nibble(const String& hex, usize index) {
    return static_cast<u8>(hex_value(hex[index]) * 17);
}

std::optional<u8> parse_channel(const String& value) {
    String trimmed = value.trim();
    if (trimmed.empty()) {
        return std::nullopt;
    }
    i32 result = 0;
    for (char c : trimmed) {
        if (!unicode::is_ascii_digit(static_cast<unicode::CodePoint>(c))) {
            return std::nullopt;
        }
        result = std::min(result * 10 + (c - '0'), 255);
    }
    return static_cast<u8>(result);
}

} // namespace

// ============================================================================
// Alignment
// ============================================================================

std::optional<TextAlign> parse_alignment(const String& value) {
    String lower = value.trim().to_lowercase();
    if (lower == "left"_s) return TextAlign::Left;
    if (lower == "center"_s) return TextAlign::Center;
    if (lower == "right"_s) return TextAlign::Right;
    if (lower == "justify"_s) return TextAlign::Justify;
    return std::nullopt;
}

const char* alignment_name(TextAlign align) {
    switch (align) {
        case TextAlign::Left: return "left";
        case TextAlign::Center: return "center";
        case TextAlign::Right: return "right";
        case TextAlign::Justify: return "justify";
    }
    return "left";
}

// ============================================================================
// Color
// ============================================================================

std::optional<Color> parse_color(const String& value) {
    String trimmed = value.trim().to_lowercase();

    static const std::unordered_map<std::string, Color> named_colors = {
        {"black", Color::black()},
        {"white", Color::white()},
        {"red", Color{255, 0, 0}},
        {"green", Color{0, 128, 0}},
        {"blue", Color{0, 0, 255}},
        {"yellow", Color{255, 255, 0}},
        {"gray", Color{128, 128, 128}},
        {"grey", Color{128, 128, 128}},
        {"silver", Color{192, 192, 192}},
        {"navy", Color{0, 0, 128}},
        {"purple", Color{128, 0, 128}},
        {"orange", Color{255, 165, 0}},
        {"transparent", Color::transparent()},
    };

    auto it = named_colors.find(trimmed.std_string());
    if (it != named_colors.end()) {
        return it->second;
    }

    if (trimmed.starts_with("#"_s)) {
        String hex = trimmed.substring(1);
        for (char c : hex) {
            if (!unicode::is_ascii_hex_digit(static_cast<unicode::CodePoint>(c))) {
                return std::nullopt;
            }
        }
        switch (hex.size()) {
            case 3:
                return Color{hex_nibble(hex, 0), hex_nibble(hex, 1), hex_nibble(hex, 2)};
            case 4:
                return Color{hex_nibble(hex, 0), hex_nibble(hex, 1), hex_nibble(hex, 2), hex_nibble(hex, 3)};
            case 6:
                return Color{hex_byte(hex, 0), hex_byte(hex, 2), hex_byte(hex, 4)};
            case 8:
                return Color{hex_byte(hex, 0), hex_byte(hex, 2), hex_byte(hex, 4), hex_byte(hex, 6)};
            default:
                return std::nullopt;
        }
    }

    // rgb(r, g, b) with integer channels
    if (trimmed.starts_with("rgb("_s) && trimmed.size() > 5 && trimmed[trimmed.size() - 1] == ')') {
        auto parts = trimmed.substring(4, trimmed.size() - 5).split(',');
        if (parts.size() != 3) {
            return std::nullopt;
        }
        auto r = parse_channel(parts[0]);
        auto g = parse_channel(parts[1]);
        auto b = parse_channel(parts[2]);
        if (!r || !g || !b) {
            return std::nullopt;
        }
        return Color{*r, *g, *b};
    }

    return std::nullopt;
}

// ============================================================================
// StyleDescriptor
// ============================================================================

std::optional<i32> parse_font_size(const String& value) {
    String trimmed = value.trim();
    if (trimmed.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    f64 size = std::strtod(trimmed.c_str(), &end);
    if (end != trimmed.c_str() + trimmed.size() || !std::isfinite(size)) {
        return std::nullopt;
    }
    size = std::clamp(size, static_cast<f64>(StyleDescriptor::MIN_FONT_SIZE),
                      static_cast<f64>(StyleDescriptor::MAX_FONT_SIZE));
    return static_cast<i32>(size);
}

i32 StyleDescriptor::clamp_font_size(i32 size) {
    return std::clamp(size, MIN_FONT_SIZE, MAX_FONT_SIZE);
}

text::FontDescription StyleDescriptor::font() const {
    text::FontDescription desc;
    desc.family = text::DEFAULT_FONT_FAMILY;
    desc.size = static_cast<f32>(font_size);
    desc.bold = bold;
    desc.italic = italic;
    return desc;
}

Color StyleDescriptor::resolved_color() const {
    if (auto parsed = parse_color(color)) {
        return *parsed;
    }
    logging::get("canvas").warn((String("invalid color '") + color + "', using black").view());
    return Color::black();
}

bool StyleDescriptor::operator==(const StyleDescriptor& other) const {
    return bold == other.bold &&
           italic == other.italic &&
           underline == other.underline &&
           font_size == other.font_size &&
           color == other.color &&
           align == other.align;
}

} // namespace glyphic::layout
