#pragma once

#include "glyphic/core/types.hpp"
#include "glyphic/core/string.hpp"
#include "glyphic/text/font.hpp"
#include <optional>

namespace glyphic::layout {

// ============================================================================
// Text Alignment
// ============================================================================

enum class TextAlign : u8 {
    Left,
    Center,
    Right,
    Justify
};

/// Accepts "left", "center", "right" and "justify" in any case
[[nodiscard]] std::optional<TextAlign> parse_alignment(const String& value);
[[nodiscard]] const char* alignment_name(TextAlign align);

/// Parse "#rgb", "#rgba", "#rrggbb", "#rrggbbaa", "rgb(r, g, b)" or a basic
/// color keyword
[[nodiscard]] std::optional<Color> parse_color(const String& value);

/// Parse a decimal font size, clamped to the allowed range and truncated.
/// Non-numeric and non-finite values give nullopt.
[[nodiscard]] std::optional<i32> parse_font_size(const String& value);

// ============================================================================
// Style Descriptor
// ============================================================================

/// Style applied uniformly to a whole document
struct StyleDescriptor {
    static constexpr i32 MIN_FONT_SIZE = 8;
    static constexpr i32 MAX_FONT_SIZE = 72;
    static constexpr i32 DEFAULT_FONT_SIZE = 11;

    bool bold{false};
    bool italic{false};
    bool underline{false};
    i32 font_size{DEFAULT_FONT_SIZE};
    String color{"#737373"};
    TextAlign align{TextAlign::Left};

    [[nodiscard]] static i32 clamp_font_size(i32 size);

    /// Font for the whole document, family fixed to the default family list
    [[nodiscard]] text::FontDescription font() const;

    /// Parsed fill color; an unparseable value falls back to black
    [[nodiscard]] Color resolved_color() const;

    [[nodiscard]] bool operator==(const StyleDescriptor& other) const;
};

} // namespace glyphic::layout
