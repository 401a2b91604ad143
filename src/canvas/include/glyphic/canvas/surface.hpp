#pragma once

#include "glyphic/core/types.hpp"
#include "glyphic/core/string.hpp"
#include "glyphic/text/font.hpp"
#include <vector>

namespace glyphic::canvas {

// ============================================================================
// Text Baseline
// ============================================================================

enum class TextBaseline : u8 {
    Alphabetic,  // y is the typographic baseline
    Top          // y is the top of the glyph box
};

// ============================================================================
// Surface
// ============================================================================

/// 2D drawing surface the text engine renders into.
///
/// Coordinates are logical units; an implementation maps them to physical
/// pixels with its device scale. Drawing state (font, fill color, baseline)
/// behaves like a canvas context: resize() clears the pixels and resets the
/// state to its defaults.
class Surface {
public:
    virtual ~Surface() = default;

    /// Resize to a logical size, clearing contents and drawing state
    virtual void resize(SizeF logical_size) = 0;

    [[nodiscard]] virtual SizeF logical_size() const = 0;
    [[nodiscard]] virtual SizeI pixel_size() const = 0;
    [[nodiscard]] virtual f32 device_scale() const = 0;

    // Drawing state
    virtual void set_font(const text::FontDescription& font) = 0;
    [[nodiscard]] virtual const text::FontDescription& font() const = 0;
    virtual void set_fill_color(const Color& color) = 0;
    virtual void set_text_baseline(TextBaseline baseline) = 0;

    /// Width of text in logical units under the current font
    [[nodiscard]] virtual f32 measure_text(const String& text) = 0;

    /// Draw text with the current font and fill color
    virtual void fill_text(const String& text, PointF origin) = 0;

    virtual void stroke_line(PointF from, PointF to, const Color& color, f32 width) = 0;

    /// Encode the current pixels as PNG
    [[nodiscard]] virtual Result<std::vector<u8>, String> encode_png() const = 0;

protected:
    Surface() = default;
};

} // namespace glyphic::canvas
