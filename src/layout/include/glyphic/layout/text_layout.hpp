#pragma once

#include "glyphic/core/types.hpp"
#include "glyphic/core/string.hpp"
#include "glyphic/layout/style.hpp"
#include "glyphic/text/line_breaker.hpp"
#include <vector>

namespace glyphic::layout {

// ============================================================================
// Layout Configuration
// ============================================================================

struct LayoutConfig {
    /**
     * @brief Logical width of the exported image
     */
    f32 fixed_width = 600.0f;

    /**
     * @brief Gap kept on every side of the text
     */
    f32 padding = 1.0f;

    /**
     * @brief Line advance as a multiple of the font size
     */
    f32 line_height_factor = 1.5f;

    /// Maximum width a wrapped line may measure
    [[nodiscard]] f32 available_width() const { return fixed_width - 2.0f * padding; }
};

// ============================================================================
// Document
// ============================================================================

/// Raw lines of a plain text document. Lines that contain only whitespace
/// are dropped, so an all-blank text is an empty document.
class Document {
public:
    Document() = default;
    explicit Document(std::vector<String> lines);

    /// Split on "\n", "\r\n" and lone "\r"
    [[nodiscard]] static Document from_text(const String& text);

    [[nodiscard]] const std::vector<String>& lines() const { return m_lines; }
    [[nodiscard]] bool is_empty() const { return m_lines.empty(); }

private:
    std::vector<String> m_lines;
};

// ============================================================================
// Layout Result
// ============================================================================

struct LayoutResult {
    std::vector<String> lines;
    f32 font_size{0};
    f32 line_height{0};

    /// Height from the top of the first line to the bottom of the last
    /// glyph box: count * line_height - (line_height - font_size)
    [[nodiscard]] f32 text_height() const;

    /// Logical surface size with padding above and below
    [[nodiscard]] SizeF surface_size(const LayoutConfig& config) const;

    [[nodiscard]] bool empty() const { return lines.empty(); }
};

/// Wrap a document for a style. measure must use the style's font.
[[nodiscard]] LayoutResult layout_document(
    const Document& document,
    const StyleDescriptor& style,
    const text::MeasureFn& measure,
    const LayoutConfig& config = {});

} // namespace glyphic::layout
