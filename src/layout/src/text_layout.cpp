/**
 * Document splitting and text layout
 */

#include "glyphic/layout/text_layout.hpp"

namespace glyphic::layout {

// ============================================================================
// Document
// ============================================================================

Document::Document(std::vector<String> lines) {
    for (auto& line : lines) {
        if (!line.is_blank()) {
            m_lines.push_back(std::move(line));
        }
    }
}

Document Document::from_text(const String& text) {
    std::vector<String> lines;
    const char* data = text.data();
    usize size = text.size();
    usize start = 0;
    for (usize i = 0; i < size; ++i) {
        if (data[i] != '\n' && data[i] != '\r') {
            continue;
        }
        lines.emplace_back(data + start, i - start);
        if (data[i] == '\r' && i + 1 < size && data[i + 1] == '\n') {
            ++i;
        }
        start = i + 1;
    }
    lines.emplace_back(data + start, size - start);

    return Document(std::move(lines));
}

// ============================================================================
// Layout Result
// ============================================================================

f32 LayoutResult::text_height() const {
    if (lines.empty()) {
        return 0;
    }
    return static_cast<f32>(lines.size()) * line_height - (line_height - font_size);
}

SizeF LayoutResult::surface_size(const LayoutConfig& config) const {
    return {config.fixed_width, text_height() + 2.0f * config.padding};
}

LayoutResult layout_document(
    const Document& document,
    const StyleDescriptor& style,
    const text::MeasureFn& measure,
    const LayoutConfig& config) {

    LayoutResult result;
    result.font_size = static_cast<f32>(style.font_size);
    result.line_height = result.font_size * config.line_height_factor;
    result.lines = text::wrap(document.lines(), measure, config.available_width());
    return result;
}

} // namespace glyphic::layout
