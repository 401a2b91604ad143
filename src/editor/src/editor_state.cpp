/**
 * Editor state actions
 */

#include "glyphic/editor/editor_state.hpp"
#include "glyphic/core/logger.hpp"
#include <algorithm>

namespace glyphic::editor {

void EditorState::change_font_size(i32 delta) {
    constexpr i32 span = layout::StyleDescriptor::MAX_FONT_SIZE - layout::StyleDescriptor::MIN_FONT_SIZE;
    delta = std::clamp(delta, -span, span);
    m_style.font_size = layout::StyleDescriptor::clamp_font_size(m_style.font_size + delta);
}

void EditorState::set_font_size(i32 size) {
    m_style.font_size = layout::StyleDescriptor::clamp_font_size(size);
}

void EditorState::change_color(const String& color) {
    if (!layout::parse_color(color)) {
        logging::get("canvas").warn((String("color '") + color + "' is not recognized").view());
    }
    m_style.color = color;
}

ExportStatus EditorState::export_png(Exporter& exporter) const {
    return exporter.export_png(m_text, style(), m_title);
}

} // namespace glyphic::editor
