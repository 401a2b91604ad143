#pragma once

#include "glyphic/core/string.hpp"
#include "glyphic/editor/exporter.hpp"
#include "glyphic/layout/style.hpp"

namespace glyphic::editor {

// ============================================================================
// Editor State
// ============================================================================

/// Document text, title and the single style applied to all of it.
///
/// State changes only through the actions below; exports read a snapshot.
class EditorState {
public:
    EditorState() = default;

    // Style actions
    void toggle_bold() { m_style.bold = !m_style.bold; }
    void toggle_italic() { m_style.italic = !m_style.italic; }
    void toggle_underline() { m_style.underline = !m_style.underline; }
    void set_alignment(layout::TextAlign align) { m_style.align = align; }

    /// Adjust the font size by delta, clamped to the supported range
    void change_font_size(i32 delta);
    void set_font_size(i32 size);

    /// Invalid colors are kept as typed and render black
    void change_color(const String& color);

    // Content actions
    void set_text(const String& text) { m_text = text; }
    void set_title(const String& title) { m_title = title; }

    [[nodiscard]] const String& text() const { return m_text; }
    [[nodiscard]] const String& title() const { return m_title; }

    /// Copy of the current style
    [[nodiscard]] layout::StyleDescriptor style() const { return m_style; }

    ExportStatus export_png(Exporter& exporter) const;

private:
    String m_text;
    String m_title;
    layout::StyleDescriptor m_style;
};

} // namespace glyphic::editor
