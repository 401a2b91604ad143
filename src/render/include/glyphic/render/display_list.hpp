#pragma once

#include "glyphic/core/types.hpp"
#include "glyphic/core/string.hpp"
#include "glyphic/layout/style.hpp"
#include "glyphic/layout/text_layout.hpp"
#include "glyphic/text/line_breaker.hpp"
#include <variant>
#include <vector>

namespace glyphic::render {

// ============================================================================
// Display Commands
// ============================================================================

/// Text drawn with the surface's current font and fill color, origin at the
/// top of the glyph box
struct DrawTextCommand {
    PointF position;
    String text;
};

struct DrawLineCommand {
    PointF from;
    PointF to;
    Color color;
    f32 width;
};

using DisplayCommand = std::variant<
    DrawTextCommand,
    DrawLineCommand
>;

// ============================================================================
// Display List
// ============================================================================

class DisplayList {
public:
    DisplayList() = default;

    void push(const DisplayCommand& cmd) { m_commands.push_back(cmd); }

    template<typename T>
    void push(T&& cmd) {
        m_commands.push_back(std::forward<T>(cmd));
    }

    [[nodiscard]] const std::vector<DisplayCommand>& commands() const { return m_commands; }
    [[nodiscard]] usize size() const { return m_commands.size(); }
    [[nodiscard]] bool empty() const { return m_commands.empty(); }

    void clear() { m_commands.clear(); }

    auto begin() const { return m_commands.begin(); }
    auto end() const { return m_commands.end(); }

private:
    std::vector<DisplayCommand> m_commands;
};

// ============================================================================
// Display List Builder
// ============================================================================

/// Places wrapped lines horizontally and emits text and underline commands.
///
/// Line i sits at y = padding + i * line_height. Justified lines spread their
/// words over the available width, except the last line of the document and
/// lines holding a single word, which are drawn at the left padding.
class DisplayListBuilder {
public:
    DisplayListBuilder(text::MeasureFn measure, const layout::StyleDescriptor& style,
                       const layout::LayoutConfig& config = {});

    [[nodiscard]] DisplayList build(const layout::LayoutResult& layout);

private:
    void place_line(const String& line, f32 y, bool is_last);
    void place_justified(const std::vector<String>& words, f32 y);
    void add_text(const String& text, f32 x, f32 y, f32 width);
    void add_underline(f32 x, f32 y, f32 width);

    text::MeasureFn m_measure;
    layout::StyleDescriptor m_style;
    layout::LayoutConfig m_config;
    Color m_color;
    DisplayList m_display_list;
};

} // namespace glyphic::render
