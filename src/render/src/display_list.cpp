/**
 * Display List implementation
 */

#include "glyphic/render/display_list.hpp"

namespace glyphic::render {

// ============================================================================
// DisplayListBuilder implementation
// ============================================================================

DisplayListBuilder::DisplayListBuilder(text::MeasureFn measure, const layout::StyleDescriptor& style,
                                       const layout::LayoutConfig& config)
    : m_measure(std::move(measure))
    , m_style(style)
    , m_config(config)
    , m_color(style.resolved_color())
{
}

DisplayList DisplayListBuilder::build(const layout::LayoutResult& layout) {
    m_display_list.clear();

    for (usize i = 0; i < layout.lines.size(); ++i) {
        f32 y = m_config.padding + static_cast<f32>(i) * layout.line_height;
        place_line(layout.lines[i], y, i + 1 == layout.lines.size());
    }

    return std::move(m_display_list);
}

void DisplayListBuilder::place_line(const String& line, f32 y, bool is_last) {
    if (m_style.align == layout::TextAlign::Justify && !is_last && !line.is_blank()) {
        auto words = line.trim().split_whitespace();
        if (words.size() > 1) {
            place_justified(words, y);
        } else {
            add_text(line, m_config.padding, y, m_measure(line));
        }
        return;
    }

    f32 width = m_measure(line);
    f32 x = m_config.padding;
    if (m_style.align == layout::TextAlign::Center) {
        x = (m_config.fixed_width - width) / 2.0f;
    } else if (m_style.align == layout::TextAlign::Right) {
        x = m_config.fixed_width - width - m_config.padding;
    }
    add_text(line, x, y, width);
}

void DisplayListBuilder::place_justified(const std::vector<String>& words, f32 y) {
    std::vector<f32> widths;
    widths.reserve(words.size());
    f32 total = 0;
    for (const auto& word : words) {
        widths.push_back(m_measure(word));
        total += widths.back();
    }

    f32 space = (m_config.available_width() - total) / static_cast<f32>(words.size() - 1);

    f32 x = m_config.padding;
    for (usize i = 0; i < words.size(); ++i) {
        add_text(words[i], x, y, widths[i]);
        x += widths[i] + space;
    }
}

void DisplayListBuilder::add_text(const String& text, f32 x, f32 y, f32 width) {
    m_display_list.push(DrawTextCommand{{x, y}, text});
    if (m_style.underline) {
        add_underline(x, y, width);
    }
}

void DisplayListBuilder::add_underline(f32 x, f32 y, f32 width) {
    f32 line_y = y + static_cast<f32>(m_style.font_size) + 2.0f;
    m_display_list.push(DrawLineCommand{{x, line_y}, {x + width, line_y}, m_color, 1.0f});
}

} // namespace glyphic::render
