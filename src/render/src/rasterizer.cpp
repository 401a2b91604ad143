/**
 * Rasterizer implementation
 */

#include "glyphic/render/rasterizer.hpp"
#include <type_traits>

namespace glyphic::render {

Rasterizer::Rasterizer(const layout::LayoutConfig& config)
    : m_config(config) {}

void Rasterizer::render(const layout::LayoutResult& layout,
                        const layout::StyleDescriptor& style,
                        canvas::Surface& surface) const {
    surface.set_font(style.font());
    surface.set_fill_color(style.resolved_color());
    surface.set_text_baseline(canvas::TextBaseline::Top);

    auto measure = [&surface](const String& text) { return surface.measure_text(text); };
    DisplayListBuilder builder(measure, style, m_config);
    execute(builder.build(layout), surface);
}

void Rasterizer::execute(const DisplayList& list, canvas::Surface& surface) {
    for (const auto& command : list) {
        std::visit([&surface](const auto& cmd) {
            using T = std::decay_t<decltype(cmd)>;
            if constexpr (std::is_same_v<T, DrawTextCommand>) {
                surface.fill_text(cmd.text, cmd.position);
            } else if constexpr (std::is_same_v<T, DrawLineCommand>) {
                surface.stroke_line(cmd.from, cmd.to, cmd.color, cmd.width);
            }
        }, command);
    }
}

} // namespace glyphic::render
