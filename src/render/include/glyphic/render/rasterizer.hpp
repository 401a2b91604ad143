#pragma once

#include "glyphic/canvas/surface.hpp"
#include "glyphic/layout/style.hpp"
#include "glyphic/layout/text_layout.hpp"
#include "glyphic/render/display_list.hpp"

namespace glyphic::render {

// ============================================================================
// Rasterizer
// ============================================================================

/// Draws laid out text into a surface that has already been resized.
///
/// Font, fill color and top baseline are set once before any command is
/// replayed; resizing a surface resets them, so render() must come after
/// the resize.
class Rasterizer {
public:
    explicit Rasterizer(const layout::LayoutConfig& config = {});

    void render(const layout::LayoutResult& layout,
                const layout::StyleDescriptor& style,
                canvas::Surface& surface) const;

    /// Replay a prepared list without touching the drawing state
    static void execute(const DisplayList& list, canvas::Surface& surface);

private:
    layout::LayoutConfig m_config;
};

} // namespace glyphic::render
