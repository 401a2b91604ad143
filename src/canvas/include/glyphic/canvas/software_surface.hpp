#pragma once

#include "glyphic/canvas/surface.hpp"
#include "glyphic/text/font.hpp"
#include <memory>
#include <vector>

namespace glyphic::canvas {

// ============================================================================
// Surface Configuration
// ============================================================================

struct SurfaceConfig {
    /**
     * @brief Physical pixels per logical unit
     */
    f32 device_scale = 1.0f;

    /**
     * @brief Font used after construction and after every resize
     */
    text::FontDescription default_font{"sans-serif", 10.0f, false, false};
};

// ============================================================================
// Software Surface
// ============================================================================

/// CPU rasterizer over an RGBA frame buffer.
///
/// Pixels are stored as 0xAARRGGBB with straight (non-premultiplied) alpha
/// and composited source-over. Glyphs come from FreeType through the
/// FontContext; a second font instance at size * device_scale is used for
/// drawing so that layout stays in logical units.
class SoftwareSurface : public Surface {
public:
    /// Returns nullptr when no font face can be resolved, since such a
    /// surface could neither measure nor draw
    [[nodiscard]] static std::unique_ptr<SoftwareSurface> create(
        text::FontContext& fonts,
        const SurfaceConfig& config = {});

    SoftwareSurface(text::FontContext& fonts, const SurfaceConfig& config);
    ~SoftwareSurface() override;

    void resize(SizeF logical_size) override;

    [[nodiscard]] SizeF logical_size() const override { return m_logical_size; }
    [[nodiscard]] SizeI pixel_size() const override { return {m_width, m_height}; }
    [[nodiscard]] f32 device_scale() const override { return m_config.device_scale; }

    void set_font(const text::FontDescription& font) override;
    [[nodiscard]] const text::FontDescription& font() const override { return m_font_desc; }
    void set_fill_color(const Color& color) override { m_fill_color = color; }
    void set_text_baseline(TextBaseline baseline) override { m_baseline = baseline; }

    [[nodiscard]] f32 measure_text(const String& text) override;
    void fill_text(const String& text, PointF origin) override;
    void stroke_line(PointF from, PointF to, const Color& color, f32 width) override;

    [[nodiscard]] Result<std::vector<u8>, String> encode_png() const override;

    // Frame buffer access
    [[nodiscard]] const std::vector<u32>& frame_buffer() const noexcept { return m_frame_buffer; }
    [[nodiscard]] Color pixel_at(i32 x, i32 y) const;

    /// RGBA bytes, row-major, no padding
    [[nodiscard]] std::vector<u8> to_rgba() const;

private:
    void reset_state();
    void blend_pixel(i32 x, i32 y, const Color& color, f32 coverage);
    void fill_coverage_rect(f32 x0, f32 y0, f32 x1, f32 y1, const Color& color);
    void draw_bresenham_line(PointF from, PointF to, const Color& color);
    void blit_glyph(const text::GlyphBitmap& glyph, i32 x, i32 y, const Color& color);

    text::FontContext& m_fonts;
    SurfaceConfig m_config;

    SizeF m_logical_size;
    i32 m_width{0};
    i32 m_height{0};
    std::vector<u32> m_frame_buffer;

    text::FontDescription m_font_desc;
    std::shared_ptr<text::Font> m_font;         // logical size, for measuring
    std::shared_ptr<text::Font> m_device_font;  // physical size, for drawing
    Color m_fill_color{Color::black()};
    TextBaseline m_baseline{TextBaseline::Alphabetic};
};

} // namespace glyphic::canvas
