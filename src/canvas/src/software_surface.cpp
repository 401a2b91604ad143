/**
 * Software Surface Implementation
 */

#include "glyphic/canvas/software_surface.hpp"
#include "glyphic/canvas/png_encoder.hpp"
#include "glyphic/core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace glyphic::canvas {

namespace {

f32 overlap(f32 a0, f32 a1, f32 b0, f32 b1) {
    return std::max(0.0f, std::min(a1, b1) - std::max(a0, b0));
}

u8 to_channel(f32 value) {
    return static_cast<u8>(std::clamp(std::lround(value * 255.0f), 0L, 255L));
}

} // namespace

// ============================================================================
// SoftwareSurface
// ============================================================================

std::unique_ptr<SoftwareSurface> SoftwareSurface::create(
    text::FontContext& fonts,
    const SurfaceConfig& config) {

    if (!fonts.is_valid() || !fonts.get_font(config.default_font)) {
        logging::get("canvas").warn("no usable font face, software surface unavailable");
        return nullptr;
    }
    return std::make_unique<SoftwareSurface>(fonts, config);
}

SoftwareSurface::SoftwareSurface(text::FontContext& fonts, const SurfaceConfig& config)
    : m_fonts(fonts)
    , m_config(config)
{
    if (m_config.device_scale <= 0.0f) {
        m_config.device_scale = 1.0f;
    }
    reset_state();
}

SoftwareSurface::~SoftwareSurface() = default;

void SoftwareSurface::resize(SizeF logical_size) {
    m_logical_size = logical_size;

    // Fractional sizes truncate, as canvas dimensions do
    m_width = std::max(0, static_cast<i32>(logical_size.width * m_config.device_scale));
    m_height = std::max(0, static_cast<i32>(logical_size.height * m_config.device_scale));

    m_frame_buffer.assign(static_cast<usize>(m_width) * static_cast<usize>(m_height), 0u);
    reset_state();

    logging::get("canvas").debug(
        (String("resized to ") + std::to_string(m_width) + "x" + std::to_string(m_height) + " px").view());
}

void SoftwareSurface::reset_state() {
    m_fill_color = Color::black();
    m_baseline = TextBaseline::Alphabetic;
    set_font(m_config.default_font);
}

void SoftwareSurface::set_font(const text::FontDescription& font) {
    auto logical = m_fonts.get_font(font);
    auto device = m_fonts.get_font(font.scaled(m_config.device_scale));
    if (!logical || !device) {
        logging::get("canvas").warn((String("ignoring unusable font '") + font.to_string() + "'").view());
        return;
    }
    m_font_desc = font;
    m_font = std::move(logical);
    m_device_font = std::move(device);
}

f32 SoftwareSurface::measure_text(const String& text) {
    if (!m_font) {
        return 0;
    }
    return m_font->measure_text(text);
}

void SoftwareSurface::fill_text(const String& text, PointF origin) {
    if (!m_device_font || m_frame_buffer.empty()) {
        return;
    }

    const f32 scale = m_config.device_scale;
    f32 pen_x = origin.x * scale;
    f32 baseline_y = origin.y * scale;
    if (m_baseline == TextBaseline::Top) {
        baseline_y += m_device_font->metrics().ascender;
    }
    auto baseline_row = static_cast<i32>(std::lround(baseline_y));

    unicode::CodePoint previous = 0;
    bool first = true;
    for (unicode::CodePoint cp : text.code_points()) {
        if (!first) {
            pen_x += m_device_font->get_kerning(previous, cp);
        }

        f32 whole = std::floor(pen_x);
        if (auto glyph = m_device_font->rasterize_glyph(cp, pen_x - whole)) {
            blit_glyph(*glyph,
                       static_cast<i32>(whole) + glyph->bearing_x,
                       baseline_row - glyph->bearing_y,
                       m_fill_color);
            pen_x += glyph->advance;
        } else {
            pen_x += m_device_font->measure_char(cp);
        }

        previous = cp;
        first = false;
    }
}

void SoftwareSurface::stroke_line(PointF from, PointF to, const Color& color, f32 width) {
    if (m_frame_buffer.empty()) {
        return;
    }

    const f32 scale = m_config.device_scale;
    PointF p1 = from * scale;
    PointF p2 = to * scale;
    f32 half = std::max(width * scale, 0.0f) / 2.0f;

    if (p1.y == p2.y) {
        fill_coverage_rect(std::min(p1.x, p2.x), p1.y - half,
                           std::max(p1.x, p2.x), p1.y + half, color);
    } else if (p1.x == p2.x) {
        fill_coverage_rect(p1.x - half, std::min(p1.y, p2.y),
                           p1.x + half, std::max(p1.y, p2.y), color);
    } else {
        draw_bresenham_line(p1, p2, color);
    }
}

Result<std::vector<u8>, String> SoftwareSurface::encode_png() const {
    auto rgba = to_rgba();
    return canvas::encode_png(rgba.data(), m_width, m_height, static_cast<usize>(m_width) * 4);
}

Color SoftwareSurface::pixel_at(i32 x, i32 y) const {
    if (x < 0 || x >= m_width || y < 0 || y >= m_height) {
        return Color::transparent();
    }
    u32 pixel = m_frame_buffer[static_cast<usize>(y) * static_cast<usize>(m_width) + static_cast<usize>(x)];
    return Color(static_cast<u8>((pixel >> 16) & 0xFF),
                 static_cast<u8>((pixel >> 8) & 0xFF),
                 static_cast<u8>(pixel & 0xFF),
                 static_cast<u8>((pixel >> 24) & 0xFF));
}

std::vector<u8> SoftwareSurface::to_rgba() const {
    std::vector<u8> bytes;
    bytes.reserve(m_frame_buffer.size() * 4);
    for (u32 pixel : m_frame_buffer) {
        bytes.push_back(static_cast<u8>((pixel >> 16) & 0xFF));
        bytes.push_back(static_cast<u8>((pixel >> 8) & 0xFF));
        bytes.push_back(static_cast<u8>(pixel & 0xFF));
        bytes.push_back(static_cast<u8>((pixel >> 24) & 0xFF));
    }
    return bytes;
}

// ============================================================================
// Helper Functions
// ============================================================================

void SoftwareSurface::blend_pixel(i32 x, i32 y, const Color& color, f32 coverage) {
    if (x < 0 || x >= m_width || y < 0 || y >= m_height || coverage <= 0.0f) {
        return;
    }

    usize index = static_cast<usize>(y) * static_cast<usize>(m_width) + static_cast<usize>(x);
    u32 existing = m_frame_buffer[index];

    f32 dst_r = static_cast<f32>((existing >> 16) & 0xFF) / 255.0f;
    f32 dst_g = static_cast<f32>((existing >> 8) & 0xFF) / 255.0f;
    f32 dst_b = static_cast<f32>(existing & 0xFF) / 255.0f;
    f32 dst_a = static_cast<f32>((existing >> 24) & 0xFF) / 255.0f;

    f32 src_a = static_cast<f32>(color.a) / 255.0f * std::min(coverage, 1.0f);
    f32 src_r = static_cast<f32>(color.r) / 255.0f;
    f32 src_g = static_cast<f32>(color.g) / 255.0f;
    f32 src_b = static_cast<f32>(color.b) / 255.0f;

    // Source-over with straight alpha
    f32 out_a = src_a + dst_a * (1.0f - src_a);
    if (out_a <= 0.0f) {
        m_frame_buffer[index] = 0;
        return;
    }
    f32 out_r = (src_r * src_a + dst_r * dst_a * (1.0f - src_a)) / out_a;
    f32 out_g = (src_g * src_a + dst_g * dst_a * (1.0f - src_a)) / out_a;
    f32 out_b = (src_b * src_a + dst_b * dst_a * (1.0f - src_a)) / out_a;

    m_frame_buffer[index] = (static_cast<u32>(to_channel(out_a)) << 24) |
                            (static_cast<u32>(to_channel(out_r)) << 16) |
                            (static_cast<u32>(to_channel(out_g)) << 8) |
                            static_cast<u32>(to_channel(out_b));
}

void SoftwareSurface::fill_coverage_rect(f32 x0, f32 y0, f32 x1, f32 y1, const Color& color) {
    i32 px0 = std::max(0, static_cast<i32>(std::floor(x0)));
    i32 py0 = std::max(0, static_cast<i32>(std::floor(y0)));
    i32 px1 = std::min(m_width, static_cast<i32>(std::ceil(x1)));
    i32 py1 = std::min(m_height, static_cast<i32>(std::ceil(y1)));

    for (i32 y = py0; y < py1; ++y) {
        f32 cover_y = overlap(static_cast<f32>(y), static_cast<f32>(y + 1), y0, y1);
        for (i32 x = px0; x < px1; ++x) {
            f32 cover_x = overlap(static_cast<f32>(x), static_cast<f32>(x + 1), x0, x1);
            blend_pixel(x, y, color, cover_x * cover_y);
        }
    }
}

void SoftwareSurface::draw_bresenham_line(PointF from, PointF to, const Color& color) {
    i32 x1 = static_cast<i32>(from.x);
    i32 y1 = static_cast<i32>(from.y);
    i32 x2 = static_cast<i32>(to.x);
    i32 y2 = static_cast<i32>(to.y);

    i32 dx = std::abs(x2 - x1);
    i32 dy = std::abs(y2 - y1);
    i32 sx = (x1 < x2) ? 1 : -1;
    i32 sy = (y1 < y2) ? 1 : -1;
    i32 err = dx - dy;

    while (true) {
        blend_pixel(x1, y1, color, 1.0f);

        if (x1 == x2 && y1 == y2) break;

        i32 e2 = 2 * err;
        if (e2 > -dy) {
            err -= dy;
            x1 += sx;
        }
        if (e2 < dx) {
            err += dx;
            y1 += sy;
        }
    }
}

void SoftwareSurface::blit_glyph(const text::GlyphBitmap& glyph, i32 x, i32 y, const Color& color) {
    for (i32 row = 0; row < glyph.height; ++row) {
        for (i32 col = 0; col < glyph.width; ++col) {
            u8 coverage = glyph.pixels[static_cast<usize>(row) * static_cast<usize>(glyph.width) +
                                       static_cast<usize>(col)];
            if (coverage != 0) {
                blend_pixel(x + col, y + row, color, static_cast<f32>(coverage) / 255.0f);
            }
        }
    }
}

} // namespace glyphic::canvas
