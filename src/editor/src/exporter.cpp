/**
 * Export pipeline
 */

#include "glyphic/editor/exporter.hpp"
#include "glyphic/core/logger.hpp"
#include "glyphic/render/rasterizer.hpp"
#include <string>

namespace glyphic::editor {

const char* export_status_name(ExportStatus status) {
    switch (status) {
        case ExportStatus::Exported: return "exported";
        case ExportStatus::NoSurface: return "no surface";
        case ExportStatus::EmptyDocument: return "empty document";
        case ExportStatus::EncodeFailed: return "encode failed";
        case ExportStatus::SaveFailed: return "save failed";
    }
    return "unknown";
}

String resolve_filename(const String& title, const ExportConfig& config) {
    if (title.empty()) {
        return config.default_basename + ".png";
    }

    std::string name = title.std_string();
    for (char& c : name) {
        if (c == '/' || c == '\\' || static_cast<u8>(c) < 0x20) {
            c = '_';
        }
    }
    return String(std::move(name)) + ".png";
}

// ============================================================================
// Exporter
// ============================================================================

Exporter::Exporter(canvas::Surface* surface, FileSaver& saver, ExportConfig config)
    : m_surface(surface)
    , m_saver(saver)
    , m_config(std::move(config)) {}

ExportStatus Exporter::export_png(const String& text,
                                  const layout::StyleDescriptor& style,
                                  const String& title) {
    return export_png(layout::Document::from_text(text), style, title);
}

ExportStatus Exporter::export_png(const layout::Document& document,
                                  const layout::StyleDescriptor& style,
                                  const String& title) {
    auto& log = logging::get("export");

    if (!m_surface) {
        log.debug("no drawing surface, skipping export");
        return ExportStatus::NoSurface;
    }
    if (document.is_empty()) {
        log.debug("document has no text, skipping export");
        return ExportStatus::EmptyDocument;
    }

    canvas::Surface& surface = *m_surface;

    // Wrap with the export font
    surface.set_font(style.font());
    auto measure = [&surface](const String& text) { return surface.measure_text(text); };
    layout::LayoutResult layout = layout::layout_document(document, style, measure, m_config.layout);
    if (layout.empty()) {
        log.debug("document wrapped to no lines, skipping export");
        return ExportStatus::EmptyDocument;
    }

    surface.resize(layout.surface_size(m_config.layout));

    render::Rasterizer rasterizer(m_config.layout);
    rasterizer.render(layout, style, surface);

    auto png = surface.encode_png();
    if (!png) {
        log.warn((String("PNG encoding failed: ") + png.error()).view());
        return ExportStatus::EncodeFailed;
    }

    String filename = resolve_filename(title, m_config);
    auto saved = m_saver.save(filename, png.value());
    if (!saved) {
        log.warn((String("saving '") + filename + "' failed: " + saved.error()).view());
        return ExportStatus::SaveFailed;
    }

    SizeI pixels = surface.pixel_size();
    log.info((String("exported ") + filename + " (" + std::to_string(layout.lines.size()) + " lines, " +
              std::to_string(pixels.width) + "x" + std::to_string(pixels.height) + " px, " +
              std::to_string(png.value().size()) + " bytes)").view());
    return ExportStatus::Exported;
}

} // namespace glyphic::editor
