#pragma once

#include "glyphic/canvas/surface.hpp"
#include "glyphic/editor/file_saver.hpp"
#include "glyphic/layout/style.hpp"
#include "glyphic/layout/text_layout.hpp"

namespace glyphic::editor {

// ============================================================================
// Export Configuration
// ============================================================================

struct ExportConfig {
    /**
     * @brief Page geometry shared by wrapping and drawing
     */
    layout::LayoutConfig layout;

    /**
     * @brief File name stem used when the title is empty
     */
    String default_basename{"text-editor-export"};
};

enum class ExportStatus : u8 {
    Exported,
    NoSurface,      // nothing to draw into
    EmptyDocument,  // no non-blank line
    EncodeFailed,
    SaveFailed
};

[[nodiscard]] const char* export_status_name(ExportStatus status);

/// "{title}.png", or the default basename when the title is empty.
/// Path separators and control characters in the title become '_'.
[[nodiscard]] String resolve_filename(const String& title, const ExportConfig& config = {});

// ============================================================================
// Exporter
// ============================================================================

/// Runs measure, wrap, size, rasterize, encode and save in one call.
///
/// A missing surface or an empty document make the export a no-op and
/// nothing reaches the saver. Every call recomputes everything, so the same
/// input produces the same bytes.
class Exporter {
public:
    Exporter(canvas::Surface* surface, FileSaver& saver, ExportConfig config = {});

    ExportStatus export_png(const layout::Document& document,
                            const layout::StyleDescriptor& style,
                            const String& title = {});

    ExportStatus export_png(const String& text,
                            const layout::StyleDescriptor& style,
                            const String& title = {});

    [[nodiscard]] const ExportConfig& config() const { return m_config; }

private:
    canvas::Surface* m_surface;
    FileSaver& m_saver;
    ExportConfig m_config;
};

} // namespace glyphic::editor
