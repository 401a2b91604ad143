#pragma once

#include "glyphic/core/types.hpp"
#include "glyphic/core/string.hpp"
#include <memory>
#include <vector>
#include <unordered_map>

namespace glyphic::text {

// ============================================================================
// Font Metrics
// ============================================================================

struct FontMetrics {
    f32 ascender{0};       // Distance from baseline to top
    f32 descender{0};      // Distance from baseline to bottom (negative)
    f32 line_gap{0};       // Extra spacing between lines
    f32 units_per_em{0};   // Font units per em

    [[nodiscard]] f32 line_height() const { return ascender - descender + line_gap; }
};

// ============================================================================
// Glyph Bitmap
// ============================================================================

struct GlyphBitmap {
    std::vector<u8> pixels;  // Coverage, one byte per pixel
    i32 width{0};
    i32 height{0};
    i32 bearing_x{0};        // Offset from pen position to left edge
    i32 bearing_y{0};        // Offset from baseline up to top edge
    f32 advance{0};
};

// ============================================================================
// Font Description
// ============================================================================

/// Generic family list used for exported text
inline constexpr const char* DEFAULT_FONT_FAMILY = "system-ui, -apple-system, sans-serif";

struct FontDescription {
    String family{DEFAULT_FONT_FAMILY};  ///< Comma separated family list
    f32 size{16.0f};                     ///< Pixel size
    bool bold{false};
    bool italic{false};

    [[nodiscard]] bool operator==(const FontDescription& other) const;

    /// Same face at size * factor
    [[nodiscard]] FontDescription scaled(f32 factor) const;

    /// Canvas style font string, e.g. "italic bold 11px system-ui, -apple-system, sans-serif"
    [[nodiscard]] String to_string() const;
};

struct FontDescriptionHash {
    std::size_t operator()(const FontDescription& desc) const;
};

// ============================================================================
// Font
// ============================================================================

class Font {
public:
    virtual ~Font() = default;

    [[nodiscard]] virtual const FontDescription& description() const = 0;
    [[nodiscard]] virtual FontMetrics metrics() const = 0;

    [[nodiscard]] virtual bool has_glyph(unicode::CodePoint cp) const = 0;

    /// Render a glyph; subpixel_x in [0, 1) shifts the outline before scan conversion
    [[nodiscard]] virtual std::optional<GlyphBitmap> rasterize_glyph(
        unicode::CodePoint cp, f32 subpixel_x = 0.0f) const = 0;

    [[nodiscard]] virtual f32 get_kerning(unicode::CodePoint left, unicode::CodePoint right) const = 0;

    // Text measurement in pixels
    [[nodiscard]] virtual f32 measure_text(const String& text) const = 0;
    [[nodiscard]] virtual f32 measure_char(unicode::CodePoint cp) const = 0;
};

// ============================================================================
// Font Context - Manages font loading and caching
// ============================================================================

class FontContext {
public:
    FontContext();
    ~FontContext();

    FontContext(const FontContext&) = delete;
    FontContext& operator=(const FontContext&) = delete;

    /// False when the FreeType library could not be initialized
    [[nodiscard]] bool is_valid() const;

    /// Load a specific face file for a description, synthesizing any
    /// weight or slant the face lacks
    [[nodiscard]] Result<std::shared_ptr<Font>, String> load_font(
        const String& path, const FontDescription& desc);

    /// Resolve a description against registered faces. Returns nullptr when
    /// no face at all is registered.
    [[nodiscard]] std::shared_ptr<Font> get_font(const FontDescription& desc);

    void register_font(const String& family, const String& path, bool bold = false, bool italic = false);

    /// Register every face found under the system font directories.
    /// Returns the number of faces registered.
    usize register_system_fonts();

    /// Register every face found under one directory (recursively)
    usize register_font_directory(const String& directory);

    [[nodiscard]] bool has_family(const String& family) const;
    [[nodiscard]] usize registered_face_count() const;

    void clear_cache();

    static std::vector<String> get_system_font_paths();

private:
    struct FaceEntry {
        String path;
        bool bold{false};
        bool italic{false};
    };

    [[nodiscard]] const FaceEntry* find_face(const String& family, bool bold, bool italic) const;

    struct FontData;
    std::unique_ptr<FontData> m_data;

    std::unordered_map<FontDescription, std::shared_ptr<Font>, FontDescriptionHash> m_cache;
    std::unordered_map<String, std::vector<FaceEntry>, StringHash> m_registered_fonts;  // lowercase family -> faces
    std::vector<String> m_registration_order;
};

// ============================================================================
// Font Matching
// ============================================================================

namespace font_matching {

/// Map generic CSS families onto concrete families
[[nodiscard]] String resolve_generic_family(const String& family);

/// Split "a, 'b c', sans-serif" into unquoted entries
[[nodiscard]] std::vector<String> parse_family_list(const String& families);

} // namespace font_matching

} // namespace glyphic::text
