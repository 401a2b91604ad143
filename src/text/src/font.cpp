/**
 * Font implementation backed by FreeType
 */

#include "glyphic/text/font.hpp"
#include "glyphic/core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_OUTLINE_H
#include FT_SYNTHESIS_H

namespace glyphic::text {

namespace {

// Load flags shared by measurement and rendering so both agree on advances
constexpr FT_Int32 LOAD_FLAGS = FT_LOAD_NO_HINTING | FT_LOAD_NO_BITMAP;

String format_pixels(f32 size) {
    f32 rounded = std::round(size);
    if (std::abs(size - rounded) < 0.001f) {
        return String(std::to_string(static_cast<i64>(rounded)));
    }
    std::string text = std::to_string(size);
    while (!text.empty() && text.back() == '0') {
        text.pop_back();
    }
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    return String(std::move(text));
}

bool is_plain_style(const String& style_name) {
    static const char* const decorated[] = {
        "light", "thin", "condensed", "narrow", "black", "extra",
        "semi", "medium", "heavy", "demi", "ultra"};
    String lower = style_name.to_lowercase();
    for (const char* word : decorated) {
        if (lower.std_string().find(word) != std::string::npos) {
            return false;
        }
    }
    return true;
}

bool is_font_file(const std::filesystem::path& path) {
    String ext = String(path.extension().string()).to_lowercase();
    return ext == ".ttf"_s || ext == ".otf"_s || ext == ".ttc"_s;
}

String expand_home(const String& path) {
    if (path.starts_with("~/"_s)) {
        if (const char* home = std::getenv("HOME")) {
            return String(home) + path.substring(1);
        }
    }
    return path;
}

} // namespace

// ============================================================================
// FontDescription
// ============================================================================

bool FontDescription::operator==(const FontDescription& other) const {
    return family == other.family &&
           std::abs(size - other.size) < 0.01f &&
           bold == other.bold &&
           italic == other.italic;
}

FontDescription FontDescription::scaled(f32 factor) const {
    FontDescription result = *this;
    result.size = size * factor;
    return result;
}

String FontDescription::to_string() const {
    String result;
    if (italic) {
        result += "italic ";
    }
    if (bold) {
        result += "bold ";
    }
    result += format_pixels(size);
    result += "px ";
    result += family;
    return result;
}

std::size_t FontDescriptionHash::operator()(const FontDescription& desc) const {
    std::size_t h = std::hash<std::string>{}(desc.family.std_string());
    // Quantize so that sizes considered equal hash equally
    auto size_key = static_cast<i64>(std::lround(desc.size * 100.0f));
    h ^= std::hash<i64>{}(size_key) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<bool>{}(desc.bold) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<bool>{}(desc.italic) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}

// ============================================================================
// FreeType library handle
// ============================================================================

// Faces must be released before the library, so every font keeps the
// library alive through this handle
struct LibraryHandle {
    FT_Library library{nullptr};

    LibraryHandle() {
        if (FT_Init_FreeType(&library) != 0) {
            library = nullptr;
        }
    }

    ~LibraryHandle() {
        if (library) {
            FT_Done_FreeType(library);
        }
    }

    LibraryHandle(const LibraryHandle&) = delete;
    LibraryHandle& operator=(const LibraryHandle&) = delete;
};

// ============================================================================
// FreeType Font implementation
// ============================================================================

class FreeTypeFont : public Font {
public:
    FreeTypeFont(std::shared_ptr<LibraryHandle> library,
                 FT_Face face,
                 const FontDescription& desc,
                 bool synthetic_bold,
                 bool synthetic_oblique)
        : m_library(std::move(library))
        , m_face(face)
        , m_desc(desc)
        , m_synthetic_bold(synthetic_bold)
        , m_synthetic_oblique(synthetic_oblique)
    {
        f32 scale = m_desc.size / static_cast<f32>(m_face->units_per_EM);
        m_metrics.ascender = static_cast<f32>(m_face->ascender) * scale;
        m_metrics.descender = static_cast<f32>(m_face->descender) * scale;
        m_metrics.line_gap = static_cast<f32>(m_face->height) * scale -
                             (m_metrics.ascender - m_metrics.descender);
        m_metrics.units_per_em = static_cast<f32>(m_face->units_per_EM);
    }

    ~FreeTypeFont() override {
        FT_Done_Face(m_face);
    }

    FreeTypeFont(const FreeTypeFont&) = delete;
    FreeTypeFont& operator=(const FreeTypeFont&) = delete;

    const FontDescription& description() const override { return m_desc; }
    FontMetrics metrics() const override { return m_metrics; }

    bool has_glyph(unicode::CodePoint cp) const override {
        return FT_Get_Char_Index(m_face, cp) != 0;
    }

    std::optional<GlyphBitmap> rasterize_glyph(unicode::CodePoint cp, f32 subpixel_x) const override {
        FT_GlyphSlot slot = load_glyph(FT_Get_Char_Index(m_face, cp));
        if (!slot || slot->format != FT_GLYPH_FORMAT_OUTLINE) {
            return std::nullopt;
        }

        auto shift = static_cast<FT_Pos>(std::lround(subpixel_x * 64.0f));
        if (shift != 0) {
            FT_Outline_Translate(&slot->outline, shift, 0);
        }

        if (FT_Render_Glyph(slot, FT_RENDER_MODE_NORMAL) != 0) {
            return std::nullopt;
        }

        const FT_Bitmap& bitmap = slot->bitmap;

        GlyphBitmap result;
        result.width = static_cast<i32>(bitmap.width);
        result.height = static_cast<i32>(bitmap.rows);
        result.bearing_x = slot->bitmap_left;
        result.bearing_y = slot->bitmap_top;
        result.advance = static_cast<f32>(slot->advance.x) / 64.0f;

        result.pixels.resize(static_cast<usize>(result.width) * static_cast<usize>(result.height));
        i32 pitch = std::abs(bitmap.pitch);
        for (i32 y = 0; y < result.height; ++y) {
            const unsigned char* row = bitmap.buffer + static_cast<isize>(y) * pitch;
            std::copy(row, row + result.width,
                      result.pixels.begin() + static_cast<isize>(y) * result.width);
        }

        return result;
    }

    f32 get_kerning(unicode::CodePoint left, unicode::CodePoint right) const override {
        return kerning_between(FT_Get_Char_Index(m_face, left), FT_Get_Char_Index(m_face, right));
    }

    f32 measure_text(const String& text) const override {
        f32 width = 0;
        FT_UInt previous = 0;
        bool first = true;

        for (unicode::CodePoint cp : text.code_points()) {
            FT_UInt index = FT_Get_Char_Index(m_face, cp);
            if (!first) {
                width += kerning_between(previous, index);
            }
            if (FT_GlyphSlot slot = load_glyph(index)) {
                width += static_cast<f32>(slot->advance.x) / 64.0f;
            }
            previous = index;
            first = false;
        }
        return width;
    }

    f32 measure_char(unicode::CodePoint cp) const override {
        if (FT_GlyphSlot slot = load_glyph(FT_Get_Char_Index(m_face, cp))) {
            return static_cast<f32>(slot->advance.x) / 64.0f;
        }
        return 0;
    }

private:
    // Index 0 loads the face's .notdef glyph, which still has an advance
    FT_GlyphSlot load_glyph(FT_UInt index) const {
        if (FT_Load_Glyph(m_face, index, LOAD_FLAGS) != 0) {
            return nullptr;
        }
        FT_GlyphSlot slot = m_face->glyph;
        if (m_synthetic_oblique) {
            FT_GlyphSlot_Oblique(slot);
        }
        if (m_synthetic_bold) {
            FT_GlyphSlot_Embolden(slot);
        }
        return slot;
    }

    f32 kerning_between(FT_UInt left, FT_UInt right) const {
        if (!FT_HAS_KERNING(m_face) || left == 0 || right == 0) {
            return 0;
        }
        FT_Vector kerning;
        if (FT_Get_Kerning(m_face, left, right, FT_KERNING_UNFITTED, &kerning) != 0) {
            return 0;
        }
        return static_cast<f32>(kerning.x) / 64.0f;
    }

    std::shared_ptr<LibraryHandle> m_library;
    FT_Face m_face;
    FontDescription m_desc;
    bool m_synthetic_bold;
    bool m_synthetic_oblique;
    FontMetrics m_metrics;
};

// ============================================================================
// FontContext implementation
// ============================================================================

struct FontContext::FontData {
    std::shared_ptr<LibraryHandle> library;
};

FontContext::FontContext() : m_data(std::make_unique<FontData>()) {
    m_data->library = std::make_shared<LibraryHandle>();
    if (!m_data->library->library) {
        logging::get("font").error("FreeType initialization failed");
    }
}

FontContext::~FontContext() = default;

bool FontContext::is_valid() const {
    return m_data->library && m_data->library->library;
}

Result<std::shared_ptr<Font>, String> FontContext::load_font(const String& path, const FontDescription& desc) {
    if (!is_valid()) {
        return make_error(String("FreeType is not initialized"));
    }

    FT_Face face = nullptr;
    if (FT_New_Face(m_data->library->library, path.c_str(), 0, &face) != 0) {
        return make_error(String("cannot open font face: ") + path);
    }

    if (!FT_IS_SCALABLE(face)) {
        FT_Done_Face(face);
        return make_error(String("font face is not scalable: ") + path);
    }

    auto char_size = static_cast<FT_F26Dot6>(std::lround(desc.size * 64.0f));
    if (FT_Set_Char_Size(face, 0, char_size, 72, 72) != 0) {
        FT_Done_Face(face);
        return make_error(String("cannot set size ") + format_pixels(desc.size) + " for " + path);
    }

    bool face_bold = (face->style_flags & FT_STYLE_FLAG_BOLD) != 0;
    bool face_italic = (face->style_flags & FT_STYLE_FLAG_ITALIC) != 0;

    std::shared_ptr<Font> font = std::make_shared<FreeTypeFont>(
        m_data->library, face, desc,
        desc.bold && !face_bold,
        desc.italic && !face_italic);
    return font;
}

std::shared_ptr<Font> FontContext::get_font(const FontDescription& desc) {
    auto it = m_cache.find(desc);
    if (it != m_cache.end()) {
        return it->second;
    }

    std::vector<String> candidates;
    for (const auto& family : font_matching::parse_family_list(desc.family)) {
        candidates.push_back(family);
        String resolved = font_matching::resolve_generic_family(family);
        if (resolved != family) {
            candidates.push_back(resolved);
        }
    }
    candidates.push_back(font_matching::resolve_generic_family("sans-serif"_s));
    // Last resort: whatever was registered first
    candidates.insert(candidates.end(), m_registration_order.begin(), m_registration_order.end());

    for (const auto& family : candidates) {
        const FaceEntry* entry = find_face(family, desc.bold, desc.italic);
        if (!entry) {
            continue;
        }

        auto loaded = load_font(entry->path, desc);
        if (loaded.is_err()) {
            logging::get("font").warn(loaded.error().view());
            continue;
        }

        logging::get("font").debug(
            (String("resolved '") + desc.to_string() + "' to " + entry->path).view());
        m_cache[desc] = loaded.value();
        return loaded.value();
    }

    logging::get("font").error((String("no font face available for '") + desc.to_string() + "'").view());
    return nullptr;
}

void FontContext::register_font(const String& family, const String& path, bool bold, bool italic) {
    String key = family.to_lowercase();
    auto& faces = m_registered_fonts[key];
    if (faces.empty()) {
        m_registration_order.push_back(family);
    }
    faces.push_back({path, bold, italic});
}

usize FontContext::register_font_directory(const String& directory) {
    if (!is_valid()) {
        return 0;
    }

    std::error_code ec;
    std::filesystem::path root(expand_home(directory).std_string());
    if (!std::filesystem::is_directory(root, ec)) {
        return 0;
    }

    std::vector<std::filesystem::path> files;
    for (auto iter = std::filesystem::recursive_directory_iterator(root, ec);
         !ec && iter != std::filesystem::recursive_directory_iterator();
         iter.increment(ec)) {
        if (iter->is_regular_file(ec) && is_font_file(iter->path())) {
            files.push_back(iter->path());
        }
    }
    // Directory order is unspecified; sort to keep face resolution stable
    std::sort(files.begin(), files.end());

    usize count = 0;
    for (const auto& file : files) {
        FT_Face face = nullptr;
        if (FT_New_Face(m_data->library->library, file.c_str(), 0, &face) != 0) {
            continue;
        }

        if (face->family_name && FT_IS_SCALABLE(face) && is_plain_style(String(face->style_name))) {
            register_font(String(face->family_name), String(file.string()),
                          (face->style_flags & FT_STYLE_FLAG_BOLD) != 0,
                          (face->style_flags & FT_STYLE_FLAG_ITALIC) != 0);
            ++count;
        }
        FT_Done_Face(face);
    }

    return count;
}

usize FontContext::register_system_fonts() {
    usize count = 0;
    for (const auto& directory : get_system_font_paths()) {
        count += register_font_directory(directory);
    }
    logging::get("font").debug((String("registered ") + std::to_string(count) + " system font faces").view());
    return count;
}

bool FontContext::has_family(const String& family) const {
    return m_registered_fonts.contains(family.to_lowercase());
}

usize FontContext::registered_face_count() const {
    usize count = 0;
    for (const auto& [family, faces] : m_registered_fonts) {
        count += faces.size();
    }
    return count;
}

const FontContext::FaceEntry* FontContext::find_face(const String& family, bool bold, bool italic) const {
    auto it = m_registered_fonts.find(family.to_lowercase());
    if (it == m_registered_fonts.end()) {
        return nullptr;
    }

    // Prefer exact weight, then exact slant; anything missing is synthesized
    const FaceEntry* best = nullptr;
    int best_score = -1;
    for (const auto& face : it->second) {
        int score = 0;
        if (face.bold == bold) score += 2;
        if (face.italic == italic) score += 1;
        if (face.bold && !bold) score -= 4;
        if (face.italic && !italic) score -= 4;
        if (score > best_score) {
            best = &face;
            best_score = score;
        }
    }
    return best;
}

void FontContext::clear_cache() {
    m_cache.clear();
}

std::vector<String> FontContext::get_system_font_paths() {
    std::vector<String> paths;
#ifdef __linux__
    paths.push_back("/usr/share/fonts"_s);
    paths.push_back("/usr/local/share/fonts"_s);
    paths.push_back("~/.fonts"_s);
    paths.push_back("~/.local/share/fonts"_s);
#elif defined(_WIN32)
    paths.push_back("C:\\Windows\\Fonts"_s);
#elif defined(__APPLE__)
    paths.push_back("/Library/Fonts"_s);
    paths.push_back("/System/Library/Fonts"_s);
    paths.push_back("~/Library/Fonts"_s);
#endif
    return paths;
}

// ============================================================================
// Font matching
// ============================================================================

namespace font_matching {

String resolve_generic_family(const String& family) {
    String lower = family.to_lowercase();
    if (lower == "serif"_s || lower == "ui-serif"_s) {
#ifdef __linux__
        return "DejaVu Serif"_s;
#else
        return "Times New Roman"_s;
#endif
    } else if (lower == "sans-serif"_s || lower == "system-ui"_s ||
               lower == "-apple-system"_s || lower == "ui-sans-serif"_s) {
#ifdef __linux__
        return "DejaVu Sans"_s;
#else
        return "Arial"_s;
#endif
    } else if (lower == "monospace"_s || lower == "ui-monospace"_s) {
#ifdef __linux__
        return "DejaVu Sans Mono"_s;
#else
        return "Courier New"_s;
#endif
    }
    return family;
}

std::vector<String> parse_family_list(const String& families) {
    std::vector<String> result;
    for (const auto& piece : families.split(',')) {
        String name = piece.trim();
        if (name.size() >= 2 &&
            (name[0] == '"' || name[0] == '\'') &&
            name[name.size() - 1] == name[0]) {
            name = name.substring(1, name.size() - 2).trim();
        }
        if (!name.empty()) {
            result.push_back(name);
        }
    }
    return result;
}

} // namespace font_matching

} // namespace glyphic::text
