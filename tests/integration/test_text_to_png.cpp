#include <gtest/gtest.h>
#include "glyphic/canvas/software_surface.hpp"
#include "glyphic/core/logger.hpp"
#include "glyphic/editor/editor_state.hpp"
#include "glyphic/editor/exporter.hpp"
#include <png.h>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

using namespace glyphic;

namespace {

struct DecodedImage {
    u32 width{0};
    u32 height{0};
    std::vector<u8> rgba;
};

std::vector<u8> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    return std::vector<u8>((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

bool decode(const std::vector<u8>& png, DecodedImage& out) {
    png_image image;
    std::memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;
    if (!png_image_begin_read_from_memory(&image, png.data(), png.size())) {
        return false;
    }
    image.format = PNG_FORMAT_RGBA;
    out.rgba.resize(PNG_IMAGE_SIZE(image));
    if (!png_image_finish_read(&image, nullptr, out.rgba.data(), 0, nullptr)) {
        png_image_free(&image);
        return false;
    }
    out.width = image.width;
    out.height = image.height;
    return true;
}

} // namespace

// ============================================================================
// Text to PNG pipeline
// ============================================================================

class TextToPngTest : public ::testing::Test {
protected:
    void SetUp() override {
        logging::set_level(LogLevel::Warn);
        if (m_fonts.register_system_fonts() == 0) {
            GTEST_SKIP() << "no system fonts installed";
        }

        m_dir = std::filesystem::temp_directory_path() / "glyphic_integration";
        std::filesystem::remove_all(m_dir);
        m_saver = std::make_unique<editor::DirectoryFileSaver>(String(m_dir.string()));
    }

    void TearDown() override {
        if (!m_dir.empty()) {
            std::filesystem::remove_all(m_dir);
        }
    }

    std::unique_ptr<canvas::SoftwareSurface> make_surface(f32 scale = 1.0f) {
        canvas::SurfaceConfig config;
        config.device_scale = scale;
        return canvas::SoftwareSurface::create(m_fonts, config);
    }

    text::FontContext m_fonts;
    std::filesystem::path m_dir;
    std::unique_ptr<editor::DirectoryFileSaver> m_saver;
};

TEST_F(TextToPngTest, ExportsReadablePng) {
    auto surface = make_surface();
    ASSERT_NE(surface, nullptr);
    editor::Exporter exporter(surface.get(), *m_saver);

    editor::EditorState state;
    state.set_text("hello world"_s);
    state.set_title("hello"_s);
    ASSERT_EQ(state.export_png(exporter), editor::ExportStatus::Exported);

    auto bytes = read_file(m_dir / "hello.png");
    DecodedImage image;
    ASSERT_TRUE(decode(bytes, image));

    // One line at size 11: 11 + 2 padding
    EXPECT_EQ(image.width, 600u);
    EXPECT_EQ(image.height, 13u);

    // Ink in the default grey at any coverage, background transparent
    bool found_ink = false;
    for (usize i = 0; i < image.rgba.size(); i += 4) {
        if (image.rgba[i + 3] > 0) {
            found_ink = true;
            EXPECT_EQ(image.rgba[i], 0x73);
        }
    }
    EXPECT_TRUE(found_ink);
    EXPECT_EQ(image.rgba[3], 0);
}

TEST_F(TextToPngTest, DefaultFileName) {
    auto surface = make_surface();
    ASSERT_NE(surface, nullptr);
    editor::Exporter exporter(surface.get(), *m_saver);

    ASSERT_EQ(exporter.export_png("text"_s, layout::StyleDescriptor{}), editor::ExportStatus::Exported);
    EXPECT_TRUE(std::filesystem::exists(m_dir / "text-editor-export.png"));
}

TEST_F(TextToPngTest, DeviceScaleDoublesPixels) {
    auto surface = make_surface(2.0f);
    ASSERT_NE(surface, nullptr);
    editor::Exporter exporter(surface.get(), *m_saver);

    layout::StyleDescriptor style;
    style.font_size = 20;
    ASSERT_EQ(exporter.export_png("one\ntwo"_s, style, "scaled"_s), editor::ExportStatus::Exported);

    DecodedImage image;
    ASSERT_TRUE(decode(read_file(m_dir / "scaled.png"), image));
    // (2 * 30 - 10 + 2) * 2
    EXPECT_EQ(image.width, 1200u);
    EXPECT_EQ(image.height, 104u);
}

TEST_F(TextToPngTest, RepeatedExportIsByteIdentical) {
    auto surface = make_surface();
    ASSERT_NE(surface, nullptr);
    editor::Exporter exporter(surface.get(), *m_saver);

    editor::EditorState state;
    state.set_text("The quick brown fox jumps over the lazy dog.\n"
                   "Pack my box with five dozen liquor jugs and keep typing until the line wraps "
                   "around the six hundred pixel page at least once."_s);
    state.set_alignment(layout::TextAlign::Justify);
    state.toggle_underline();
    state.toggle_bold();

    ASSERT_EQ(state.export_png(exporter), editor::ExportStatus::Exported);
    auto first = read_file(m_dir / "text-editor-export.png");
    ASSERT_EQ(state.export_png(exporter), editor::ExportStatus::Exported);
    auto second = read_file(m_dir / "text-editor-export.png");

    ASSERT_FALSE(first.empty());
    EXPECT_EQ(first, second);
}

TEST_F(TextToPngTest, UnderlineRowIsDrawn) {
    auto surface = make_surface();
    ASSERT_NE(surface, nullptr);
    editor::Exporter exporter(surface.get(), *m_saver);

    layout::StyleDescriptor style;
    style.underline = true;
    style.color = "#000000"_s;
    style.font_size = 20;
    ASSERT_EQ(exporter.export_png("underline"_s, style, "u"_s), editor::ExportStatus::Exported);

    // Stroke centered on y = 1 + 20 + 2 = 23 covers rows 22 and 23 by half
    EXPECT_GT(surface->pixel_at(3, 22).a, 0);
    EXPECT_GT(surface->pixel_at(3, 23).a, 0);
}

TEST_F(TextToPngTest, BlankDocumentWritesNothing) {
    auto surface = make_surface();
    ASSERT_NE(surface, nullptr);
    editor::Exporter exporter(surface.get(), *m_saver);

    EXPECT_EQ(exporter.export_png("\n\n\n"_s, layout::StyleDescriptor{}), editor::ExportStatus::EmptyDocument);
    EXPECT_FALSE(std::filesystem::exists(m_dir));
}
