#include <gtest/gtest.h>
#include "glyphic/editor/exporter.hpp"
#include "recording_surface.hpp"
#include "glyphic/core/logger.hpp"
#include <memory>
#include <string>

using namespace glyphic;
using namespace glyphic::editor;
using glyphic::test_support::MemoryFileSaver;
using glyphic::test_support::RecordingSurface;

// ============================================================================
// File Name Tests
// ============================================================================

TEST(ResolveFilenameTest, UsesTitle) {
    EXPECT_EQ(resolve_filename("My Notes"_s), "My Notes.png"_s);
}

TEST(ResolveFilenameTest, SeparatorsInTitleAreReplaced) {
    EXPECT_EQ(resolve_filename("a/b"_s), "a_b.png"_s);
    EXPECT_EQ(resolve_filename("../escaped"_s), ".._escaped.png"_s);
    EXPECT_EQ(resolve_filename("/etc/x"_s), "_etc_x.png"_s);
    EXPECT_EQ(resolve_filename("dir\\name"_s), "dir_name.png"_s);
    EXPECT_EQ(resolve_filename("tab\there"_s), "tab_here.png"_s);
}

TEST(ResolveFilenameTest, EmptyTitleUsesDefault) {
    EXPECT_EQ(resolve_filename(""_s), "text-editor-export.png"_s);

    ExportConfig config;
    config.default_basename = "untitled"_s;
    EXPECT_EQ(resolve_filename(""_s, config), "untitled.png"_s);
}

TEST(ExportStatusTest, Names) {
    EXPECT_STREQ(export_status_name(ExportStatus::Exported), "exported");
    EXPECT_STREQ(export_status_name(ExportStatus::EmptyDocument), "empty document");
}

// ============================================================================
// Exporter Tests
// ============================================================================

TEST(ExporterTest, MissingSurfaceIsNoOp) {
    MemoryFileSaver saver;
    Exporter exporter(nullptr, saver);

    EXPECT_EQ(exporter.export_png("hello"_s, layout::StyleDescriptor{}), ExportStatus::NoSurface);
    EXPECT_TRUE(saver.files.empty());
}

TEST(ExporterTest, BlankDocumentIsNoOp) {
    RecordingSurface surface;
    MemoryFileSaver saver;
    Exporter exporter(&surface, saver);

    EXPECT_EQ(exporter.export_png("\n\n\n"_s, layout::StyleDescriptor{}), ExportStatus::EmptyDocument);
    EXPECT_EQ(exporter.export_png(" \t \n   "_s, layout::StyleDescriptor{}), ExportStatus::EmptyDocument);
    EXPECT_EQ(exporter.export_png("\xC2\xA0\n\xE3\x80\x80"_s, layout::StyleDescriptor{}),
              ExportStatus::EmptyDocument);
    EXPECT_TRUE(saver.files.empty());
    EXPECT_EQ(surface.resize_count, 0u);
}

TEST(ExporterTest, ExportsSingleLine) {
    RecordingSurface surface;
    MemoryFileSaver saver;
    Exporter exporter(&surface, saver);

    EXPECT_EQ(exporter.export_png("hello world"_s, layout::StyleDescriptor{}, "greeting"_s),
              ExportStatus::Exported);

    ASSERT_EQ(saver.files.size(), 1u);
    EXPECT_EQ(saver.files[0].filename, "greeting.png"_s);
    EXPECT_FALSE(saver.files[0].bytes.empty());

    ASSERT_EQ(surface.texts.size(), 1u);
    EXPECT_EQ(surface.texts[0].text, "hello world"_s);
    EXPECT_FLOAT_EQ(surface.texts[0].origin.x, 1.0f);
}

TEST(ExporterTest, SurfaceSizedFromLineCount) {
    RecordingSurface surface;
    MemoryFileSaver saver;
    Exporter exporter(&surface, saver);

    layout::StyleDescriptor style;
    style.font_size = 20;
    ASSERT_EQ(exporter.export_png("one\ntwo\nthree"_s, style), ExportStatus::Exported);

    // 3 * 30 - 10 + 2
    EXPECT_FLOAT_EQ(surface.logical_size().width, 600.0f);
    EXPECT_FLOAT_EQ(surface.logical_size().height, 82.0f);
    EXPECT_EQ(surface.resize_count, 1u);
}

TEST(ExporterTest, WrapsWithStyleFontBeforeResize) {
    RecordingSurface surface;
    MemoryFileSaver saver;
    ExportConfig config;
    config.layout.fixed_width = 62.0f;
    Exporter exporter(&surface, saver, config);

    layout::StyleDescriptor style;
    style.bold = true;
    ASSERT_EQ(exporter.export_png("aa bb cc dd"_s, style), ExportStatus::Exported);

    // 60 available at 10 per character: "aa bb" then "cc dd"
    ASSERT_EQ(surface.texts.size(), 2u);
    EXPECT_EQ(surface.texts[0].text, "aa bb"_s);
    EXPECT_EQ(surface.texts[1].text, "cc dd"_s);
    EXPECT_TRUE(surface.texts[0].font.bold);
}

TEST(ExporterTest, EncodeFailureSkipsSave) {
    RecordingSurface surface;
    surface.fail_encode = true;
    MemoryFileSaver saver;
    Exporter exporter(&surface, saver);

    EXPECT_EQ(exporter.export_png("text"_s, layout::StyleDescriptor{}), ExportStatus::EncodeFailed);
    EXPECT_TRUE(saver.files.empty());
}

namespace {

class WarningSink : public LogSink {
public:
    explicit WarningSink(std::shared_ptr<std::vector<std::string>> messages)
        : m_messages(std::move(messages)) {}

    void write(const LogRecord& record) override {
        if (record.level == LogLevel::Warn) {
            m_messages->emplace_back(record.message);
        }
    }

    void flush() override {}

private:
    std::shared_ptr<std::vector<std::string>> m_messages;
};

} // namespace

TEST(ExporterTest, EncodeFailureIsLoggedOnce) {
    auto messages = std::make_shared<std::vector<std::string>>();
    logging::shutdown();
    std::vector<std::unique_ptr<LogSink>> sinks;
    sinks.push_back(std::make_unique<WarningSink>(messages));
    logging::init(std::move(sinks));

    RecordingSurface surface;
    surface.fail_encode = true;
    MemoryFileSaver saver;
    Exporter exporter(&surface, saver);
    EXPECT_EQ(exporter.export_png("text"_s, layout::StyleDescriptor{}), ExportStatus::EncodeFailed);

    logging::shutdown();

    ASSERT_EQ(messages->size(), 1u);
    EXPECT_EQ((*messages)[0], "PNG encoding failed: encoder unavailable");
}

TEST(ExporterTest, SaveFailureIsReported) {
    RecordingSurface surface;
    MemoryFileSaver saver;
    saver.fail_save = true;
    Exporter exporter(&surface, saver);

    EXPECT_EQ(exporter.export_png("text"_s, layout::StyleDescriptor{}), ExportStatus::SaveFailed);
}

TEST(ExporterTest, Idempotent) {
    RecordingSurface surface;
    MemoryFileSaver saver;
    Exporter exporter(&surface, saver);

    layout::StyleDescriptor style;
    style.align = layout::TextAlign::Justify;
    style.underline = true;
    String text("The quick brown fox jumps over the lazy dog. "
                "Pack my box with five dozen liquor jugs, and then some more words.");

    ASSERT_EQ(exporter.export_png(text, style), ExportStatus::Exported);
    ASSERT_EQ(exporter.export_png(text, style), ExportStatus::Exported);
    ASSERT_EQ(saver.files.size(), 2u);
    EXPECT_EQ(saver.files[0].bytes, saver.files[1].bytes);
}

TEST(ExporterTest, AcceptsPreparedDocument) {
    RecordingSurface surface;
    MemoryFileSaver saver;
    Exporter exporter(&surface, saver);

    layout::Document doc({"first"_s, ""_s, "second"_s});
    EXPECT_EQ(exporter.export_png(doc, layout::StyleDescriptor{}), ExportStatus::Exported);
    EXPECT_EQ(surface.texts.size(), 2u);
}
