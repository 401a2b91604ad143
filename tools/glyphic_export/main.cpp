/**
 * Text to PNG exporter
 * Usage: glyphic-export [options] [file.txt] or pipe text to stdin
 */

#include "glyphic/canvas/software_surface.hpp"
#include "glyphic/core/logger.hpp"
#include "glyphic/editor/editor_state.hpp"
#include "glyphic/editor/exporter.hpp"
#include "glyphic/text/font.hpp"
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

using namespace glyphic;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] [file]\n"
              << "  --bold --italic --underline\n"
              << "  --size N            font size, 8 to 72\n"
              << "  --color #rrggbb     text color\n"
              << "  --align MODE        left, center, right or justify\n"
              << "  --title T           output name without extension\n"
              << "  --out DIR           output directory (default .)\n"
              << "  --scale S           device scale, up to 16 (default 1)\n"
              << "  --font PATH         use this font file instead of system fonts\n"
              << "  --verbose           log export steps\n"
              << "  --log FILE          also append log records to FILE\n";
}

bool parse_number(const char* text, f64& out) {
    char* end = nullptr;
    out = std::strtod(text, &end);
    return end != text && *end == '\0' && std::isfinite(out);
}

} // namespace

int main(int argc, char* argv[]) {
    logging::init();
    logging::set_level(LogLevel::Warn);

    editor::EditorState state;
    String out_dir = "."_s;
    String font_path;
    String input_path;
    f64 scale = 1.0;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;

        if (std::strcmp(arg, "--bold") == 0) {
            state.toggle_bold();
        } else if (std::strcmp(arg, "--italic") == 0) {
            state.toggle_italic();
        } else if (std::strcmp(arg, "--underline") == 0) {
            state.toggle_underline();
        } else if (std::strcmp(arg, "--verbose") == 0) {
            logging::set_level(LogLevel::Debug);
        } else if (std::strcmp(arg, "--size") == 0 && has_value) {
            auto size = layout::parse_font_size(String(argv[++i]));
            if (!size) {
                std::cerr << "Error: Invalid size: " << argv[i] << "\n";
                return 1;
            }
            state.set_font_size(*size);
        } else if (std::strcmp(arg, "--color") == 0 && has_value) {
            state.change_color(String(argv[++i]));
        } else if (std::strcmp(arg, "--align") == 0 && has_value) {
            auto align = layout::parse_alignment(String(argv[++i]));
            if (!align) {
                std::cerr << "Error: Unknown alignment: " << argv[i] << "\n";
                return 1;
            }
            state.set_alignment(*align);
        } else if (std::strcmp(arg, "--title") == 0 && has_value) {
            state.set_title(String(argv[++i]));
        } else if (std::strcmp(arg, "--out") == 0 && has_value) {
            out_dir = String(argv[++i]);
        } else if (std::strcmp(arg, "--log") == 0 && has_value) {
            logging::add_sink(std::make_unique<FileSink>(argv[++i]));
        } else if (std::strcmp(arg, "--font") == 0 && has_value) {
            font_path = String(argv[++i]);
        } else if (std::strcmp(arg, "--scale") == 0 && has_value) {
            if (!parse_number(argv[++i], scale) || scale <= 0 || scale > 16) {
                std::cerr << "Error: Invalid scale: " << argv[i] << "\n";
                return 1;
            }
        } else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (arg[0] == '-' && arg[1] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            input_path = String(arg);
        }
    }

    std::stringstream buffer;
    if (!input_path.empty()) {
        std::ifstream file(input_path.c_str(), std::ios::in | std::ios::binary);
        if (!file) {
            std::cerr << "Error: Cannot open file: " << input_path.c_str() << "\n";
            return 1;
        }
        buffer << file.rdbuf();
        GLYPHIC_LOG_DEBUG((String("read ") + input_path).view());
    } else {
        buffer << std::cin.rdbuf();
        GLYPHIC_LOG_DEBUG("read standard input");
    }
    state.set_text(String(buffer.str()));

    text::FontContext fonts;
    if (font_path.empty()) {
        fonts.register_system_fonts();
    } else {
        // Sole registered face, so every family falls back to it
        fonts.register_font("custom"_s, font_path);
    }

    canvas::SurfaceConfig surface_config;
    surface_config.device_scale = static_cast<f32>(scale);
    auto surface = canvas::SoftwareSurface::create(fonts, surface_config);

    editor::DirectoryFileSaver saver(out_dir);
    editor::Exporter exporter(surface.get(), saver);

    auto status = state.export_png(exporter);
    int exit_code = 0;
    if (status == editor::ExportStatus::Exported) {
        std::cout << out_dir.c_str() << "/" << editor::resolve_filename(state.title()).c_str() << "\n";
    } else {
        std::cerr << "Nothing exported: " << editor::export_status_name(status) << "\n";
        exit_code = status == editor::ExportStatus::EmptyDocument ? 0 : 1;
    }

    logging::shutdown();
    return exit_code;
}
