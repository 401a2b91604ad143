/**
 * PNG encoding through libpng
 */

#include "glyphic/canvas/png_encoder.hpp"
#include "glyphic/core/logger.hpp"
#include <png.h>
#include <string>

namespace glyphic::canvas {

namespace {

void write_to_vector(png_structp png, png_bytep data, png_size_t length) {
    auto* output = static_cast<std::vector<u8>*>(png_get_io_ptr(png));
    output->insert(output->end(), data, data + length);
}

void flush_nothing(png_structp) {}

void on_png_error(png_structp png, png_const_charp message) {
    auto* error = static_cast<std::string*>(png_get_error_ptr(png));
    if (error) {
        *error = message ? message : "unknown libpng error";
    }
    png_longjmp(png, 1);
}

void on_png_warning(png_structp, png_const_charp message) {
    logging::get("canvas").warn((String("libpng: ") + String(message)).view());
}

} // namespace

Result<std::vector<u8>, String> encode_png(const u8* rgba, i32 width, i32 height, usize stride) {
    if (!rgba || width <= 0 || height <= 0) {
        return make_error(String("cannot encode an empty image"));
    }

    std::vector<u8> output;
    std::string error_message;
    std::vector<png_bytep> rows(static_cast<usize>(height));
    for (i32 y = 0; y < height; ++y) {
        rows[static_cast<usize>(y)] = const_cast<png_bytep>(rgba + static_cast<usize>(y) * stride);
    }

    png_structp png = png_create_write_struct(
        PNG_LIBPNG_VER_STRING, &error_message, on_png_error, on_png_warning);
    if (!png) {
        return make_error(String("png_create_write_struct failed"));
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        return make_error(String("png_create_info_struct failed"));
    }

    // Everything touched after this point is declared above it
    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        return make_error(String("libpng: ") + String(error_message));
    }

    png_set_write_fn(png, &output, write_to_vector, flush_nothing);
    png_set_IHDR(png, info,
                 static_cast<png_uint_32>(width),
                 static_cast<png_uint_32>(height),
                 8,
                 PNG_COLOR_TYPE_RGBA,
                 PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    png_write_info(png, info);
    png_write_image(png, rows.data());
    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);

    return Result<std::vector<u8>, String>(std::move(output));
}

} // namespace glyphic::canvas
