#pragma once

#include "glyphic/core/types.hpp"
#include "glyphic/core/string.hpp"
#include <vector>

namespace glyphic::canvas {

/// Encode 8-bit RGBA pixels as a non-interlaced PNG.
///
/// Output depends only on the pixels: no time or text chunks are written.
/// Fails for empty images, as a zero-sized canvas has no blob.
[[nodiscard]] Result<std::vector<u8>, String> encode_png(
    const u8* rgba,
    i32 width,
    i32 height,
    usize stride);

} // namespace glyphic::canvas
