#pragma once

#include "glyphic/core/types.hpp"
#include "glyphic/core/string.hpp"
#include <functional>
#include <vector>

namespace glyphic::text {

/// Width of a string in pixels under the current font
using MeasureFn = std::function<f32(const String&)>;

// ============================================================================
// Line Breaker
// ============================================================================

/// Greedy word wrap over lines that were already split on explicit newlines.
///
/// Words are the pieces between single spaces, so runs of spaces yield empty
/// words that are joined back with one space each. A word that does not fit
/// on an empty line is emitted alone and never split.
class LineBreaker {
public:
    explicit LineBreaker(MeasureFn measure);

    /// Wrap every raw line; whitespace-only lines produce no output
    [[nodiscard]] std::vector<String> wrap(const std::vector<String>& raw_lines, f32 max_width) const;

    /// Wrap a single raw line, appending the result to out
    void wrap_line(const String& line, f32 max_width, std::vector<String>& out) const;

private:
    MeasureFn m_measure;
};

/// Free-function form of LineBreaker::wrap
[[nodiscard]] std::vector<String> wrap(
    const std::vector<String>& raw_lines,
    const MeasureFn& measure,
    f32 max_width);

} // namespace glyphic::text
