/**
 * Line Breaker implementation
 */

#include "glyphic/text/line_breaker.hpp"

namespace glyphic::text {

LineBreaker::LineBreaker(MeasureFn measure)
    : m_measure(std::move(measure)) {}

std::vector<String> LineBreaker::wrap(const std::vector<String>& raw_lines, f32 max_width) const {
    std::vector<String> lines;
    for (const auto& raw : raw_lines) {
        if (raw.is_blank()) {
            continue;
        }
        wrap_line(raw, max_width, lines);
    }
    return lines;
}

void LineBreaker::wrap_line(const String& line, f32 max_width, std::vector<String>& out) const {
    if (line.is_blank()) {
        return;
    }

    String current;

    for (const auto& word : line.split(' ')) {
        String candidate = current.empty() ? word : current + " " + word;

        if (m_measure(candidate) <= max_width) {
            current = std::move(candidate);
            continue;
        }

        if (!current.empty()) {
            out.push_back(std::move(current));
            current = word;
        } else {
            // Over-wide first word: placed alone, never split or re-tested
            out.push_back(word);
        }
    }

    if (!current.empty()) {
        out.push_back(std::move(current));
    }
}

std::vector<String> wrap(
    const std::vector<String>& raw_lines,
    const MeasureFn& measure,
    f32 max_width) {
    return LineBreaker(measure).wrap(raw_lines, max_width);
}

} // namespace glyphic::text
