#pragma once

#include "glyphic/core/types.hpp"
#include "glyphic/core/string.hpp"
#include <vector>

namespace glyphic::editor {

// ============================================================================
// File Saver
// ============================================================================

/// Destination for exported images
class FileSaver {
public:
    virtual ~FileSaver() = default;

    [[nodiscard]] virtual Result<void, String> save(const String& filename, const std::vector<u8>& bytes) = 0;
};

/// Writes each file into one output directory, replacing existing files.
/// Names that are not a single plain path component are rejected.
class DirectoryFileSaver : public FileSaver {
public:
    explicit DirectoryFileSaver(String directory);

    [[nodiscard]] Result<void, String> save(const String& filename, const std::vector<u8>& bytes) override;

    [[nodiscard]] const String& directory() const { return m_directory; }

private:
    String m_directory;
};

} // namespace glyphic::editor
