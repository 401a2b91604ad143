/**
 * Directory file saver
 */

#include "glyphic/editor/file_saver.hpp"
#include <filesystem>
#include <fstream>
#include <system_error>

namespace glyphic::editor {

DirectoryFileSaver::DirectoryFileSaver(String directory)
    : m_directory(std::move(directory)) {}

Result<void, String> DirectoryFileSaver::save(const String& filename, const std::vector<u8>& bytes) {
    namespace fs = std::filesystem;

    if (filename.empty()) {
        return make_error(String("empty file name"));
    }

    fs::path name(filename.std_string());
    if (name.has_parent_path() || name.is_absolute() || name == fs::path(".") || name == fs::path("..") ||
        filename.view().find('\\') != std::string_view::npos) {
        return make_error(String("file name '") + filename + "' is not a plain file name");
    }

    fs::path dir = m_directory.empty() ? fs::path(".") : fs::path(m_directory.std_string());
    if (!dir.has_filename() && dir.has_parent_path()) {
        dir = dir.parent_path();  // trailing separator
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return make_error(String("cannot create directory '") + String(dir.string()) + "': " + String(ec.message()));
    }

    fs::path target = dir / name;
    if (target.parent_path() != dir) {
        return make_error(String("file name '") + filename + "' leaves the output directory");
    }
    std::ofstream file(target, std::ios::binary | std::ios::trunc);
    if (!file) {
        return make_error(String("cannot open '") + String(target.string()) + "' for writing");
    }

    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (!file) {
        return make_error(String("failed writing '") + String(target.string()) + "'");
    }

    return {};
}

} // namespace glyphic::editor
