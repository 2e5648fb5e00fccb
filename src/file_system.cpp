#include "file_system.hpp"
#include <system_error>

namespace fs = std::filesystem;

bool LocalFileSystem::exists(const fs::path& path) const {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool LocalFileSystem::isDirectory(const fs::path& path) const {
    std::error_code ec;
    return fs::is_directory(path, ec);
}
