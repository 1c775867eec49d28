#include "util/FileSystem.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace gitcontext {

bool DiskFileSystem::isDirectory(const fs::path& path) const {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool DiskFileSystem::isRegularFile(const fs::path& path) const {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

Expected<std::string> DiskFileSystem::readText(const fs::path& path) const {
    if (!isRegularFile(path)) {
        return Error{ErrorCode::NotFound, "File not found: " + path.string()};
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to open file for reading: " + path.string()};
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Error reading file: " + path.string()};
    }
    return content;
}

Expected<std::unique_ptr<std::istream>> DiskFileSystem::openBinary(const fs::path& path) const {
    if (!isRegularFile(path)) {
        return Error{ErrorCode::NotFound, "File not found: " + path.string()};
    }
    auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!*file) {
        return Error{ErrorCode::IoError, "Failed to open file for reading: " + path.string()};
    }
    std::unique_ptr<std::istream> stream = std::move(file);
    return Expected<std::unique_ptr<std::istream>>(std::move(stream));
}

Expected<std::vector<std::string>> DiskFileSystem::listFiles(const fs::path& dir) const {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to read directory " + dir.string() + ": " + ec.message()};
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code typeEc;
        if (it->is_regular_file(typeEc)) {
            names.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to read directory " + dir.string() + ": " + ec.message()};
    }
    return names;
}

fs::path DiskFileSystem::currentDirectory() const {
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    return ec ? fs::path() : cwd;
}

}
