#pragma once

#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace gitcontext {

/**
 * @brief Strategy interface for the file system capability
 *
 * The reader only ever needs existence checks, whole-file text reads, a
 * binary stream for compressed objects and a flat directory listing. Tests
 * substitute an in-memory tree.
 */
class IFileSystem {
public:
    virtual ~IFileSystem() = default;

    virtual bool isDirectory(const std::filesystem::path& path) const = 0;
    virtual bool isRegularFile(const std::filesystem::path& path) const = 0;

    /// Read the entire file as text; NotFound if missing, IoError otherwise
    virtual Expected<std::string> readText(const std::filesystem::path& path) const = 0;

    /// Open a binary input stream; the caller owns and closes it
    virtual Expected<std::unique_ptr<std::istream>> openBinary(const std::filesystem::path& path) const = 0;

    /// Names of regular files directly inside dir (no recursion)
    virtual Expected<std::vector<std::string>> listFiles(const std::filesystem::path& dir) const = 0;

    virtual std::filesystem::path currentDirectory() const = 0;
};

/**
 * @brief IFileSystem backed by std::filesystem and std::ifstream
 */
class DiskFileSystem : public IFileSystem {
public:
    bool isDirectory(const std::filesystem::path& path) const override;
    bool isRegularFile(const std::filesystem::path& path) const override;
    Expected<std::string> readText(const std::filesystem::path& path) const override;
    Expected<std::unique_ptr<std::istream>> openBinary(const std::filesystem::path& path) const override;
    Expected<std::vector<std::string>> listFiles(const std::filesystem::path& dir) const override;
    std::filesystem::path currentDirectory() const override;
};

}
