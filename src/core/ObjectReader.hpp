#pragma once

#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <zlib.h>

#include "util/Expected.hpp"

namespace gitcontext {

class IFileSystem;

/// One "key value" header line of a commit or tag object
struct ObjectField {
    std::string key;
    std::string value;
};

/**
 * @brief Streaming reader for a single loose object
 *
 * Storage Layout (Git standard):
 *   .git/objects/<first-2-chars>/<remaining-38-chars>
 *
 * Object Format (after zlib inflate):
 *   "<type> <size>\0"        header
 *   "key value\n" ...        fields (commit/tag objects)
 *   "\n"                     blank line
 *   <body>                   message
 *
 * Reading happens in three strictly ordered phases: readHeader(), then
 * readField() until it yields an empty optional, then readBody(). The file
 * is inflated incrementally and never held in memory as a whole.
 *
 * The input stream and the zlib state belong to this object and are released
 * in the destructor, however far decoding got. z_stream keeps an internal
 * back-pointer to itself, so readers are heap-allocated and never moved.
 */
class ObjectReader {
public:
    /**
     * @brief Open the loose object for hash under objectsDir
     * @return Reader positioned before the header, or
     *         MalformedObject (bad hash), NotFound (no such object), IoError
     */
    static Expected<std::unique_ptr<ObjectReader>> open(
        const IFileSystem& fileSystem,
        const std::filesystem::path& objectsDir,
        const std::string& hash
    );

    /// Path for object: <objectsDir>/<aa>/<bbbb...>
    static std::filesystem::path objectPath(const std::filesystem::path& objectsDir, const std::string& hash);

    ~ObjectReader();

    ObjectReader(const ObjectReader&) = delete;
    ObjectReader& operator=(const ObjectReader&) = delete;
    ObjectReader(ObjectReader&&) = delete;
    ObjectReader& operator=(ObjectReader&&) = delete;

    /// Object type from the "<type> <size>" header ("commit", "tag", ...)
    Expected<std::string> readHeader();

    /**
     * @brief Next header field
     * @return The field, or an empty optional at the blank line that
     *         separates fields from the body
     *
     * Lines starting with a space continue the previous field (multi-line
     * values such as gpgsig); they are joined to it with '\n'.
     */
    Expected<std::optional<ObjectField>> readField();

    /// Everything after the blank line
    Expected<std::string> readBody();

private:
    enum class Phase { Header, Fields, Body, Done };

    ObjectReader(std::unique_ptr<std::istream> input, std::string hash);

    Expected<void> init();

    /// Inflate more data into pending; false once the zlib stream has ended
    Expected<bool> fill();

    /// Consume up to delim (excluded); false if the stream ended first
    Expected<bool> readUntil(char delim, std::string& out);

    /// Make sure at least one unread byte is buffered; false at end
    Expected<bool> ensureAvailable();

    std::unique_ptr<std::istream> input;
    std::string objectHash;
    z_stream stream{};
    bool streamInitialized{false};
    bool streamEnded{false};
    Phase phase{Phase::Header};

    std::vector<char> inBuffer;
    std::vector<unsigned char> outBuffer;
    std::string pending;   // Inflated bytes not yet handed out
    size_t cursor{0};      // Read position inside pending
};

}
