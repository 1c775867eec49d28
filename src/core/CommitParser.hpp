#pragma once

#include <filesystem>
#include <string>

#include "core/CommitInfo.hpp"
#include "util/Expected.hpp"

namespace gitcontext {

class IFileSystem;

/**
 * @brief Decodes a commit object into CommitInfo
 *
 * Uses the author line (not the committer) for identity and date, collects
 * parent lines in file order and takes the body as the message. Other header
 * fields (tree, committer, gpgsig, encoding, ...) are skipped.
 */
class CommitParser {
public:
    CommitParser(const IFileSystem& fileSystem, std::filesystem::path objectsDir);

    /**
     * @brief Read and parse the commit object with the given hash
     * @return CommitInfo, or NotFound / MalformedObject / IoError
     */
    Expected<CommitInfo> parse(const std::string& commitHash) const;

    /**
     * @brief Parse "Name <email> <epoch-seconds> <+HHMM>"
     *
     * The epoch is the instant; the offset is attached as the reporting
     * offset without shifting the instant.
     */
    static Expected<Signature> parseSignature(const std::string& value);

private:
    const IFileSystem& fileSystem;
    std::filesystem::path objectsDir;
};

}
