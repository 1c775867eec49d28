#pragma once

#include <cstddef>

/**
 * @brief Git layout constants used throughout the codebase
 */
namespace gitcontext {

namespace Constants {
    // Hash algorithm constants
    constexpr size_t SHA1_HEX_LENGTH = 40;        // SHA-1 produces 40-char hex strings

    // Object storage structure
    constexpr size_t OBJECT_DIR_LENGTH = 2;       // First 2 chars of hash form directory name

    // zlib buffer sizes for streaming inflate
    constexpr size_t INFLATE_CHUNK = 4096;

    // Repository layout (relative to the working tree / .git directory)
    constexpr const char* GIT_DIR = ".git";
    constexpr const char* HEAD_FILE = "HEAD";
    constexpr const char* OBJECTS_DIR = "objects";
    constexpr const char* HEADS_REF_PREFIX = "refs/heads/";
    constexpr const char* TAGS_DIR = "refs/tags";

    // HEAD symbolic ref marker
    constexpr const char* SYMREF_PREFIX = "ref: ";

    // Object types and header keys
    constexpr const char* TYPE_COMMIT = "commit";
    constexpr const char* TYPE_TAG = "tag";
    constexpr const char* KEY_AUTHOR = "author";
    constexpr const char* KEY_PARENT = "parent";
    constexpr const char* KEY_OBJECT = "object";
    constexpr const char* KEY_TYPE = "type";
}
}
