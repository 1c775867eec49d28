#pragma once

#include <optional>
#include <string>
#include <vector>

#include "util/Timestamp.hpp"

namespace gitcontext {

class RepositoryReader;

/**
 * @brief The eight published values, resolved together
 *
 * Absent values keep the reader's documented defaults.
 */
struct GitSnapshot {
    std::optional<std::string> hash;
    std::optional<std::string> branch;
    bool isDetached{false};
    std::optional<std::string> author;
    std::optional<Timestamp> date;
    std::optional<std::string> message;
    std::vector<std::string> parents;
    std::vector<std::string> tags;

    /**
     * @brief Await every accessor of reader
     *
     * Throws GitContextError when the reader is strict and a value fails.
     */
    static GitSnapshot collect(RepositoryReader& reader);
};

}
