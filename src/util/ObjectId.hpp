#pragma once

#include <string>

namespace gitcontext {

/**
 * @brief Check that a string is a well-formed SHA-1 object id
 *
 * True iff the string is exactly 40 characters of lowercase hex. Every hash
 * read from HEAD, refs, commit fields and tag objects passes through here
 * before it is used as a path component, which also keeps "../" out of
 * object paths.
 */
bool isValidHash(const std::string& hash);

/// First 7 characters, as git abbreviates
std::string shortHash(const std::string& hash);

}
