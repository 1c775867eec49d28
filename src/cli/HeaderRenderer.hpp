#pragma once

#include <string>

#include "core/GitSnapshot.hpp"

namespace gitcontext {

/**
 * @brief Render a snapshot as a C++17 header of inline constexpr constants
 *
 * Layout (inside namespace ns):
 *   std::optional<std::string_view> hash, branch, author, message
 *   bool is_detached
 *   std::optional<std::int64_t> date_epoch_seconds
 *   std::optional<int> date_offset_minutes
 *   std::optional<std::string_view> date_iso8601
 *   std::array<std::string_view, N> parents, tags
 *
 * ns may be a nested name ("myapp::build").
 */
std::string renderHeader(const GitSnapshot& snapshot, const std::string& ns);

/// True if ns is a valid (possibly nested) C++ namespace name
bool isValidNamespace(const std::string& ns);

}
