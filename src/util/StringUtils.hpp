#pragma once

#include <string>

namespace gitcontext {
namespace StringUtils {

/// Strip leading and trailing ASCII whitespace (space, tab, CR, LF, VT, FF)
std::string trim(const std::string& text);

bool startsWith(const std::string& text, const std::string& prefix);

/**
 * @brief Quote text as a C++ string literal
 *
 * Escapes quotes, backslashes and control characters. Non-printable bytes
 * are written as three-digit octal escapes so a following digit can never
 * extend the escape. Bytes >= 0x80 pass through unchanged (UTF-8).
 */
std::string toCppLiteral(const std::string& text);

}
}
