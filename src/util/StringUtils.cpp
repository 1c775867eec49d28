#include "util/StringUtils.hpp"

#include <cstdio>

namespace gitcontext {
namespace StringUtils {

namespace {
constexpr const char* WHITESPACE = " \t\r\n\v\f";
}

std::string trim(const std::string& text) {
    size_t first = text.find_first_not_of(WHITESPACE);
    if (first == std::string::npos) {
        return std::string();
    }
    size_t last = text.find_last_not_of(WHITESPACE);
    return text.substr(first, last - first + 1);
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.rfind(prefix, 0) == 0;
}

std::string toCppLiteral(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 2);
    out += '"';
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '?': out += "\\?"; break;  // no trigraphs
            default:
                if (uc < 0x20 || uc == 0x7f) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\%03o", static_cast<unsigned>(uc));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

}
}
