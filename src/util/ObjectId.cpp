#include "util/ObjectId.hpp"

#include "core/Constants.hpp"

namespace gitcontext {

bool isValidHash(const std::string& hash) {
    if (hash.size() != Constants::SHA1_HEX_LENGTH) {
        return false;
    }
    for (char c : hash) {
        bool digit = c >= '0' && c <= '9';
        bool lowerHex = c >= 'a' && c <= 'f';
        if (!digit && !lowerHex) {
            return false;
        }
    }
    return true;
}

std::string shortHash(const std::string& hash) {
    return hash.length() >= 7 ? hash.substr(0, 7) : hash;
}

}
