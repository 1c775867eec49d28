#include "util/Timestamp.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace gitcontext {

std::chrono::system_clock::time_point Timestamp::instant() const {
    return std::chrono::system_clock::time_point(std::chrono::seconds(epochSeconds));
}

std::string Timestamp::offsetString() const {
    int minutes = std::abs(offsetMinutes);
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%c%02d%02d", offsetMinutes < 0 ? '-' : '+', minutes / 60, minutes % 60);
    return buf;
}

std::string Timestamp::toIso8601() const {
    // Shift the instant by the offset, then format it as if it were UTC
    std::time_t local = static_cast<std::time_t>(epochSeconds + static_cast<int64_t>(offsetMinutes) * 60);
    std::tm tm{};
#ifdef _WIN32
    if (gmtime_s(&tm, &local) != 0) {
        return std::string();
    }
#else
    if (!gmtime_r(&local, &tm)) {
        return std::string();
    }
#endif
    char buffer[32];
    if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm) == 0) {
        return std::string();
    }

    int minutes = std::abs(offsetMinutes);
    char zone[8];
    std::snprintf(zone, sizeof(zone), "%c%02d:%02d", offsetMinutes < 0 ? '-' : '+', minutes / 60, minutes % 60);
    return std::string(buffer) + zone;
}

Expected<int> Timestamp::parseOffset(const std::string& text) {
    std::string digits = text;
    bool negative = false;
    if (!digits.empty() && (digits[0] == '+' || digits[0] == '-')) {
        negative = digits[0] == '-';
        digits.erase(0, 1);
    }
    if (digits.size() != 4) {
        return Error{ErrorCode::MalformedObject, "Invalid timezone offset: " + text};
    }
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return Error{ErrorCode::MalformedObject, "Invalid timezone offset: " + text};
        }
    }
    int hours = (digits[0] - '0') * 10 + (digits[1] - '0');
    int minutes = (digits[2] - '0') * 10 + (digits[3] - '0');
    if (hours > 23 || minutes > 59) {
        return Error{ErrorCode::MalformedObject, "Timezone offset out of range: " + text};
    }
    int total = hours * 60 + minutes;
    return negative ? -total : total;
}

}
