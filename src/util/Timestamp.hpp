#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "util/Expected.hpp"

namespace gitcontext {

/**
 * @brief A point in time together with the UTC offset it was recorded at
 *
 * Git stores "<epoch-seconds> <+HHMM>". The epoch is the instant; the offset
 * is the author's timezone at commit time and is kept as-is, never
 * normalized to UTC or to the local zone.
 */
struct Timestamp {
    int64_t epochSeconds{0};
    int offsetMinutes{0};   // minutes east of UTC (+0200 -> 120)

    std::chrono::system_clock::time_point instant() const;

    /// "+0200", "-0730" (git's own spelling)
    std::string offsetString() const;

    /// Wall clock at the recorded offset, e.g. "2023-11-15T00:13:20+02:00"
    std::string toIso8601() const;

    /**
     * @brief Parse git's "[+-]HHMM" offset
     * @return Minutes east of UTC, or MalformedObject
     *
     * The sign is optional (absent means east). HH must be 00-23 and MM 00-59.
     */
    static Expected<int> parseOffset(const std::string& text);

    bool operator==(const Timestamp& other) const {
        return epochSeconds == other.epochSeconds && offsetMinutes == other.offsetMinutes;
    }
    bool operator!=(const Timestamp& other) const { return !(*this == other); }
};

}
