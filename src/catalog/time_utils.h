#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lexsched
{
    // bit i set = day i of the week is part of the pattern (0 = Monday)
    using DayMask = std::uint32_t;

    // "9:00" / "13:45" -> minutes since midnight; throws std::invalid_argument
    int time_to_minutes(const std::string &hhmm);

    // 545 -> "09:05"
    std::string minutes_to_time(int minutes);

    // Day patterns are sequences of M, T, W, TH, F, SA, SU tokens ("MWF", "TTH").
    // Throws std::invalid_argument on an empty or unknown pattern.
    DayMask parse_days(const std::string &pattern);

    std::vector<std::string> expand_days(const std::string &pattern);

    inline bool days_intersect(DayMask a, DayMask b) noexcept
    {
        return (a & b) != 0;
    }
}
