/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TIME_OF_DAY_HPP
#define TIME_OF_DAY_HPP

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

namespace SentinelEngine {

enum class TimeOfDay : uint8_t {
    Dawn,       // [5, 7)
    Morning,    // [7, 12)
    Midday,     // [12, 14)
    Afternoon,  // [14, 18)
    Evening,    // [18, 21)
    Night       // otherwise
};

TimeOfDay timeOfDayFromHour(float hour);

// Evening and night reduce NPC sight
bool isLowLight(TimeOfDay timeOfDay);

const char* timeOfDayName(TimeOfDay timeOfDay);
std::optional<TimeOfDay> timeOfDayFromName(const std::string& name);

inline std::ostream& operator<<(std::ostream& os, TimeOfDay timeOfDay) {
    return os << timeOfDayName(timeOfDay);
}

} // namespace SentinelEngine

#endif // TIME_OF_DAY_HPP
