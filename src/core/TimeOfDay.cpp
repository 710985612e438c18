/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/TimeOfDay.hpp"
#include <cmath>

namespace SentinelEngine {

TimeOfDay timeOfDayFromHour(float hour) {
    // Wrap into [0, 24)
    float h = std::fmod(hour, 24.0f);
    if (h < 0.0f) {
        h += 24.0f;
    }

    if (h >= 5.0f && h < 7.0f) return TimeOfDay::Dawn;
    if (h >= 7.0f && h < 12.0f) return TimeOfDay::Morning;
    if (h >= 12.0f && h < 14.0f) return TimeOfDay::Midday;
    if (h >= 14.0f && h < 18.0f) return TimeOfDay::Afternoon;
    if (h >= 18.0f && h < 21.0f) return TimeOfDay::Evening;
    return TimeOfDay::Night;
}

bool isLowLight(TimeOfDay timeOfDay) {
    return timeOfDay == TimeOfDay::Evening || timeOfDay == TimeOfDay::Night;
}

const char* timeOfDayName(TimeOfDay timeOfDay) {
    switch (timeOfDay) {
        case TimeOfDay::Dawn: return "dawn";
        case TimeOfDay::Morning: return "morning";
        case TimeOfDay::Midday: return "midday";
        case TimeOfDay::Afternoon: return "afternoon";
        case TimeOfDay::Evening: return "evening";
        case TimeOfDay::Night: return "night";
    }
    return "midday";
}

std::optional<TimeOfDay> timeOfDayFromName(const std::string& name) {
    if (name == "dawn") return TimeOfDay::Dawn;
    if (name == "morning") return TimeOfDay::Morning;
    if (name == "midday") return TimeOfDay::Midday;
    if (name == "afternoon") return TimeOfDay::Afternoon;
    if (name == "evening") return TimeOfDay::Evening;
    if (name == "night") return TimeOfDay::Night;
    return std::nullopt;
}

} // namespace SentinelEngine
