#pragma once

#include <chrono>

#include "lunisolar/config.h"
#include "lunisolar/converter.h"
#include "lunisolar/korean_lunar_date.h"

namespace lunisolar {
    // Midnight starting the date's solar day, at config.utcOffsetMinutes.
    std::chrono::system_clock::time_point ToSystemTime(const KoreanLunarDate &date, const CalendarConfig &config);

    // Converts the civil day that contains instant at config.utcOffsetMinutes.
    ConversionResult LunarDateOf(std::chrono::system_clock::time_point instant, const CalendarConfig &config);
}
