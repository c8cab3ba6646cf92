#include "lunisolar/system_clock_adapter.h"

#include <chrono>
#include <cstdint>

#include "lunisolar/julian_day.h"

namespace lunisolar {
    namespace {
        // Julian day number of 1970-01-01.
        constexpr std::int32_t kUnixEpochJulianDay = 2440588;
    }

    std::chrono::system_clock::time_point ToSystemTime(const KoreanLunarDate &date, const CalendarConfig &config) {
        const std::chrono::sys_days localMidnight{std::chrono::days{date.JulianDay() - kUnixEpochJulianDay}};
        const auto utc = localMidnight - std::chrono::minutes{config.utcOffsetMinutes};
        return std::chrono::time_point_cast<std::chrono::system_clock::duration>(utc);
    }

    ConversionResult LunarDateOf(std::chrono::system_clock::time_point instant, const CalendarConfig &config) {
        const auto local = instant + std::chrono::minutes{config.utcOffsetMinutes};
        const auto days = std::chrono::floor<std::chrono::days>(local).time_since_epoch().count();
        const auto julianDay = static_cast<std::int32_t>(days + kUnixEpochJulianDay);
        const SolarDate solar = JulianDayToSolar(julianDay);
        return LunarDateOf(solar.year, solar.month, solar.day);
    }
}
