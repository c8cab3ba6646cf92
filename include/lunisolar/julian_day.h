#pragma once

#include <cstdint>

namespace lunisolar {
    // Numbering follows the reference dataset: Sunday is 1, Saturday is 7.
    enum class Weekday : std::uint8_t {
        Sunday = 1,
        Monday,
        Tuesday,
        Wednesday,
        Thursday,
        Friday,
        Saturday
    };

    struct SolarDate {
        int year;
        int month;
        int day;
    };

    // First Julian day computed with the Gregorian correction (1582-10-15).
    constexpr std::int32_t kGregorianAdoptionJulianDay = 2299161;

    bool IsSolarLeapYear(int year) noexcept;

    // month must be in [1, 12].
    int DaysOfSolarMonth(int year, int month) noexcept;

    // Days from solar 1900-01-01 to the given date; the date must not precede 1900-01-01.
    std::int32_t SolarDaysSinceBase(int year, int month, int day) noexcept;

    std::int32_t DaysSinceBaseToJulianDay(std::int32_t daysSinceBase) noexcept;

    SolarDate JulianDayToSolar(std::int32_t julianDay) noexcept;

    Weekday DayOfWeek(std::int32_t julianDay) noexcept;
}
