#include "lunisolar/julian_day.h"

#include <array>
#include <cstddef>
#include <cstdint>

#include "lunisolar/tables.h"

namespace lunisolar {
    namespace {
        constexpr std::array<int, 12> kMonthDays{ {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31} };

        // Julian day 0 fell on a Monday.
        constexpr std::array<Weekday, 7> kJulianWeekdays{ {
            Weekday::Monday,
            Weekday::Tuesday,
            Weekday::Wednesday,
            Weekday::Thursday,
            Weekday::Friday,
            Weekday::Saturday,
            Weekday::Sunday
        } };

        inline std::int32_t LeapYearsThrough(std::int32_t year) noexcept {
            return year / 4 - year / 100 + year / 400;
        }
    }

    bool IsSolarLeapYear(int year) noexcept {
        return year % 400 == 0 || (year % 4 == 0 && year % 100 != 0);
    }

    int DaysOfSolarMonth(int year, int month) noexcept {
        if (month == 2 && IsSolarLeapYear(year)) {
            return 29;
        }
        return kMonthDays[static_cast<std::size_t>(month - 1)];
    }

    std::int32_t SolarDaysSinceBase(int year, int month, int day) noexcept {
        const std::int32_t years = year - detail::kBaseSolarYear;
        const std::int32_t leapYears = LeapYearsThrough(year - 1) - LeapYearsThrough(detail::kBaseSolarYear - 1);
        std::int32_t days = years * 365 + leapYears;
        for (int m = 1; m < month; ++m) {
            days += DaysOfSolarMonth(year, m);
        }
        days += day - 1;
        return days;
    }

    std::int32_t DaysSinceBaseToJulianDay(std::int32_t daysSinceBase) noexcept {
        return daysSinceBase + detail::kSolarBaseJulianDay;
    }

    SolarDate JulianDayToSolar(std::int32_t julianDay) noexcept {
        // Numerical Recipes in C, 2nd ed., caldat().
        std::int32_t ja = julianDay;
        if (ja >= kGregorianAdoptionJulianDay) {
            const auto alpha = static_cast<std::int32_t>(((ja - 1867216) - 0.25) / 36524.25);
            ja = ja + 1 + alpha - alpha / 4;
        }

        const std::int32_t jb = ja + 1524;
        const auto jc = static_cast<std::int32_t>(6680.0 + ((jb - 2439870) - 122.1) / 365.25);
        const std::int32_t jd = 365 * jc + jc / 4;
        const auto je = static_cast<std::int32_t>((jb - jd) / 30.6001);

        SolarDate date{};
        date.day = static_cast<int>(jb - jd - static_cast<std::int32_t>(30.6001 * je));
        date.month = static_cast<int>(je - 1);
        if (date.month > 12) {
            date.month -= 12;
        }
        date.year = static_cast<int>(jc - 4715);
        if (date.month > 2) {
            date.year -= 1;
        }
        return date;
    }

    Weekday DayOfWeek(std::int32_t julianDay) noexcept {
        const std::int32_t index = ((julianDay % 7) + 7) % 7;
        return kJulianWeekdays[static_cast<std::size_t>(index)];
    }
}
