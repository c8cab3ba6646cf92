#pragma once

#include <cstdint>

namespace lunisolar::detail {
    constexpr int kBaseLunarYear = 1900;
    constexpr int kEndLunarYear = 2049;
    constexpr int kBaseSolarYear = 1900;
    constexpr int kEndSolarYear = 2049;
    constexpr int kCoveredYears = kEndLunarYear - kBaseLunarYear + 1;

    constexpr int kShortLunarMonthDays = 29;
    constexpr int kLongLunarMonthDays = 30;

    // Julian day numbers of solar 1900-01-01 and of lunar 1900-01-01 (solar 1900-01-31).
    constexpr std::int32_t kSolarBaseJulianDay = 2415021;
    constexpr std::int32_t kLunarBaseJulianDay = 2415051;
    constexpr std::int32_t kLunarEpochOffset = kLunarBaseJulianDay - kSolarBaseJulianDay;

    struct YearRecord {
        // Bit (12 - month) set means that month has 30 days.
        std::uint16_t monthLengthBits;
        // 0 when the year has no leap month.
        int leapMonth;
    };

    // All lookups below expect lunarYear in [kBaseLunarYear, kEndLunarYear].
    YearRecord DecodeYearRecord(int lunarYear) noexcept;

    bool IsLongLeapMonth(int lunarYear) noexcept;

    // Days from lunar 1900-01-01 to the first day of lunarYear.
    std::int32_t YearBaseOffset(int lunarYear) noexcept;

    // Lunar year whose base offset is the greatest one not exceeding daysSinceLunarBase.
    // daysSinceLunarBase must not be negative.
    int YearOfOffset(std::int32_t daysSinceLunarBase) noexcept;
}
