#pragma once

#include <cstdint>
#include <string>

#include "lunisolar/config.h"
#include "lunisolar/julian_day.h"

namespace lunisolar {
    class KoreanLunarDate;

    namespace detail {
        // Derives weekday, month length and cycle numbers, then builds the value in one step.
        KoreanLunarDate AssembleDate(const SolarDate &solar,
                                     std::int32_t julianDay,
                                     int lunarYear,
                                     int lunarMonth,
                                     int lunarDay,
                                     bool isLeapMonth);
    }

    // One day expressed in both calendars. Only the converters create it.
    class KoreanLunarDate final {
    public:
        int SolarYear() const noexcept { return m_SolarYear; }
        int SolarMonth() const noexcept { return m_SolarMonth; }
        int SolarDay() const noexcept { return m_SolarDay; }
        Weekday SolarDayOfWeek() const noexcept { return m_SolarDayOfWeek; }
        bool IsSolarLeapYear() const noexcept { return m_SolarLeapYear; }

        // Julian day number, counted from 1 January 4713 BC.
        std::int32_t JulianDay() const noexcept { return m_JulianDay; }

        int LunarYear() const noexcept { return m_LunarYear; }
        int LunarMonth() const noexcept { return m_LunarMonth; }
        int LunarDay() const noexcept { return m_LunarDay; }
        bool IsLunarLeapMonth() const noexcept { return m_LunarLeapMonth; }
        int LunarDaysOfMonth() const noexcept { return m_LunarDaysOfMonth; }

        int DailyCycle() const noexcept { return m_DailyCycle; }
        // 0 exactly when IsLunarLeapMonth() is true.
        int MonthlyCycle() const noexcept { return m_MonthlyCycle; }
        int YearlyCycle() const noexcept { return m_YearlyCycle; }

        std::string Describe(const CalendarConfig &config) const;

        bool operator==(const KoreanLunarDate &other) const noexcept = default;

    private:
        KoreanLunarDate(const SolarDate &solar,
                        Weekday dayOfWeek,
                        std::int32_t julianDay,
                        int lunarYear,
                        int lunarMonth,
                        int lunarDay,
                        bool isLeapMonth,
                        int lunarDaysOfMonth,
                        int dailyCycle,
                        int monthlyCycle,
                        int yearlyCycle) noexcept;

        friend KoreanLunarDate detail::AssembleDate(const SolarDate &solar,
                                                    std::int32_t julianDay,
                                                    int lunarYear,
                                                    int lunarMonth,
                                                    int lunarDay,
                                                    bool isLeapMonth);

        int m_SolarYear;
        int m_SolarMonth;
        int m_SolarDay;
        Weekday m_SolarDayOfWeek;
        bool m_SolarLeapYear;
        std::int32_t m_JulianDay;
        int m_LunarYear;
        int m_LunarMonth;
        int m_LunarDay;
        bool m_LunarLeapMonth;
        int m_LunarDaysOfMonth;
        int m_DailyCycle;
        int m_MonthlyCycle;
        int m_YearlyCycle;
    };
}
