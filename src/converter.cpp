#include "lunisolar/converter.h"

#include <cstdint>
#include <utility>

#include "lunisolar/julian_day.h"
#include "lunisolar/lunar_month.h"
#include "lunisolar/tables.h"
#include "lunisolar/validation.h"

namespace lunisolar {
    namespace {
        ConversionResult Reject(StatusCode status, std::string diagnostics) {
            ConversionResult result{};
            result.status = status;
            result.diagnostics = std::move(diagnostics);
            return result;
        }

        ConversionResult Accept(const KoreanLunarDate &date) {
            ConversionResult result{};
            result.status = StatusCode::Ok;
            result.date.emplace(date);
            return result;
        }
    }

    ConversionResult LunarDateOf(int solarYear, int solarMonth, int solarDay) {
        std::string diagnostics;
        auto status = ValidateSolarDate(solarYear, solarMonth, solarDay, diagnostics);
        if (status != StatusCode::Ok) {
            return Reject(status, std::move(diagnostics));
        }

        const std::int32_t daysSinceBase = SolarDaysSinceBase(solarYear, solarMonth, solarDay);
        const std::int32_t julianDay = DaysSinceBaseToJulianDay(daysSinceBase);
        std::int32_t daysLeft = daysSinceBase - detail::kLunarEpochOffset;

        const int lunarYear = detail::YearOfOffset(daysLeft);
        daysLeft -= detail::YearBaseOffset(lunarYear);

        // The leap month repeats its month number, so the walk spends two passes on it:
        // the regular month first, then the inserted one with inLeapMonth raised.
        const int leapMonth = detail::LeapMonthOfYear(lunarYear);
        int lunarMonth = 1;
        bool inLeapMonth = false;
        bool leapMonthPassed = false;
        int daysOfMonth = detail::DaysOfMonth(lunarYear, lunarMonth, false);
        while (daysLeft >= daysOfMonth) {
            if (lunarMonth == leapMonth) {
                if (inLeapMonth) {
                    inLeapMonth = false;
                } else {
                    inLeapMonth = true;
                    leapMonthPassed = true;
                }
            }
            if (!inLeapMonth) {
                ++lunarMonth;
            }
            daysLeft -= daysOfMonth;
            daysOfMonth = detail::DaysOfMonth(lunarYear, lunarMonth, inLeapMonth);
        }

        const bool isLeapMonth = leapMonthPassed && lunarMonth == leapMonth;
        const SolarDate solar{solarYear, solarMonth, solarDay};
        return Accept(detail::AssembleDate(solar,
                                           julianDay,
                                           lunarYear,
                                           lunarMonth,
                                           static_cast<int>(daysLeft) + 1,
                                           isLeapMonth));
    }

    ConversionResult SolarDateOf(int lunarYear, int lunarMonth, int lunarDay, bool isLeapMonth) {
        std::string diagnostics;
        auto status = ValidateLunarDate(lunarYear, lunarMonth, lunarDay, isLeapMonth, diagnostics);
        if (status != StatusCode::Ok) {
            return Reject(status, std::move(diagnostics));
        }

        const int leapMonth = detail::LeapMonthOfYear(lunarYear);
        const bool leap = detail::ResolveLeapFlag(lunarYear, lunarMonth, isLeapMonth);

        std::int32_t offset = detail::YearBaseOffset(lunarYear);
        for (int month = 1; month < lunarMonth; ++month) {
            offset += detail::DaysOfMonth(lunarYear, month, false);
        }
        // A leap month follows the regular month sharing its number.
        if (leap) {
            offset += detail::DaysOfMonth(lunarYear, lunarMonth, false);
        }
        if (leapMonth != 0 && lunarMonth > leapMonth) {
            offset += detail::DaysOfMonth(lunarYear, leapMonth, true);
        }
        offset += lunarDay - 1;

        const std::int32_t julianDay = offset + detail::kLunarBaseJulianDay;
        return Accept(detail::AssembleDate(JulianDayToSolar(julianDay),
                                           julianDay,
                                           lunarYear,
                                           lunarMonth,
                                           lunarDay,
                                           leap));
    }
}
