#include "lunisolar/validation.h"

#include <string>

#include "lunisolar/julian_day.h"
#include "lunisolar/lunar_month.h"
#include "lunisolar/tables.h"

namespace lunisolar {
    namespace {
        std::string YearMonthText(int year, int month) {
            std::string text = std::to_string(year);
            text.append(month < 10 ? "-0" : "-");
            text.append(std::to_string(month));
            return text;
        }

        StatusCode RejectDay(int year, int month, bool isLeapMonth, int maxDays, std::string &outDiagnostics) {
            outDiagnostics = "Day must be bound between 1 and ";
            outDiagnostics.append(std::to_string(maxDays));
            outDiagnostics.append(" for date ");
            outDiagnostics.append(YearMonthText(year, month));
            if (isLeapMonth) {
                outDiagnostics.append(" (leap month)");
            }
            return StatusCode::OutOfRangeDay;
        }

        StatusCode RejectMonth(std::string &outDiagnostics) {
            outDiagnostics = "Month must be bound between 1 and 12";
            return StatusCode::OutOfRangeMonth;
        }
    }

    StatusCode ValidateSolarDate(int solarYear, int solarMonth, int solarDay, std::string &outDiagnostics) {
        outDiagnostics.clear();
        if (solarYear < detail::kBaseSolarYear || solarYear > detail::kEndSolarYear) {
            outDiagnostics = "Solar year " + std::to_string(solarYear) + " is not in bounds ("
                             + std::to_string(detail::kBaseSolarYear) + " - "
                             + std::to_string(detail::kEndSolarYear) + ")";
            return StatusCode::OutOfRangeYear;
        }
        if (solarMonth < 1 || solarMonth > 12) {
            return RejectMonth(outDiagnostics);
        }
        // The lunar tables begin on solar 1900-01-31, one month into the first solar year.
        if (solarYear == detail::kBaseSolarYear && solarMonth == 1) {
            outDiagnostics = "Solar dates are supported since 1900-02-01";
            return StatusCode::OutOfRangeDay;
        }
        const int maxDays = DaysOfSolarMonth(solarYear, solarMonth);
        if (solarDay < 1 || solarDay > maxDays) {
            return RejectDay(solarYear, solarMonth, false, maxDays, outDiagnostics);
        }
        return StatusCode::Ok;
    }

    StatusCode ValidateLunarDate(int lunarYear,
                                 int lunarMonth,
                                 int lunarDay,
                                 bool isLeapMonth,
                                 std::string &outDiagnostics) {
        outDiagnostics.clear();
        if (lunarYear < detail::kBaseLunarYear || lunarYear > detail::kEndLunarYear) {
            outDiagnostics = "Lunar year " + std::to_string(lunarYear) + " is not in bounds ("
                             + std::to_string(detail::kBaseLunarYear) + " - "
                             + std::to_string(detail::kEndLunarYear) + ")";
            return StatusCode::OutOfRangeYear;
        }
        if (lunarMonth < 1 || lunarMonth > 12) {
            return RejectMonth(outDiagnostics);
        }
        const bool leap = detail::ResolveLeapFlag(lunarYear, lunarMonth, isLeapMonth);
        const int maxDays = detail::DaysOfMonth(lunarYear, lunarMonth, leap);
        if (lunarDay < 1 || lunarDay > maxDays) {
            return RejectDay(lunarYear, lunarMonth, leap, maxDays, outDiagnostics);
        }
        return StatusCode::Ok;
    }
}
