#include "lunisolar/lunar_month.h"

#include "lunisolar/tables.h"

namespace lunisolar {
    namespace detail {
        int LeapMonthOfYear(int lunarYear) noexcept {
            return DecodeYearRecord(lunarYear).leapMonth;
        }

        bool ResolveLeapFlag(int lunarYear, int lunarMonth, bool isLeapMonth) noexcept {
            return isLeapMonth && LeapMonthOfYear(lunarYear) == lunarMonth;
        }

        int DaysOfMonth(int lunarYear, int lunarMonth, bool isLeapMonth) noexcept {
            if (ResolveLeapFlag(lunarYear, lunarMonth, isLeapMonth)) {
                return IsLongLeapMonth(lunarYear) ? kLongLunarMonthDays : kShortLunarMonthDays;
            }
            const auto bits = DecodeYearRecord(lunarYear).monthLengthBits;
            const unsigned bit = (bits >> (12 - lunarMonth)) & 1u;
            return bit != 0 ? kLongLunarMonthDays : kShortLunarMonthDays;
        }

        int DaysOfYear(int lunarYear) noexcept {
            int days = 0;
            for (int month = 1; month <= 12; ++month) {
                days += DaysOfMonth(lunarYear, month, false);
            }
            const int leapMonth = LeapMonthOfYear(lunarYear);
            if (leapMonth != 0) {
                days += DaysOfMonth(lunarYear, leapMonth, true);
            }
            return days;
        }
    }

    StatusCode LeapMonthOf(int lunarYear, int &outLeapMonth) noexcept {
        if (lunarYear < detail::kBaseLunarYear || lunarYear > detail::kEndLunarYear) {
            outLeapMonth = 0;
            return StatusCode::OutOfRangeYear;
        }
        outLeapMonth = detail::LeapMonthOfYear(lunarYear);
        return StatusCode::Ok;
    }

    StatusCode DaysOfLunarMonth(int lunarYear, int lunarMonth, bool isLeapMonth, int &outDays) noexcept {
        outDays = 0;
        if (lunarYear < detail::kBaseLunarYear || lunarYear > detail::kEndLunarYear) {
            return StatusCode::OutOfRangeYear;
        }
        if (lunarMonth < 1 || lunarMonth > 12) {
            return StatusCode::OutOfRangeMonth;
        }
        outDays = detail::DaysOfMonth(lunarYear, lunarMonth, isLeapMonth);
        return StatusCode::Ok;
    }

    StatusCode DaysOfLunarMonth(int lunarYear, int lunarMonth, int &outDays) noexcept {
        return DaysOfLunarMonth(lunarYear, lunarMonth, false, outDays);
    }
}
