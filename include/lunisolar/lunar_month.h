#pragma once

#include "lunisolar/status.h"

namespace lunisolar {
    // Leap month of lunarYear, 0 when the year has none.
    StatusCode LeapMonthOf(int lunarYear, int &outLeapMonth) noexcept;

    // Length (29 or 30) of the given lunar month. isLeapMonth is ignored unless
    // lunarMonth is the year's leap month.
    StatusCode DaysOfLunarMonth(int lunarYear, int lunarMonth, bool isLeapMonth, int &outDays) noexcept;

    // Length of the regular (non-leap) lunar month.
    StatusCode DaysOfLunarMonth(int lunarYear, int lunarMonth, int &outDays) noexcept;

    namespace detail {
        // Unchecked variants; lunarYear and lunarMonth must already be in range.
        int LeapMonthOfYear(int lunarYear) noexcept;

        bool ResolveLeapFlag(int lunarYear, int lunarMonth, bool isLeapMonth) noexcept;

        int DaysOfMonth(int lunarYear, int lunarMonth, bool isLeapMonth) noexcept;

        int DaysOfYear(int lunarYear) noexcept;
    }
}
