#pragma once

#include <string>

#include "lunisolar/status.h"

namespace lunisolar {
    // Supported solar range: 1900-02-01 .. 2049-12-31.
    StatusCode ValidateSolarDate(int solarYear, int solarMonth, int solarDay, std::string &outDiagnostics);

    // Supported lunar range: 1900-01-01 .. 2049-12-29. The day bound is the month's true length,
    // leap months included; isLeapMonth is ignored unless lunarMonth is the year's leap month.
    StatusCode ValidateLunarDate(int lunarYear,
                                 int lunarMonth,
                                 int lunarDay,
                                 bool isLeapMonth,
                                 std::string &outDiagnostics);
}
