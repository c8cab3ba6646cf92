#pragma once

#include <optional>
#include <string>

#include "lunisolar/korean_lunar_date.h"
#include "lunisolar/status.h"

namespace lunisolar {
    struct ConversionResult {
        StatusCode status;
        // Engaged only when status is StatusCode::Ok.
        std::optional<KoreanLunarDate> date;
        std::string diagnostics;
    };

    // Solar date in [1900-02-01, 2049-12-31].
    ConversionResult LunarDateOf(int solarYear, int solarMonth, int solarDay);

    // Lunar date in [1900-01-01, 2049-12-29]. A leap flag on a month that is not the
    // year's leap month is treated as false.
    ConversionResult SolarDateOf(int lunarYear, int lunarMonth, int lunarDay, bool isLeapMonth = false);
}
