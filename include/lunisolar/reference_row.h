#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "lunisolar/korean_lunar_date.h"
#include "lunisolar/status.h"

namespace lunisolar {
    // One day of the published reference dataset, as emitted by the data preparation tool.
    // Columns: solYear, solMonth, solDay, julianDays, solDayOfWeek, solLeapYear, lunYear,
    // lunMonth, lunDay, lunLeapMonth, lunDaysOfMonth, dailyCycle, monthlyCycle, yearlyCycle.
    struct ReferenceRow {
        int solarYear;
        int solarMonth;
        int solarDay;
        std::int32_t julianDay;
        int solarDayOfWeek;
        bool solarLeapYear;
        int lunarYear;
        int lunarMonth;
        int lunarDay;
        bool lunarLeapMonth;
        int lunarDaysOfMonth;
        int dailyCycle;
        int monthlyCycle;
        int yearlyCycle;
    };

    constexpr std::size_t kReferenceColumnCount = 14;

    // Cycle columns take either a number in [0, 60] or a sexagenary label in either script.
    StatusCode ParseReferenceRow(std::string_view line, ReferenceRow &outRow, std::string &outDiagnostics);

    // Skips the header line and blank lines; stops at the first malformed row.
    StatusCode LoadReferenceRows(std::istream &input, std::vector<ReferenceRow> &outRows, std::string &outDiagnostics);

    bool Matches(const ReferenceRow &row, const KoreanLunarDate &date) noexcept;
}
