#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "lunisolar/status.h"

namespace lunisolar {
    enum class Script : std::uint8_t {
        Chinese,
        Korean
    };

    // Cycle numbers run 1..60. 0 marks a leap month, which carries no monthly cycle.
    constexpr int kSexagenaryCycleLength = 60;

    int YearlyCycleOf(int lunarYear) noexcept;
    int MonthlyCycleOf(int lunarYear, int lunarMonth, bool isLeapMonth) noexcept;
    int DailyCycleOf(std::int32_t julianDay) noexcept;

    // UTF-8 symbols; empty for cycle 0 or any number outside 1..60.
    std::string_view HeavenlyStem(int cycle, Script script) noexcept;
    std::string_view EarthlyBranch(int cycle, Script script) noexcept;
    std::string SexagenaryLabel(int cycle, Script script);

    // Accepts a stem+branch pair in either script, or an empty label (cycle 0).
    StatusCode ParseSexagenaryLabel(std::string_view label, int &outCycle) noexcept;
}
