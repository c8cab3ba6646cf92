#pragma once

#include <cstdint>

namespace lunisolar {
    enum class LabelStyle {
        Chinese,
        Korean,
        Both
    };

    struct CalendarConfig {
        LabelStyle labelStyle;
        std::int32_t utcOffsetMinutes;
    };

    CalendarConfig MakeDefaultConfig();
}
