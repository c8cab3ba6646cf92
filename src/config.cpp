#include "lunisolar/config.h"

namespace lunisolar {

CalendarConfig MakeDefaultConfig() {
    CalendarConfig config{};
    config.labelStyle = LabelStyle::Both;
    // Korea Standard Time, UTC+09:00.
    config.utcOffsetMinutes = 9 * 60;
    return config;
}

}
