#pragma once

#include <string_view>

namespace lunisolar {

enum class StatusCode {
    Ok = 0,
    OutOfRangeYear,
    OutOfRangeMonth,
    OutOfRangeDay,
    MalformedReferenceSymbol,
    InvalidArgument
};

std::string_view StatusName(StatusCode status) noexcept;

}
