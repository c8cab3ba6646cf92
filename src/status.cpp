#include "lunisolar/status.h"

namespace lunisolar {

std::string_view StatusName(StatusCode status) noexcept {
    switch (status) {
        case StatusCode::Ok:
            return "Ok";
        case StatusCode::OutOfRangeYear:
            return "OutOfRangeYear";
        case StatusCode::OutOfRangeMonth:
            return "OutOfRangeMonth";
        case StatusCode::OutOfRangeDay:
            return "OutOfRangeDay";
        case StatusCode::MalformedReferenceSymbol:
            return "MalformedReferenceSymbol";
        case StatusCode::InvalidArgument:
            return "InvalidArgument";
    }
    return "Unknown";
}

}
