#include "alphaforge/errors.hpp"

namespace af {

const char* to_string(ErrorCode code) {
    switch (code) {
    case ErrorCode::InvalidColorFormat:    return "InvalidColorFormat";
    case ErrorCode::InvalidColorComponent: return "InvalidColorComponent";
    case ErrorCode::InvalidAngle:          return "InvalidAngle";
    case ErrorCode::InvalidDirection:      return "InvalidDirection";
    case ErrorCode::RegionOutOfBounds:     return "RegionOutOfBounds";
    case ErrorCode::UnsupportedFilterKind: return "UnsupportedFilterKind";
    }
    return "Unknown";
}

} // namespace af
