#include "mediactl/common/Result.hpp"

namespace mediactl {
namespace common {

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:             return "Success";
        case ErrorCode::InvalidArgument:     return "InvalidArgument";
        case ErrorCode::SessionUnreachable:  return "SessionUnreachable";
        case ErrorCode::RemoteGone:          return "RemoteGone";
        case ErrorCode::UnsupportedByRemote: return "UnsupportedByRemote";
        case ErrorCode::ProtocolViolation:   return "ProtocolViolation";
        case ErrorCode::Unknown:             break;
    }
    return "Unknown";
}

} // namespace common
} // namespace mediactl
