#pragma once
#include <stdexcept>
#include <string>
#include "mediactl/common/Result.hpp"

namespace mediactl {
namespace common {

    // ========================================================================
    // Caller-facing errors
    // ========================================================================
    // Only caller-input errors leave the controller as exceptions. Transport
    // failures (RemoteGone) are converted into defaults at the proxy boundary
    // and never reach the caller.
    // ========================================================================

    class ControllerError : public std::runtime_error {
    public:
        ControllerError(ErrorCode code, const std::string& message)
            : std::runtime_error(message), code_(code) {}

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    class InvalidArgumentError : public ControllerError {
    public:
        explicit InvalidArgumentError(const std::string& message)
            : ControllerError(ErrorCode::InvalidArgument, message) {}
    };

    class SessionUnreachableError : public ControllerError {
    public:
        explicit SessionUnreachableError(const std::string& message)
            : ControllerError(ErrorCode::SessionUnreachable, message) {}
    };

    class UnsupportedByRemoteError : public ControllerError {
    public:
        explicit UnsupportedByRemoteError(const std::string& message)
            : ControllerError(ErrorCode::UnsupportedByRemote, message) {}
    };

    // Contract failure between the transport and this library, raised only
    // when strict protocol checking is enabled.
    class ProtocolViolationError : public ControllerError {
    public:
        explicit ProtocolViolationError(const std::string& message)
            : ControllerError(ErrorCode::ProtocolViolation, message) {}
    };

} // namespace common
} // namespace mediactl
