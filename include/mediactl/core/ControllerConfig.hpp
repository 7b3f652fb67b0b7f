#pragma once
#include <memory>
#include <optional>
#include "mediactl/common/Logger.hpp"
#include "mediactl/core/CapabilityLevel.hpp"

namespace mediactl {
namespace core {

#ifdef MEDIACTL_DEBUG
constexpr bool kStrictProtocolDefault = true;
#else
constexpr bool kStrictProtocolDefault = false;
#endif

// ============================================================================
// ControllerConfig - Per-controller settings
// ============================================================================

struct ControllerConfig {
    // Unset: use Environment::instance().capability_level()
    std::optional<CapabilityLevel> capability_level;

    // From this level on, custom session events are taken from the extended
    // channel; below it they are taken from the base channel
    CapabilityLevel session_event_extended_since = CapabilityLevel::NativePlayFromUri;

    // Throw ProtocolViolationError on events that arrive on a channel that
    // must not carry them. When false they are logged and dropped.
    bool strict_protocol = kStrictProtocolDefault;

    // Null: common::default_logger()
    std::shared_ptr<common::ILogger> logger;

    CapabilityLevel resolved_level() const {
        return capability_level ? *capability_level : Environment::instance().capability_level();
    }

    std::shared_ptr<common::ILogger> resolved_logger() const {
        return logger ? logger : common::default_logger();
    }
};

} // namespace core
} // namespace mediactl
