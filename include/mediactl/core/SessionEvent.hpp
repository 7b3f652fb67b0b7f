#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "mediactl/common/Bundle.hpp"
#include "mediactl/common/MediaTypes.hpp"

namespace mediactl {
namespace core {

// ============================================================================
// SessionEvent - Typed message for one remote event
// ============================================================================
// Events from the transport's delivery thread are converted into one of
// these and queued for the registration's dispatch target.
// ============================================================================

namespace events {

    struct Custom {
        std::string event;
        common::Bundle extras;
    };

    struct PlaybackStateChanged {
        std::optional<common::PlaybackState> state;
    };

    struct MetadataChanged {
        std::optional<common::MediaMetadata> metadata;
    };

    struct QueueChanged {
        std::optional<std::vector<common::QueueItem>> queue;
    };

    struct QueueTitleChanged {
        std::optional<std::string> title;
    };

    struct ExtrasChanged {
        common::Bundle extras;
    };

    struct VolumeChanged {
        std::optional<common::PlaybackInfo> info;
    };

    struct RepeatModeChanged {
        common::RepeatMode mode = common::RepeatMode::None;
    };

    struct ShuffleModeChanged {
        bool enabled = false;
    };

    struct SessionDestroyed {};

} // namespace events

using SessionEvent = std::variant<
    events::Custom,
    events::PlaybackStateChanged,
    events::MetadataChanged,
    events::QueueChanged,
    events::QueueTitleChanged,
    events::ExtrasChanged,
    events::VolumeChanged,
    events::RepeatModeChanged,
    events::ShuffleModeChanged,
    events::SessionDestroyed
>;

const char* session_event_name(const SessionEvent& event) noexcept;

inline bool is_session_destroyed(const SessionEvent& event) {
    return std::holds_alternative<events::SessionDestroyed>(event);
}

} // namespace core
} // namespace mediactl
