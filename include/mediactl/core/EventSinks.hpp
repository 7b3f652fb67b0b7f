#pragma once
#include <memory>
#include "mediactl/common/Logger.hpp"
#include "mediactl/core/CapabilityLevel.hpp"
#include "mediactl/core/EventDispatcher.hpp"
#include "mediactl/core/MediaControllerCallback.hpp"
#include "mediactl/interfaces/ISessionChannel.hpp"

namespace mediactl {
namespace core {

// ============================================================================
// Event sinks - Transport-side entry points of one registration
// ============================================================================
// A registration owns a base sink (on the base channel) and, once the
// extended channel is attached, an extended sink. Both convert transport
// calls into SessionEvents and hand them to the registration's
// EventDispatcher.
//
// While the extended sink is active, the events it carries are dropped on
// the base sink so each event is delivered exactly once:
//   - playback state, repeat mode, shuffle mode: extended channel only
//   - custom session events: base channel below
//     EventPolicy::session_event_extended_since, extended channel from it on
//   - everything else: base channel only; seeing it on the extended channel
//     is a protocol violation
// ============================================================================

struct EventPolicy {
    CapabilityLevel level = CapabilityLevel::Legacy;
    CapabilityLevel session_event_extended_since = CapabilityLevel::NativePlayFromUri;
    bool strict_protocol = false;

    bool session_events_on_extended() const { return level >= session_event_extended_since; }
};

class BaseChannelSink : public interfaces::ISessionEventSink {
public:
    BaseChannelSink(
        std::shared_ptr<MediaControllerCallback> callback,
        std::shared_ptr<EventDispatcher> dispatcher,
        EventPolicy policy,
        std::shared_ptr<common::ILogger> logger
    );

    void on_event(const std::string& event, const common::Bundle& extras) override;
    void on_session_destroyed() override;
    void on_playback_state_changed(const std::optional<common::PlaybackState>& state) override;
    void on_metadata_changed(const std::optional<common::MediaMetadata>& metadata) override;
    void on_queue_changed(const std::optional<std::vector<common::QueueItem>>& queue) override;
    void on_queue_title_changed(const std::optional<std::string>& title) override;
    void on_extras_changed(const common::Bundle& extras) override;
    void on_volume_info_changed(const std::optional<common::PlaybackInfo>& info) override;
    void on_repeat_mode_changed(common::RepeatMode mode) override;
    void on_shuffle_mode_changed(bool enabled) override;

private:
    // True when the extended sink carries this kind of event
    bool superseded(const char* name) const;

    std::shared_ptr<MediaControllerCallback> callback_;
    std::shared_ptr<EventDispatcher> dispatcher_;
    EventPolicy policy_;
    std::shared_ptr<common::ILogger> logger_;
};

class ExtendedChannelSink : public interfaces::ISessionEventSink {
public:
    ExtendedChannelSink(
        std::shared_ptr<EventDispatcher> dispatcher,
        EventPolicy policy,
        std::shared_ptr<common::ILogger> logger
    );

    void on_event(const std::string& event, const common::Bundle& extras) override;
    void on_session_destroyed() override;
    void on_playback_state_changed(const std::optional<common::PlaybackState>& state) override;
    void on_metadata_changed(const std::optional<common::MediaMetadata>& metadata) override;
    void on_queue_changed(const std::optional<std::vector<common::QueueItem>>& queue) override;
    void on_queue_title_changed(const std::optional<std::string>& title) override;
    void on_extras_changed(const common::Bundle& extras) override;
    void on_volume_info_changed(const std::optional<common::PlaybackInfo>& info) override;
    void on_repeat_mode_changed(common::RepeatMode mode) override;
    void on_shuffle_mode_changed(bool enabled) override;

private:
    // Throws ProtocolViolationError in strict mode, logs otherwise
    void protocol_violation(const char* name);

    std::shared_ptr<EventDispatcher> dispatcher_;
    EventPolicy policy_;
    std::shared_ptr<common::ILogger> logger_;
};

} // namespace core
} // namespace mediactl
