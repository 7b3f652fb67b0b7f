#pragma once
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "mediactl/common/Bundle.hpp"
#include "mediactl/common/MediaTypes.hpp"
#include "mediactl/core/SessionEvent.hpp"

namespace mediactl {
namespace core {

class CallbackRegistry;

/**
 * @brief Receives updates from a session.
 *
 * Override the handlers of interest; the defaults do nothing. All handlers
 * run on the dispatch target given to MediaController::register_callback,
 * one at a time and in the order the session produced the events.
 *
 * A callback instance may be registered with at most one controller at a
 * time.
 */
class MediaControllerCallback {
public:
    MediaControllerCallback() = default;
    virtual ~MediaControllerCallback() = default;

    MediaControllerCallback(const MediaControllerCallback&) = delete;
    MediaControllerCallback& operator=(const MediaControllerCallback&) = delete;

    /**
     * @brief The session is gone. Nothing else is delivered after this.
     */
    virtual void on_session_destroyed() {}

    /**
     * @brief Custom event sent by the session owner.
     * @param event Event name
     * @param extras Optional parameters
     */
    virtual void on_session_event(const std::string& event, const common::Bundle& extras) {
        (void)event;
        (void)extras;
    }

    virtual void on_playback_state_changed(const std::optional<common::PlaybackState>& state) { (void)state; }
    virtual void on_metadata_changed(const std::optional<common::MediaMetadata>& metadata) { (void)metadata; }
    virtual void on_queue_changed(const std::optional<std::vector<common::QueueItem>>& queue) { (void)queue; }
    virtual void on_queue_title_changed(const std::optional<std::string>& title) { (void)title; }
    virtual void on_extras_changed(const common::Bundle& extras) { (void)extras; }

    /**
     * @brief Volume handling (local/remote playback, max/current volume) changed.
     */
    virtual void on_audio_info_changed(const std::optional<common::PlaybackInfo>& info) { (void)info; }

    virtual void on_repeat_mode_changed(common::RepeatMode mode) { (void)mode; }
    virtual void on_shuffle_mode_changed(bool enabled) { (void)enabled; }

    // ========== Registration State ==========

    bool is_registered() const { return registered_.load(std::memory_order_acquire); }

    // True once events for this registration also arrive on the extended channel
    bool has_extended_channel() const { return has_extended_channel_.load(std::memory_order_acquire); }

    // Invokes the handler matching `event`
    void deliver(const SessionEvent& event);

private:
    friend class CallbackRegistry;

    std::atomic<bool> registered_{false};
    std::atomic<bool> has_extended_channel_{false};

    // Id of the registry that last registered this callback, 0 if none
    std::atomic<uint64_t> registry_id_{0};
};

} // namespace core
} // namespace mediactl
