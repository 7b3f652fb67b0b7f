#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "mediactl/common/Bundle.hpp"
#include "mediactl/common/ControllerError.hpp"
#include "mediactl/common/MediaTypes.hpp"
#include "mediactl/core/ControllerConfig.hpp"
#include "mediactl/core/ControllerProxy.hpp"
#include "mediactl/core/MediaControllerCallback.hpp"
#include "mediactl/core/SessionToken.hpp"
#include "mediactl/core/TransportControls.hpp"
#include "mediactl/interfaces/IDispatchTarget.hpp"

namespace mediactl {
namespace core {

// ============================================================================
// MediaController - Client of one remote media session
// ============================================================================
// Bound to a SessionToken for life. The capability level is resolved once,
// at construction, and selects how every operation is carried out.
//
// Usage:
//   core::MediaController controller(token);
//   auto looper = std::make_shared<core::LooperThread>("ui");
//   controller.register_callback(callback, looper);
//   controller.get_transport_controls().play();
//
// Errors:
//   InvalidArgumentError     - missing or malformed argument
//   SessionUnreachableError  - the token could not be bound (constructor)
//   UnsupportedByRemoteError - queue mutation on a session without queue support
//   A session that dies later never causes an exception; queries return
//   their defaults and on_session_destroyed() is delivered to callbacks.
//
// Thread Safety: all methods may be called from any thread.
// ============================================================================

class MediaController {
public:
    /**
     * @throws SessionUnreachableError if the token has no channel or the session is dead
     */
    explicit MediaController(SessionToken token, ControllerConfig config = ControllerConfig());
    ~MediaController();

    MediaController(const MediaController&) = delete;
    MediaController& operator=(const MediaController&) = delete;

    // ========== Session ==========

    const SessionToken& get_session_token() const { return token_; }
    CapabilityLevel capability_level() const { return proxy_->profile().level; }
    bool is_extended_channel_ready() const { return proxy_->is_extended_channel_ready(); }
    TransportControls& get_transport_controls() { return *transport_controls_; }

    // ========== Queries ==========

    std::optional<common::PlaybackState> get_playback_state() { return proxy_->get_playback_state(); }
    std::optional<common::MediaMetadata> get_metadata() { return proxy_->get_metadata(); }
    std::optional<std::vector<common::QueueItem>> get_queue() { return proxy_->get_queue(); }
    std::optional<std::string> get_queue_title() { return proxy_->get_queue_title(); }
    std::optional<common::Bundle> get_extras() { return proxy_->get_extras(); }
    common::RatingStyle get_rating_type() { return proxy_->get_rating_type(); }
    common::RepeatMode get_repeat_mode() { return proxy_->get_repeat_mode(); }
    bool is_shuffle_mode_enabled() { return proxy_->is_shuffle_mode_enabled(); }
    uint64_t get_flags() { return proxy_->get_flags(); }
    std::optional<common::PlaybackInfo> get_playback_info() { return proxy_->get_playback_info(); }
    std::optional<std::string> get_session_activity() { return proxy_->get_session_activity(); }
    std::optional<std::string> get_package_name() { return proxy_->get_package_name(); }

    // ========== Commands ==========

    void set_volume_to(int32_t value, int32_t flags) { proxy_->set_volume_to(value, flags); }
    void adjust_volume(int32_t direction, int32_t flags) { proxy_->adjust_volume(direction, flags); }

    /**
     * @brief Send a generic command to the session.
     * @param receiver Optional; gets the session's reply
     * @throws InvalidArgumentError if `command` is empty or reserved
     */
    void send_command(
        const std::string& command,
        const common::Bundle& params = common::Bundle(),
        common::ReceiverRef receiver = nullptr
    );

    /**
     * @brief Forward a media button press to the session.
     * @return true if the session handled it
     * @throws InvalidArgumentError if the key code is unknown
     */
    bool dispatch_media_button_event(const common::KeyEvent& event);

    // All four throw UnsupportedByRemoteError when the session does not
    // handle queue commands
    void add_queue_item(const common::MediaDescription& description);
    void add_queue_item_at(const common::MediaDescription& description, int32_t index);
    void remove_queue_item(const common::MediaDescription& description);
    void remove_queue_item_at(int32_t index);

    // ========== Callbacks ==========

    /**
     * @brief Deliver session events to `callback` on `target`.
     * @throws InvalidArgumentError for a null argument or a callback that is already registered
     */
    void register_callback(
        std::shared_ptr<MediaControllerCallback> callback,
        std::shared_ptr<interfaces::IDispatchTarget> target
    );

    /**
     * @brief Stop deliveries to `callback`. Events already queued are dropped.
     * @throws InvalidArgumentError for a callback never registered with this controller
     */
    void unregister_callback(const std::shared_ptr<MediaControllerCallback>& callback);

    // Exposed for tests and diagnostics
    ControllerProxy& proxy() { return *proxy_; }

private:
    SessionToken token_;
    std::shared_ptr<common::ILogger> logger_;
    std::unique_ptr<ControllerProxy> proxy_;
    std::unique_ptr<TransportControls> transport_controls_;
};

} // namespace core
} // namespace mediactl
