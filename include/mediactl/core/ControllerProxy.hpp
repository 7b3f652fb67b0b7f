#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "mediactl/common/Bundle.hpp"
#include "mediactl/common/Logger.hpp"
#include "mediactl/common/MediaTypes.hpp"
#include "mediactl/common/Result.hpp"
#include "mediactl/core/CallbackRegistry.hpp"
#include "mediactl/core/CapabilityNegotiator.hpp"
#include "mediactl/core/EventSinks.hpp"
#include "mediactl/core/TierProfile.hpp"
#include "mediactl/interfaces/ISessionChannel.hpp"

namespace mediactl {
namespace core {

// ============================================================================
// ControllerProxy - Tier-specific half of a MediaController
// ============================================================================
// Turns controller operations into channel calls according to its
// TierProfile. Owns the callback registry and, for tiers that have one,
// starts the extended channel negotiation on construction.
//
// Remote failures never leave this class: they are logged as
// "Dead object in <operation>" and the operation returns its default.
// Caller errors (UnsupportedByRemoteError) are thrown.
//
// Thread Safety: all methods may be called from any thread.
// ============================================================================

class ControllerProxy {
public:
    ControllerProxy(
        std::shared_ptr<interfaces::ISessionChannel> base_channel,
        TierProfile profile,
        EventPolicy policy,
        std::shared_ptr<common::ILogger> logger
    );

    // Disposes the negotiator before the registry goes away
    ~ControllerProxy();

    ControllerProxy(const ControllerProxy&) = delete;
    ControllerProxy& operator=(const ControllerProxy&) = delete;

    const TierProfile& profile() const { return profile_; }
    CallbackRegistry& registry() { return *registry_; }
    const CallbackRegistry& registry() const { return *registry_; }
    CapabilityNegotiator::State negotiation_state() const { return negotiator_->state(); }

    bool is_extended_channel_ready() const { return registry_->has_extended_channel(); }

    // ========== Queries ==========

    std::optional<common::PlaybackState> get_playback_state();
    std::optional<common::MediaMetadata> get_metadata();
    std::optional<std::vector<common::QueueItem>> get_queue();
    std::optional<std::string> get_queue_title();
    std::optional<common::Bundle> get_extras();
    common::RatingStyle get_rating_type();
    common::RepeatMode get_repeat_mode();
    bool is_shuffle_mode_enabled();
    uint64_t get_flags();
    std::optional<common::PlaybackInfo> get_playback_info();
    std::optional<std::string> get_session_activity();
    std::optional<std::string> get_package_name();

    // ========== Commands ==========

    void set_volume_to(int32_t value, int32_t flags);
    void adjust_volume(int32_t direction, int32_t flags);
    void send_command(const std::string& command, const common::Bundle& params, common::ReceiverRef receiver);
    bool dispatch_media_button_event(const common::KeyEvent& event);

    /**
     * @throws UnsupportedByRemoteError if the session does not handle queue commands
     */
    void add_queue_item(const common::MediaDescription& description);
    void add_queue_item_at(const common::MediaDescription& description, int32_t index);
    void remove_queue_item(const common::MediaDescription& description);
    void remove_queue_item_at(int32_t index);

    /**
     * @brief Send a transport verb the way this tier routes it.
     * @param native_args Arguments for the native method
     * @param action_args Arguments when the verb is sent as a custom action
     */
    void send_transport(TransportVerb verb, const common::Bundle& native_args, const common::Bundle& action_args);

private:
    // Round-trip on the channel selected by `source`; nullopt on failure
    std::optional<common::Bundle> query(const char* op, interfaces::SessionMethod method, QuerySource source);

    void send_one_way(const char* op, interfaces::SessionMethod method, const common::Bundle& args);

    // Throws when the flag is clear; false when the flags could not be read
    bool ensure_queue_commands(const char* op);

    // Queue mutation in this tier's encoding
    void send_queue_mutation(
        const char* op,
        interfaces::SessionMethod native_method,
        const char* command,
        const common::Bundle& native_args,
        const common::Bundle& command_params
    );

    void log_remote_failure(const char* op, const common::AppError& error);

    std::shared_ptr<interfaces::ISessionChannel> base_channel_;
    TierProfile profile_;
    std::shared_ptr<common::ILogger> logger_;

    // Declared before the negotiator: destroyed after it
    std::unique_ptr<CallbackRegistry> registry_;
    std::unique_ptr<CapabilityNegotiator> negotiator_;
};

} // namespace core
} // namespace mediactl
