#include "mediactl/core/MediaController.hpp"
#include "mediactl/core/SessionProtocol.hpp"

namespace mediactl {
namespace core {

// ============================================================================
// Construction
// ============================================================================

MediaController::MediaController(SessionToken token, ControllerConfig config)
    : token_(std::move(token))
    , logger_(config.resolved_logger())
{
    if (!token_.is_valid()) {
        throw common::SessionUnreachableError("Session token has no channel");
    }
    if (!token_.channel()->is_alive()) {
        throw common::SessionUnreachableError("Session " + token_.session_id() + " is not reachable");
    }

    EventPolicy policy;
    policy.level = config.resolved_level();
    policy.session_event_extended_since = config.session_event_extended_since;
    policy.strict_protocol = config.strict_protocol;

    proxy_ = std::make_unique<ControllerProxy>(
        token_.channel(), select_tier_profile(policy.level), policy, logger_);
    transport_controls_ = std::make_unique<TransportControls>(*proxy_);

    logger_->info("[MediaController] Bound to session " + token_.session_id()
                  + " (" + capability_level_name(policy.level) + ")");
}

MediaController::~MediaController() = default;

// ============================================================================
// Commands
// ============================================================================

void MediaController::send_command(const std::string& command, const common::Bundle& params,
                                   common::ReceiverRef receiver) {
    if (command.empty()) {
        throw common::InvalidArgumentError("command must neither be null nor empty");
    }
    if (protocol::is_reserved_command(command)) {
        throw common::InvalidArgumentError("command '" + command + "' is reserved");
    }
    proxy_->send_command(command, params, std::move(receiver));
}

bool MediaController::dispatch_media_button_event(const common::KeyEvent& event) {
    if (event.key_code == 0) {
        throw common::InvalidArgumentError("KeyEvent may not be empty");
    }
    return proxy_->dispatch_media_button_event(event);
}

void MediaController::add_queue_item(const common::MediaDescription& description) {
    proxy_->add_queue_item(description);
}

void MediaController::add_queue_item_at(const common::MediaDescription& description, int32_t index) {
    proxy_->add_queue_item_at(description, index);
}

void MediaController::remove_queue_item(const common::MediaDescription& description) {
    proxy_->remove_queue_item(description);
}

void MediaController::remove_queue_item_at(int32_t index) {
    proxy_->remove_queue_item_at(index);
}

// ============================================================================
// Callbacks
// ============================================================================

void MediaController::register_callback(
    std::shared_ptr<MediaControllerCallback> callback,
    std::shared_ptr<interfaces::IDispatchTarget> target
) {
    if (!callback) {
        throw common::InvalidArgumentError("callback must not be null");
    }
    if (!target) {
        throw common::InvalidArgumentError("dispatch target must not be null");
    }
    proxy_->registry().register_callback(callback, target);
}

void MediaController::unregister_callback(const std::shared_ptr<MediaControllerCallback>& callback) {
    if (!callback) {
        throw common::InvalidArgumentError("callback must not be null");
    }
    proxy_->registry().unregister_callback(callback);
}

} // namespace core
} // namespace mediactl
