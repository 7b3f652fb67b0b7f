#include "mediactl/core/ControllerProxy.hpp"
#include "mediactl/common/ControllerError.hpp"
#include "mediactl/core/SessionProtocol.hpp"

namespace mediactl {
namespace core {

using interfaces::SessionMethod;

// ============================================================================
// Construction
// ============================================================================

ControllerProxy::ControllerProxy(
    std::shared_ptr<interfaces::ISessionChannel> base_channel,
    TierProfile profile,
    EventPolicy policy,
    std::shared_ptr<common::ILogger> logger
)
    : base_channel_(std::move(base_channel))
    , profile_(profile)
    , logger_(logger ? std::move(logger) : common::default_logger())
{
    registry_ = std::make_unique<CallbackRegistry>(
        base_channel_, policy, profile_.negotiates_extended_channel, logger_);
    negotiator_ = std::make_unique<CapabilityNegotiator>(logger_);

    if (profile_.negotiates_extended_channel) {
        CallbackRegistry* registry = registry_.get();
        negotiator_->start(*base_channel_, [registry](std::shared_ptr<interfaces::ISessionChannel> channel) {
            registry->attach_extended_channel(std::move(channel));
        });
    }

    logger_->debug(std::string("[ControllerProxy] Created at level ")
                   + capability_level_name(profile_.level));
}

ControllerProxy::~ControllerProxy() {
    negotiator_->dispose();
}

// ============================================================================
// Helpers
// ============================================================================

void ControllerProxy::log_remote_failure(const char* op, const common::AppError& error) {
    logger_->error(std::string("[ControllerProxy] Dead object in ") + op + ": " + error.message);
}

std::optional<common::Bundle> ControllerProxy::query(const char* op, SessionMethod method, QuerySource source) {
    if (source != QuerySource::BaseChannel) {
        auto extended = registry_->extended_channel();
        if (extended) {
            auto result = extended->invoke(method, common::Bundle());
            if (result.is_ok()) {
                return result.take();
            }
            log_remote_failure(op, result.error());
            if (source == QuerySource::ExtendedOnly) {
                return std::nullopt;
            }
            // PreferExtended: fall back to the base channel
        } else if (source == QuerySource::ExtendedOnly) {
            return std::nullopt;
        }
    }

    auto result = base_channel_->invoke(method, common::Bundle());
    if (result.is_err()) {
        log_remote_failure(op, result.error());
        return std::nullopt;
    }
    return result.take();
}

void ControllerProxy::send_one_way(const char* op, SessionMethod method, const common::Bundle& args) {
    auto result = base_channel_->invoke_one_way(method, args);
    if (result.is_err()) {
        log_remote_failure(op, result.error());
    }
}

// ============================================================================
// Queries
// ============================================================================

std::optional<common::PlaybackState> ControllerProxy::get_playback_state() {
    auto data = query("getPlaybackState", SessionMethod::GetPlaybackState, profile_.playback_state_source);
    if (!data) return std::nullopt;
    return data->get<common::PlaybackState>(protocol::kResultValue);
}

std::optional<common::MediaMetadata> ControllerProxy::get_metadata() {
    auto data = query("getMetadata", SessionMethod::GetMetadata, QuerySource::BaseChannel);
    if (!data) return std::nullopt;
    return data->get<common::MediaMetadata>(protocol::kResultValue);
}

std::optional<std::vector<common::QueueItem>> ControllerProxy::get_queue() {
    auto data = query("getQueue", SessionMethod::GetQueue, QuerySource::BaseChannel);
    if (!data) return std::nullopt;
    return data->get<std::vector<common::QueueItem>>(protocol::kResultValue);
}

std::optional<std::string> ControllerProxy::get_queue_title() {
    auto data = query("getQueueTitle", SessionMethod::GetQueueTitle, QuerySource::BaseChannel);
    if (!data) return std::nullopt;
    return data->get<std::string>(protocol::kResultValue);
}

std::optional<common::Bundle> ControllerProxy::get_extras() {
    auto data = query("getExtras", SessionMethod::GetExtras, QuerySource::BaseChannel);
    if (!data || !data->contains(protocol::kResultValue)) return std::nullopt;
    return data->get_bundle(protocol::kResultValue);
}

common::RatingStyle ControllerProxy::get_rating_type() {
    auto data = query("getRatingType", SessionMethod::GetRatingType, profile_.rating_type_source);
    if (!data) return common::RatingStyle::None;
    return static_cast<common::RatingStyle>(data->get_int(protocol::kResultValue, 0));
}

common::RepeatMode ControllerProxy::get_repeat_mode() {
    auto data = query("getRepeatMode", SessionMethod::GetRepeatMode, profile_.repeat_shuffle_source);
    if (!data) return common::RepeatMode::None;
    return static_cast<common::RepeatMode>(data->get_int(protocol::kResultValue, 0));
}

bool ControllerProxy::is_shuffle_mode_enabled() {
    auto data = query("isShuffleModeEnabled", SessionMethod::IsShuffleModeEnabled, profile_.repeat_shuffle_source);
    if (!data) return false;
    return data->get_bool(protocol::kResultValue, false);
}

uint64_t ControllerProxy::get_flags() {
    auto data = query("getFlags", SessionMethod::GetFlags, QuerySource::BaseChannel);
    if (!data) return 0;
    return static_cast<uint64_t>(data->get_int(protocol::kResultValue, 0));
}

std::optional<common::PlaybackInfo> ControllerProxy::get_playback_info() {
    auto data = query("getPlaybackInfo", SessionMethod::GetVolumeAttributes, QuerySource::BaseChannel);
    if (!data) return std::nullopt;
    return data->get<common::PlaybackInfo>(protocol::kResultValue);
}

std::optional<std::string> ControllerProxy::get_session_activity() {
    auto data = query("getSessionActivity", SessionMethod::GetLaunchActivity, QuerySource::BaseChannel);
    if (!data) return std::nullopt;
    return data->get<std::string>(protocol::kResultValue);
}

std::optional<std::string> ControllerProxy::get_package_name() {
    auto data = query("getPackageName", SessionMethod::GetPackageName, QuerySource::BaseChannel);
    if (!data) return std::nullopt;
    return data->get<std::string>(protocol::kResultValue);
}

// ============================================================================
// Commands
// ============================================================================

void ControllerProxy::set_volume_to(int32_t value, int32_t flags) {
    common::Bundle args;
    args.put_int(protocol::kArgValue, value);
    args.put_int(protocol::kArgFlags, flags);
    send_one_way("setVolumeTo", SessionMethod::SetVolumeTo, args);
}

void ControllerProxy::adjust_volume(int32_t direction, int32_t flags) {
    common::Bundle args;
    args.put_int(protocol::kArgDirection, direction);
    args.put_int(protocol::kArgFlags, flags);
    send_one_way("adjustVolume", SessionMethod::AdjustVolume, args);
}

void ControllerProxy::send_command(const std::string& command, const common::Bundle& params,
                                   common::ReceiverRef receiver) {
    common::Bundle args;
    args.put_string(protocol::kArgCommand, command);
    args.put_bundle(protocol::kArgParams, params);
    if (receiver) {
        args.put(protocol::kArgReceiver, std::move(receiver));
    }
    send_one_way("sendCommand", SessionMethod::SendCommand, args);
}

bool ControllerProxy::dispatch_media_button_event(const common::KeyEvent& event) {
    common::Bundle args;
    args.put(protocol::kArgKeyEvent, event);

    auto result = base_channel_->invoke(SessionMethod::SendMediaButton, args);
    if (result.is_err()) {
        log_remote_failure("dispatchMediaButtonEvent", result.error());
        return false;
    }
    return result.unwrap().get_bool(protocol::kResultValue, false);
}

// ========== Queue ==========

bool ControllerProxy::ensure_queue_commands(const char* op) {
    auto result = base_channel_->invoke(SessionMethod::GetFlags, common::Bundle());
    if (result.is_err()) {
        log_remote_failure(op, result.error());
        return false;
    }

    uint64_t flags = static_cast<uint64_t>(result.unwrap().get_int(protocol::kResultValue, 0));
    if ((flags & common::kFlagHandlesQueueCommands) == 0) {
        throw common::UnsupportedByRemoteError(
            std::string("This session doesn't support queue management operations (") + op + ")");
    }
    return true;
}

void ControllerProxy::send_queue_mutation(
    const char* op,
    SessionMethod native_method,
    const char* command,
    const common::Bundle& native_args,
    const common::Bundle& command_params
) {
    if (!ensure_queue_commands(op)) {
        return;
    }

    if (profile_.queue_encoding == QueueEncoding::NativeMethods) {
        send_one_way(op, native_method, native_args);
    } else {
        send_command(command, command_params, nullptr);
    }
}

void ControllerProxy::add_queue_item(const common::MediaDescription& description) {
    common::Bundle native_args;
    native_args.put(protocol::kArgDescription, description);

    common::Bundle params;
    params.put(protocol::kCommandArgumentMediaDescription, description);

    send_queue_mutation("addQueueItem", SessionMethod::AddQueueItem,
                        protocol::kCommandAddQueueItem, native_args, params);
}

void ControllerProxy::add_queue_item_at(const common::MediaDescription& description, int32_t index) {
    common::Bundle native_args;
    native_args.put(protocol::kArgDescription, description);
    native_args.put_int(protocol::kArgIndex, index);

    common::Bundle params;
    params.put(protocol::kCommandArgumentMediaDescription, description);
    params.put_int(protocol::kCommandArgumentIndex, index);

    send_queue_mutation("addQueueItemAt", SessionMethod::AddQueueItemAt,
                        protocol::kCommandAddQueueItemAt, native_args, params);
}

void ControllerProxy::remove_queue_item(const common::MediaDescription& description) {
    common::Bundle native_args;
    native_args.put(protocol::kArgDescription, description);

    common::Bundle params;
    params.put(protocol::kCommandArgumentMediaDescription, description);

    send_queue_mutation("removeQueueItem", SessionMethod::RemoveQueueItem,
                        protocol::kCommandRemoveQueueItem, native_args, params);
}

void ControllerProxy::remove_queue_item_at(int32_t index) {
    common::Bundle native_args;
    native_args.put_int(protocol::kArgIndex, index);

    common::Bundle params;
    params.put_int(protocol::kCommandArgumentIndex, index);

    send_queue_mutation("removeQueueItemAt", SessionMethod::RemoveQueueItemAt,
                        protocol::kCommandRemoveQueueItemAt, native_args, params);
}

// ========== Transport ==========

void ControllerProxy::send_transport(TransportVerb verb, const common::Bundle& native_args,
                                     const common::Bundle& action_args) {
    const VerbRoute& route = profile_.route(verb);
    const char* op = transport_verb_name(verb);

    if (route.kind == VerbRoute::Kind::NativeMethod) {
        send_one_way(op, route.method, native_args);
        return;
    }

    common::Bundle args;
    args.put_string(protocol::kArgAction, route.action);
    args.put_bundle(protocol::kArgArgs, action_args);
    send_one_way(op, SessionMethod::SendCustomAction, args);
}

} // namespace core
} // namespace mediactl
