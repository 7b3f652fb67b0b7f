#include "mediactl/core/EventSinks.hpp"
#include "mediactl/common/ControllerError.hpp"

namespace mediactl {
namespace core {

// ============================================================================
// BaseChannelSink
// ============================================================================

BaseChannelSink::BaseChannelSink(
    std::shared_ptr<MediaControllerCallback> callback,
    std::shared_ptr<EventDispatcher> dispatcher,
    EventPolicy policy,
    std::shared_ptr<common::ILogger> logger
)
    : callback_(std::move(callback))
    , dispatcher_(std::move(dispatcher))
    , policy_(policy)
    , logger_(std::move(logger))
{
}

bool BaseChannelSink::superseded(const char* name) const {
    if (!callback_->has_extended_channel()) {
        return false;
    }
    logger_->debug(std::string("[BaseChannelSink] ") + name + " superseded by extended channel");
    return true;
}

void BaseChannelSink::on_event(const std::string& event, const common::Bundle& extras) {
    if (policy_.session_events_on_extended() && superseded("sessionEvent")) {
        return;
    }
    dispatcher_->enqueue(events::Custom{event, extras});
}

void BaseChannelSink::on_session_destroyed() {
    dispatcher_->post_session_destroyed();
}

void BaseChannelSink::on_playback_state_changed(const std::optional<common::PlaybackState>& state) {
    if (superseded("playbackStateChanged")) return;
    dispatcher_->enqueue(events::PlaybackStateChanged{state});
}

void BaseChannelSink::on_metadata_changed(const std::optional<common::MediaMetadata>& metadata) {
    dispatcher_->enqueue(events::MetadataChanged{metadata});
}

void BaseChannelSink::on_queue_changed(const std::optional<std::vector<common::QueueItem>>& queue) {
    dispatcher_->enqueue(events::QueueChanged{queue});
}

void BaseChannelSink::on_queue_title_changed(const std::optional<std::string>& title) {
    dispatcher_->enqueue(events::QueueTitleChanged{title});
}

void BaseChannelSink::on_extras_changed(const common::Bundle& extras) {
    dispatcher_->enqueue(events::ExtrasChanged{extras});
}

void BaseChannelSink::on_volume_info_changed(const std::optional<common::PlaybackInfo>& info) {
    dispatcher_->enqueue(events::VolumeChanged{info});
}

void BaseChannelSink::on_repeat_mode_changed(common::RepeatMode mode) {
    if (superseded("repeatModeChanged")) return;
    dispatcher_->enqueue(events::RepeatModeChanged{mode});
}

void BaseChannelSink::on_shuffle_mode_changed(bool enabled) {
    if (superseded("shuffleModeChanged")) return;
    dispatcher_->enqueue(events::ShuffleModeChanged{enabled});
}

// ============================================================================
// ExtendedChannelSink
// ============================================================================

ExtendedChannelSink::ExtendedChannelSink(
    std::shared_ptr<EventDispatcher> dispatcher,
    EventPolicy policy,
    std::shared_ptr<common::ILogger> logger
)
    : dispatcher_(std::move(dispatcher))
    , policy_(policy)
    , logger_(std::move(logger))
{
}

void ExtendedChannelSink::protocol_violation(const char* name) {
    std::string message = std::string("Unexpected ") + name + " on extended channel";
    if (policy_.strict_protocol) {
        throw common::ProtocolViolationError(message);
    }
    logger_->error("[ExtendedChannelSink] " + message + "; dropped");
}

void ExtendedChannelSink::on_event(const std::string& event, const common::Bundle& extras) {
    if (!policy_.session_events_on_extended()) {
        logger_->debug("[ExtendedChannelSink] sessionEvent taken from base channel at this level");
        return;
    }
    dispatcher_->enqueue(events::Custom{event, extras});
}

void ExtendedChannelSink::on_session_destroyed() {
    protocol_violation("sessionDestroyed");
}

void ExtendedChannelSink::on_playback_state_changed(const std::optional<common::PlaybackState>& state) {
    dispatcher_->enqueue(events::PlaybackStateChanged{state});
}

void ExtendedChannelSink::on_metadata_changed(const std::optional<common::MediaMetadata>&) {
    protocol_violation("metadataChanged");
}

void ExtendedChannelSink::on_queue_changed(const std::optional<std::vector<common::QueueItem>>&) {
    protocol_violation("queueChanged");
}

void ExtendedChannelSink::on_queue_title_changed(const std::optional<std::string>&) {
    protocol_violation("queueTitleChanged");
}

void ExtendedChannelSink::on_extras_changed(const common::Bundle&) {
    protocol_violation("extrasChanged");
}

void ExtendedChannelSink::on_volume_info_changed(const std::optional<common::PlaybackInfo>&) {
    protocol_violation("volumeInfoChanged");
}

void ExtendedChannelSink::on_repeat_mode_changed(common::RepeatMode mode) {
    dispatcher_->enqueue(events::RepeatModeChanged{mode});
}

void ExtendedChannelSink::on_shuffle_mode_changed(bool enabled) {
    dispatcher_->enqueue(events::ShuffleModeChanged{enabled});
}

} // namespace core
} // namespace mediactl
