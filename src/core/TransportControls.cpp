#include "mediactl/core/TransportControls.hpp"
#include "mediactl/common/ControllerError.hpp"
#include "mediactl/core/ControllerProxy.hpp"
#include "mediactl/core/SessionProtocol.hpp"

namespace mediactl {
namespace core {

namespace {

// Same payload under the native key and the custom action key
struct VerbArgs {
    common::Bundle native;
    common::Bundle action;

    VerbArgs& text(const char* native_key, const char* action_key, const std::string& value) {
        native.put_string(native_key, value);
        action.put_string(action_key, value);
        return *this;
    }

    VerbArgs& extras(const common::Bundle& value) {
        native.put_bundle(protocol::kArgExtras, value);
        action.put_bundle(protocol::kActionArgumentExtras, value);
        return *this;
    }
};

} // namespace

TransportControls::TransportControls(ControllerProxy& proxy)
    : proxy_(proxy)
{
}

// ============================================================================
// Prepare
// ============================================================================

void TransportControls::prepare() {
    proxy_.send_transport(TransportVerb::Prepare, common::Bundle(), common::Bundle());
}

void TransportControls::prepare_from_media_id(const std::string& media_id, const common::Bundle& extras) {
    VerbArgs args;
    args.text(protocol::kArgMediaId, protocol::kActionArgumentMediaId, media_id).extras(extras);
    proxy_.send_transport(TransportVerb::PrepareFromMediaId, args.native, args.action);
}

void TransportControls::prepare_from_search(const std::string& query, const common::Bundle& extras) {
    VerbArgs args;
    args.text(protocol::kArgQuery, protocol::kActionArgumentQuery, query).extras(extras);
    proxy_.send_transport(TransportVerb::PrepareFromSearch, args.native, args.action);
}

void TransportControls::prepare_from_uri(const std::string& uri, const common::Bundle& extras) {
    VerbArgs args;
    args.text(protocol::kArgUri, protocol::kActionArgumentUri, uri).extras(extras);
    proxy_.send_transport(TransportVerb::PrepareFromUri, args.native, args.action);
}

// ============================================================================
// Play
// ============================================================================

void TransportControls::play() {
    proxy_.send_transport(TransportVerb::Play, common::Bundle(), common::Bundle());
}

void TransportControls::play_from_media_id(const std::string& media_id, const common::Bundle& extras) {
    VerbArgs args;
    args.text(protocol::kArgMediaId, protocol::kActionArgumentMediaId, media_id).extras(extras);
    proxy_.send_transport(TransportVerb::PlayFromMediaId, args.native, args.action);
}

void TransportControls::play_from_search(const std::string& query, const common::Bundle& extras) {
    VerbArgs args;
    args.text(protocol::kArgQuery, protocol::kActionArgumentQuery, query).extras(extras);
    proxy_.send_transport(TransportVerb::PlayFromSearch, args.native, args.action);
}

void TransportControls::play_from_uri(const std::string& uri, const common::Bundle& extras) {
    if (uri.empty()) {
        throw common::InvalidArgumentError("You must specify a non-empty uri for playFromUri");
    }
    VerbArgs args;
    args.text(protocol::kArgUri, protocol::kActionArgumentUri, uri).extras(extras);
    proxy_.send_transport(TransportVerb::PlayFromUri, args.native, args.action);
}

void TransportControls::skip_to_queue_item(int64_t queue_id) {
    common::Bundle args;
    args.put_int(protocol::kArgQueueId, queue_id);
    proxy_.send_transport(TransportVerb::SkipToQueueItem, args, args);
}

void TransportControls::pause() {
    proxy_.send_transport(TransportVerb::Pause, common::Bundle(), common::Bundle());
}

void TransportControls::stop() {
    proxy_.send_transport(TransportVerb::Stop, common::Bundle(), common::Bundle());
}

void TransportControls::seek_to(int64_t position_ms) {
    common::Bundle args;
    args.put_int(protocol::kArgPosition, position_ms);
    proxy_.send_transport(TransportVerb::SeekTo, args, args);
}

void TransportControls::fast_forward() {
    proxy_.send_transport(TransportVerb::FastForward, common::Bundle(), common::Bundle());
}

void TransportControls::rewind() {
    proxy_.send_transport(TransportVerb::Rewind, common::Bundle(), common::Bundle());
}

void TransportControls::skip_to_next() {
    proxy_.send_transport(TransportVerb::SkipToNext, common::Bundle(), common::Bundle());
}

void TransportControls::skip_to_previous() {
    proxy_.send_transport(TransportVerb::SkipToPrevious, common::Bundle(), common::Bundle());
}

// ============================================================================
// Modes
// ============================================================================

void TransportControls::set_rating(const common::Rating& rating) {
    common::Bundle args;
    args.put(protocol::kArgRating, rating);
    proxy_.send_transport(TransportVerb::SetRating, args, args);
}

void TransportControls::set_repeat_mode(common::RepeatMode mode) {
    common::Bundle native;
    native.put_int(protocol::kArgRepeatMode, static_cast<int64_t>(mode));
    common::Bundle action;
    action.put_int(protocol::kActionArgumentRepeatMode, static_cast<int64_t>(mode));
    proxy_.send_transport(TransportVerb::SetRepeatMode, native, action);
}

void TransportControls::set_shuffle_mode_enabled(bool enabled) {
    common::Bundle native;
    native.put_bool(protocol::kArgEnabled, enabled);
    common::Bundle action;
    action.put_bool(protocol::kActionArgumentShuffleModeEnabled, enabled);
    proxy_.send_transport(TransportVerb::SetShuffleModeEnabled, native, action);
}

// ============================================================================
// Custom Actions
// ============================================================================

void TransportControls::send_custom_action(const common::CustomAction& action, const common::Bundle& args) {
    send_custom_action(action.action, args);
}

void TransportControls::send_custom_action(const std::string& action, const common::Bundle& args) {
    if (action.empty()) {
        throw common::InvalidArgumentError("Custom action name must not be empty");
    }
    common::Bundle native;
    native.put_string(protocol::kArgAction, action);
    native.put_bundle(protocol::kArgArgs, args);
    proxy_.send_transport(TransportVerb::SendCustomAction, native, native);
}

} // namespace core
} // namespace mediactl
