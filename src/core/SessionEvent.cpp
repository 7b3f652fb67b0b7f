#include "mediactl/core/SessionEvent.hpp"
#include "mediactl/core/MediaControllerCallback.hpp"

namespace mediactl {
namespace core {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

const char* session_event_name(const SessionEvent& event) noexcept {
    return std::visit(overloaded{
        [](const events::Custom&)               { return "sessionEvent"; },
        [](const events::PlaybackStateChanged&) { return "playbackStateChanged"; },
        [](const events::MetadataChanged&)      { return "metadataChanged"; },
        [](const events::QueueChanged&)         { return "queueChanged"; },
        [](const events::QueueTitleChanged&)    { return "queueTitleChanged"; },
        [](const events::ExtrasChanged&)        { return "extrasChanged"; },
        [](const events::VolumeChanged&)        { return "volumeChanged"; },
        [](const events::RepeatModeChanged&)    { return "repeatModeChanged"; },
        [](const events::ShuffleModeChanged&)   { return "shuffleModeChanged"; },
        [](const events::SessionDestroyed&)     { return "sessionDestroyed"; }
    }, event);
}

void MediaControllerCallback::deliver(const SessionEvent& event) {
    std::visit(overloaded{
        [this](const events::Custom& e)               { on_session_event(e.event, e.extras); },
        [this](const events::PlaybackStateChanged& e) { on_playback_state_changed(e.state); },
        [this](const events::MetadataChanged& e)      { on_metadata_changed(e.metadata); },
        [this](const events::QueueChanged& e)         { on_queue_changed(e.queue); },
        [this](const events::QueueTitleChanged& e)    { on_queue_title_changed(e.title); },
        [this](const events::ExtrasChanged& e)        { on_extras_changed(e.extras); },
        [this](const events::VolumeChanged& e)        { on_audio_info_changed(e.info); },
        [this](const events::RepeatModeChanged& e)    { on_repeat_mode_changed(e.mode); },
        [this](const events::ShuffleModeChanged& e)   { on_shuffle_mode_changed(e.enabled); },
        [this](const events::SessionDestroyed&)       { on_session_destroyed(); }
    }, event);
}

} // namespace core
} // namespace mediactl
