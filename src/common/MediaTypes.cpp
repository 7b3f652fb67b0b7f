#include "mediactl/common/MediaTypes.hpp"
#include "mediactl/common/Bundle.hpp"

namespace mediactl {
namespace common {

bool operator==(const CustomAction& a, const CustomAction& b) {
    return a.action == b.action && a.name == b.name && a.icon == b.icon;
}

bool operator==(const PlaybackState& a, const PlaybackState& b) {
    return a.state == b.state
        && a.position_ms == b.position_ms
        && a.buffered_position_ms == b.buffered_position_ms
        && a.speed == b.speed
        && a.actions == b.actions
        && a.active_queue_item_id == b.active_queue_item_id
        && a.last_update_ms == b.last_update_ms
        && a.error_message == b.error_message
        && a.custom_actions == b.custom_actions;
}

bool operator==(const MediaMetadata& a, const MediaMetadata& b) {
    return a.text == b.text && a.numbers == b.numbers;
}

bool operator==(const MediaDescription& a, const MediaDescription& b) {
    return a.media_id == b.media_id
        && a.title == b.title
        && a.subtitle == b.subtitle
        && a.description == b.description
        && a.icon_uri == b.icon_uri
        && a.media_uri == b.media_uri;
}

bool operator==(const QueueItem& a, const QueueItem& b) {
    return a.queue_id == b.queue_id && a.description == b.description;
}

bool operator==(const PlaybackInfo& a, const PlaybackInfo& b) {
    return a.playback_type == b.playback_type
        && a.audio_stream == b.audio_stream
        && a.volume_control == b.volume_control
        && a.max_volume == b.max_volume
        && a.current_volume == b.current_volume;
}

bool operator==(const Rating& a, const Rating& b) {
    return a.style == b.style && a.value == b.value;
}

bool operator==(const KeyEvent& a, const KeyEvent& b) {
    return a.action == b.action && a.key_code == b.key_code;
}

// ============================================================================
// Bundle equality
// ============================================================================
// Nested bundles compare by content, channel and receiver handles by identity.

namespace {

bool values_equal(const Bundle::Value& a, const Bundle::Value& b) {
    if (a.index() != b.index()) return false;

    if (const auto* nested = std::get_if<BundleRef>(&a)) {
        const auto& other = std::get<BundleRef>(b);
        if (!*nested || !other) return *nested == other;
        return **nested == *other;
    }
    return a == b;
}

} // namespace

bool operator==(const Bundle& a, const Bundle& b) {
    const auto& av = a.values();
    const auto& bv = b.values();
    if (av.size() != bv.size()) return false;

    auto ai = av.begin();
    auto bi = bv.begin();
    for (; ai != av.end(); ++ai, ++bi) {
        if (ai->first != bi->first) return false;
        if (!values_equal(ai->second, bi->second)) return false;
    }
    return true;
}

} // namespace common
} // namespace mediactl
