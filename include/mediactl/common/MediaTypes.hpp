#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace mediactl {
namespace common {

    // Session flag bits reported by GetFlags
    constexpr uint64_t kFlagHandlesQueueCommands     = 1ULL << 0;
    constexpr uint64_t kFlagHandlesMediaButtons      = 1ULL << 1;
    constexpr uint64_t kFlagHandlesTransportControls = 1ULL << 2;

    enum class RepeatMode : int32_t {
        None = 0,
        One  = 1,
        All  = 2
    };

    enum class RatingStyle : int32_t {
        None       = 0,
        Heart      = 1,
        ThumbUpDown = 2,
        ThreeStars = 3,
        FourStars  = 4,
        FiveStars  = 5,
        Percentage = 6
    };

    struct Rating {
        RatingStyle style = RatingStyle::None;
        float value = -1.0f; // Negative means unrated
        bool is_rated() const { return value >= 0.0f; }
    };

    struct CustomAction {
        std::string action;
        std::string name;
        int32_t icon = 0;
    };

    enum class PlaybackStateKind : int32_t {
        None = 0,
        Stopped,
        Paused,
        Playing,
        FastForwarding,
        Rewinding,
        Buffering,
        Error,
        Connecting,
        SkippingToPrevious,
        SkippingToNext,
        SkippingToQueueItem
    };

    struct PlaybackState {
        PlaybackStateKind state = PlaybackStateKind::None;
        int64_t position_ms = 0;
        int64_t buffered_position_ms = 0;
        float speed = 0.0f;
        uint64_t actions = 0;
        int64_t active_queue_item_id = -1;
        uint64_t last_update_ms = 0;
        std::string error_message;
        std::vector<CustomAction> custom_actions;
    };

    // Well-known metadata keys
    constexpr const char* kMetadataTitle    = "title";
    constexpr const char* kMetadataArtist   = "artist";
    constexpr const char* kMetadataAlbum    = "album";
    constexpr const char* kMetadataMediaId  = "media_id";
    constexpr const char* kMetadataDuration = "duration";

    struct MediaMetadata {
        std::map<std::string, std::string> text;
        std::map<std::string, int64_t> numbers;

        std::string get_text(const std::string& key) const {
            auto it = text.find(key);
            return it != text.end() ? it->second : std::string();
        }

        int64_t get_number(const std::string& key) const {
            auto it = numbers.find(key);
            return it != numbers.end() ? it->second : 0;
        }
    };

    struct MediaDescription {
        std::string media_id;
        std::string title;
        std::string subtitle;
        std::string description;
        std::string icon_uri;
        std::string media_uri;
    };

    struct QueueItem {
        MediaDescription description;
        int64_t queue_id = -1;
    };

    enum class PlaybackType : int32_t {
        Local  = 1,
        Remote = 2
    };

    enum class VolumeControl : int32_t {
        Fixed    = 0,
        Relative = 1,
        Absolute = 2
    };

    struct PlaybackInfo {
        PlaybackType playback_type = PlaybackType::Local;
        int32_t audio_stream = 0;
        VolumeControl volume_control = VolumeControl::Absolute;
        int32_t max_volume = 0;
        int32_t current_volume = 0;
    };

    struct KeyEvent {
        enum class Action : int32_t { Down = 0, Up = 1 };

        Action action = Action::Down;
        int32_t key_code = 0; // 0 means "unknown key"
    };

    bool operator==(const CustomAction& a, const CustomAction& b);
    bool operator==(const PlaybackState& a, const PlaybackState& b);
    bool operator==(const MediaMetadata& a, const MediaMetadata& b);
    bool operator==(const MediaDescription& a, const MediaDescription& b);
    bool operator==(const QueueItem& a, const QueueItem& b);
    bool operator==(const PlaybackInfo& a, const PlaybackInfo& b);
    bool operator==(const Rating& a, const Rating& b);
    bool operator==(const KeyEvent& a, const KeyEvent& b);

} // namespace common
} // namespace mediactl
