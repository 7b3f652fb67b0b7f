#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include "mediactl/core/CapabilityLevel.hpp"
#include "mediactl/interfaces/ISessionChannel.hpp"

namespace mediactl {
namespace core {

// ============================================================================
// TierProfile - Per-tier behavior table
// ============================================================================
// One ControllerProxy type serves every tier. What differs between tiers is
// captured here and resolved once, at construction, by select_tier_profile().
// Each tier starts from the table of the tier below and only overrides
// entries, so a higher tier never loses an operation a lower one has.
// ============================================================================

enum class TransportVerb : uint8_t {
    Prepare = 0,
    PrepareFromMediaId,
    PrepareFromSearch,
    PrepareFromUri,
    Play,
    PlayFromMediaId,
    PlayFromSearch,
    PlayFromUri,
    SkipToQueueItem,
    Pause,
    Stop,
    SeekTo,
    FastForward,
    Rewind,
    SkipToNext,
    SkipToPrevious,
    SetRating,
    SetRepeatMode,
    SetShuffleModeEnabled,
    SendCustomAction,
    Count
};

constexpr size_t kTransportVerbCount = static_cast<size_t>(TransportVerb::Count);

const char* transport_verb_name(TransportVerb verb) noexcept;

struct VerbRoute {
    enum class Kind : uint8_t {
        NativeMethod, // Invoke `method` directly
        CustomAction  // Wrap into SendCustomAction(`action`, args)
    };

    Kind kind = Kind::NativeMethod;
    interfaces::SessionMethod method = interfaces::SessionMethod::SendCustomAction;
    const char* action = nullptr;

    static VerbRoute native(interfaces::SessionMethod m) {
        return VerbRoute{Kind::NativeMethod, m, nullptr};
    }

    static VerbRoute custom_action(const char* a) {
        return VerbRoute{Kind::CustomAction, interfaces::SessionMethod::SendCustomAction, a};
    }
};

enum class QueueEncoding : uint8_t {
    NativeMethods,   // AddQueueItem / AddQueueItemAt / ...
    GenericCommands  // SendCommand with a reserved command name
};

enum class QuerySource : uint8_t {
    BaseChannel,     // Always the base channel
    PreferExtended,  // Extended channel when ready, else base channel
    ExtendedOnly     // Extended channel when ready, else the default value
};

struct TierProfile {
    CapabilityLevel level = CapabilityLevel::Legacy;
    bool negotiates_extended_channel = false;
    QueueEncoding queue_encoding = QueueEncoding::NativeMethods;
    QuerySource playback_state_source = QuerySource::BaseChannel;
    QuerySource rating_type_source = QuerySource::BaseChannel;
    QuerySource repeat_shuffle_source = QuerySource::BaseChannel;
    std::array<VerbRoute, kTransportVerbCount> verb_routes{};

    const VerbRoute& route(TransportVerb verb) const {
        return verb_routes[static_cast<size_t>(verb)];
    }
};

// Pure: same level, same table
TierProfile select_tier_profile(CapabilityLevel level);

} // namespace core
} // namespace mediactl
