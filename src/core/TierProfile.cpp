#include "mediactl/core/TierProfile.hpp"
#include "mediactl/core/SessionProtocol.hpp"

namespace mediactl {
namespace core {

using interfaces::SessionMethod;

const char* transport_verb_name(TransportVerb verb) noexcept {
    switch (verb) {
        case TransportVerb::Prepare:               return "prepare";
        case TransportVerb::PrepareFromMediaId:    return "prepareFromMediaId";
        case TransportVerb::PrepareFromSearch:     return "prepareFromSearch";
        case TransportVerb::PrepareFromUri:        return "prepareFromUri";
        case TransportVerb::Play:                  return "play";
        case TransportVerb::PlayFromMediaId:       return "playFromMediaId";
        case TransportVerb::PlayFromSearch:        return "playFromSearch";
        case TransportVerb::PlayFromUri:           return "playFromUri";
        case TransportVerb::SkipToQueueItem:       return "skipToQueueItem";
        case TransportVerb::Pause:                 return "pause";
        case TransportVerb::Stop:                  return "stop";
        case TransportVerb::SeekTo:                return "seekTo";
        case TransportVerb::FastForward:           return "fastForward";
        case TransportVerb::Rewind:                return "rewind";
        case TransportVerb::SkipToNext:            return "skipToNext";
        case TransportVerb::SkipToPrevious:        return "skipToPrevious";
        case TransportVerb::SetRating:             return "setRating";
        case TransportVerb::SetRepeatMode:         return "setRepeatMode";
        case TransportVerb::SetShuffleModeEnabled: return "setShuffleModeEnabled";
        case TransportVerb::SendCustomAction:      return "sendCustomAction";
        case TransportVerb::Count:                 break;
    }
    return "unknown";
}

namespace {

void set_route(TierProfile& profile, TransportVerb verb, VerbRoute route) {
    profile.verb_routes[static_cast<size_t>(verb)] = route;
}

// ============================================================================
// Tier tables
// ============================================================================

TierProfile legacy_profile() {
    TierProfile p;
    p.level = CapabilityLevel::Legacy;
    p.negotiates_extended_channel = false;
    p.queue_encoding = QueueEncoding::NativeMethods;
    p.playback_state_source = QuerySource::BaseChannel;
    p.rating_type_source = QuerySource::BaseChannel;
    p.repeat_shuffle_source = QuerySource::BaseChannel;

    set_route(p, TransportVerb::Prepare,               VerbRoute::native(SessionMethod::Prepare));
    set_route(p, TransportVerb::PrepareFromMediaId,    VerbRoute::native(SessionMethod::PrepareFromMediaId));
    set_route(p, TransportVerb::PrepareFromSearch,     VerbRoute::native(SessionMethod::PrepareFromSearch));
    set_route(p, TransportVerb::PrepareFromUri,        VerbRoute::native(SessionMethod::PrepareFromUri));
    set_route(p, TransportVerb::Play,                  VerbRoute::native(SessionMethod::Play));
    set_route(p, TransportVerb::PlayFromMediaId,       VerbRoute::native(SessionMethod::PlayFromMediaId));
    set_route(p, TransportVerb::PlayFromSearch,        VerbRoute::native(SessionMethod::PlayFromSearch));
    set_route(p, TransportVerb::PlayFromUri,           VerbRoute::native(SessionMethod::PlayFromUri));
    set_route(p, TransportVerb::SkipToQueueItem,       VerbRoute::native(SessionMethod::SkipToQueueItem));
    set_route(p, TransportVerb::Pause,                 VerbRoute::native(SessionMethod::Pause));
    set_route(p, TransportVerb::Stop,                  VerbRoute::native(SessionMethod::Stop));
    set_route(p, TransportVerb::SeekTo,                VerbRoute::native(SessionMethod::SeekTo));
    set_route(p, TransportVerb::FastForward,           VerbRoute::native(SessionMethod::FastForward));
    set_route(p, TransportVerb::Rewind,                VerbRoute::native(SessionMethod::Rewind));
    set_route(p, TransportVerb::SkipToNext,            VerbRoute::native(SessionMethod::Next));
    set_route(p, TransportVerb::SkipToPrevious,        VerbRoute::native(SessionMethod::Previous));
    set_route(p, TransportVerb::SetRating,             VerbRoute::native(SessionMethod::Rate));
    set_route(p, TransportVerb::SetRepeatMode,         VerbRoute::native(SessionMethod::SetRepeatMode));
    set_route(p, TransportVerb::SetShuffleModeEnabled, VerbRoute::native(SessionMethod::SetShuffleModeEnabled));
    set_route(p, TransportVerb::SendCustomAction,      VerbRoute::native(SessionMethod::SendCustomAction));
    return p;
}

// The base channel of this tier has no prepare, uri or repeat/shuffle
// primitives; those go through custom actions understood by the session.
void apply_extended_channel(TierProfile& p) {
    p.level = CapabilityLevel::ExtendedChannel;
    p.negotiates_extended_channel = true;
    p.queue_encoding = QueueEncoding::GenericCommands;
    p.playback_state_source = QuerySource::PreferExtended;
    p.rating_type_source = QuerySource::PreferExtended;
    p.repeat_shuffle_source = QuerySource::ExtendedOnly;

    set_route(p, TransportVerb::Prepare,               VerbRoute::custom_action(protocol::kActionPrepare));
    set_route(p, TransportVerb::PrepareFromMediaId,    VerbRoute::custom_action(protocol::kActionPrepareFromMediaId));
    set_route(p, TransportVerb::PrepareFromSearch,     VerbRoute::custom_action(protocol::kActionPrepareFromSearch));
    set_route(p, TransportVerb::PrepareFromUri,        VerbRoute::custom_action(protocol::kActionPrepareFromUri));
    set_route(p, TransportVerb::PlayFromUri,           VerbRoute::custom_action(protocol::kActionPlayFromUri));
    set_route(p, TransportVerb::SetRepeatMode,         VerbRoute::custom_action(protocol::kActionSetRepeatMode));
    set_route(p, TransportVerb::SetShuffleModeEnabled, VerbRoute::custom_action(protocol::kActionSetShuffleModeEnabled));
}

void apply_native_play_from_uri(TierProfile& p) {
    p.level = CapabilityLevel::NativePlayFromUri;
    // The base channel reports the rating type correctly from this tier on
    p.rating_type_source = QuerySource::BaseChannel;
    set_route(p, TransportVerb::PlayFromUri, VerbRoute::native(SessionMethod::PlayFromUri));
}

void apply_native_prepare(TierProfile& p) {
    p.level = CapabilityLevel::NativePrepare;
    set_route(p, TransportVerb::Prepare,            VerbRoute::native(SessionMethod::Prepare));
    set_route(p, TransportVerb::PrepareFromMediaId, VerbRoute::native(SessionMethod::PrepareFromMediaId));
    set_route(p, TransportVerb::PrepareFromSearch,  VerbRoute::native(SessionMethod::PrepareFromSearch));
    set_route(p, TransportVerb::PrepareFromUri,     VerbRoute::native(SessionMethod::PrepareFromUri));
}

} // namespace

// ============================================================================
// Selection
// ============================================================================

TierProfile select_tier_profile(CapabilityLevel level) {
    TierProfile profile = legacy_profile();
    if (level >= CapabilityLevel::ExtendedChannel)   apply_extended_channel(profile);
    if (level >= CapabilityLevel::NativePlayFromUri) apply_native_play_from_uri(profile);
    if (level >= CapabilityLevel::NativePrepare)     apply_native_prepare(profile);
    return profile;
}

} // namespace core
} // namespace mediactl
