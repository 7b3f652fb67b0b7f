#include "mediactl/core/SessionProtocol.hpp"
#include "mediactl/interfaces/ISessionChannel.hpp"

namespace mediactl {
namespace core {
namespace protocol {

bool is_reserved_command(const std::string& command) {
    return command == kCommandGetExtraChannel
        || command == kCommandAddQueueItem
        || command == kCommandAddQueueItemAt
        || command == kCommandRemoveQueueItem
        || command == kCommandRemoveQueueItemAt;
}

} // namespace protocol
} // namespace core

namespace interfaces {

const char* session_method_name(SessionMethod method) noexcept {
    switch (method) {
        case SessionMethod::GetPlaybackState:      return "getPlaybackState";
        case SessionMethod::GetMetadata:           return "getMetadata";
        case SessionMethod::GetQueue:              return "getQueue";
        case SessionMethod::GetQueueTitle:         return "getQueueTitle";
        case SessionMethod::GetExtras:             return "getExtras";
        case SessionMethod::GetRatingType:         return "getRatingType";
        case SessionMethod::GetRepeatMode:         return "getRepeatMode";
        case SessionMethod::IsShuffleModeEnabled:  return "isShuffleModeEnabled";
        case SessionMethod::GetFlags:              return "getFlags";
        case SessionMethod::GetVolumeAttributes:   return "getVolumeAttributes";
        case SessionMethod::GetLaunchActivity:     return "getLaunchActivity";
        case SessionMethod::GetPackageName:        return "getPackageName";
        case SessionMethod::SendCommand:           return "sendCommand";
        case SessionMethod::SendMediaButton:       return "sendMediaButton";
        case SessionMethod::SetVolumeTo:           return "setVolumeTo";
        case SessionMethod::AdjustVolume:          return "adjustVolume";
        case SessionMethod::AddQueueItem:          return "addQueueItem";
        case SessionMethod::AddQueueItemAt:        return "addQueueItemAt";
        case SessionMethod::RemoveQueueItem:       return "removeQueueItem";
        case SessionMethod::RemoveQueueItemAt:     return "removeQueueItemAt";
        case SessionMethod::Prepare:               return "prepare";
        case SessionMethod::PrepareFromMediaId:    return "prepareFromMediaId";
        case SessionMethod::PrepareFromSearch:     return "prepareFromSearch";
        case SessionMethod::PrepareFromUri:        return "prepareFromUri";
        case SessionMethod::Play:                  return "play";
        case SessionMethod::PlayFromMediaId:       return "playFromMediaId";
        case SessionMethod::PlayFromSearch:        return "playFromSearch";
        case SessionMethod::PlayFromUri:           return "playFromUri";
        case SessionMethod::SkipToQueueItem:       return "skipToQueueItem";
        case SessionMethod::Pause:                 return "pause";
        case SessionMethod::Stop:                  return "stop";
        case SessionMethod::SeekTo:                return "seekTo";
        case SessionMethod::FastForward:           return "fastForward";
        case SessionMethod::Rewind:                return "rewind";
        case SessionMethod::Next:                  return "next";
        case SessionMethod::Previous:              return "previous";
        case SessionMethod::Rate:                  return "rate";
        case SessionMethod::SetRepeatMode:         return "setRepeatMode";
        case SessionMethod::SetShuffleModeEnabled: return "setShuffleModeEnabled";
        case SessionMethod::SendCustomAction:      return "sendCustomAction";
    }
    return "unknown";
}

} // namespace interfaces
} // namespace mediactl
