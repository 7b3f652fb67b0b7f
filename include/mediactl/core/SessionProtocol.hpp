#pragma once
#include <string>

namespace mediactl {
namespace core {
namespace protocol {

// ============================================================================
// Reserved generic command names
// ============================================================================
// Used internally for capability negotiation and for the queue-mutation
// fallback encoding. User commands with these names are rejected.

constexpr const char* kCommandGetExtraChannel   = "mediactl.session.command.GET_EXTRA_CHANNEL";
constexpr const char* kCommandAddQueueItem      = "mediactl.session.command.ADD_QUEUE_ITEM";
constexpr const char* kCommandAddQueueItemAt    = "mediactl.session.command.ADD_QUEUE_ITEM_AT";
constexpr const char* kCommandRemoveQueueItem   = "mediactl.session.command.REMOVE_QUEUE_ITEM";
constexpr const char* kCommandRemoveQueueItemAt = "mediactl.session.command.REMOVE_QUEUE_ITEM_AT";

constexpr const char* kCommandArgumentMediaDescription = "mediactl.session.command.ARGUMENT_MEDIA_DESCRIPTION";
constexpr const char* kCommandArgumentIndex            = "mediactl.session.command.ARGUMENT_INDEX";

// Key of the extended channel handle in the GET_EXTRA_CHANNEL result
constexpr const char* kExtraChannel = "mediactl.session.EXTRA_CHANNEL";

bool is_reserved_command(const std::string& command);

// ============================================================================
// Custom actions used when a tier lacks a native transport primitive
// ============================================================================

constexpr const char* kActionPrepare              = "mediactl.session.action.PREPARE";
constexpr const char* kActionPrepareFromMediaId   = "mediactl.session.action.PREPARE_FROM_MEDIA_ID";
constexpr const char* kActionPrepareFromSearch    = "mediactl.session.action.PREPARE_FROM_SEARCH";
constexpr const char* kActionPrepareFromUri       = "mediactl.session.action.PREPARE_FROM_URI";
constexpr const char* kActionPlayFromUri          = "mediactl.session.action.PLAY_FROM_URI";
constexpr const char* kActionSetRepeatMode        = "mediactl.session.action.SET_REPEAT_MODE";
constexpr const char* kActionSetShuffleModeEnabled = "mediactl.session.action.SET_SHUFFLE_MODE_ENABLED";

constexpr const char* kActionArgumentMediaId   = "mediactl.session.action.ARGUMENT_MEDIA_ID";
constexpr const char* kActionArgumentQuery     = "mediactl.session.action.ARGUMENT_QUERY";
constexpr const char* kActionArgumentUri       = "mediactl.session.action.ARGUMENT_URI";
constexpr const char* kActionArgumentExtras    = "mediactl.session.action.ARGUMENT_EXTRAS";
constexpr const char* kActionArgumentRepeatMode = "mediactl.session.action.ARGUMENT_REPEAT_MODE";
constexpr const char* kActionArgumentShuffleModeEnabled = "mediactl.session.action.ARGUMENT_SHUFFLE_MODE_ENABLED";

// ============================================================================
// Method argument / result keys
// ============================================================================

constexpr const char* kResultValue   = "value";

constexpr const char* kArgCommand    = "command";
constexpr const char* kArgParams     = "params";
constexpr const char* kArgReceiver   = "receiver";
constexpr const char* kArgAction     = "action";
constexpr const char* kArgArgs       = "args";
constexpr const char* kArgMediaId    = "media_id";
constexpr const char* kArgQuery      = "query";
constexpr const char* kArgUri        = "uri";
constexpr const char* kArgExtras     = "extras";
constexpr const char* kArgDescription = "description";
constexpr const char* kArgIndex      = "index";
constexpr const char* kArgQueueId    = "queue_id";
constexpr const char* kArgPosition   = "position";
constexpr const char* kArgRating     = "rating";
constexpr const char* kArgRepeatMode = "repeat_mode";
constexpr const char* kArgEnabled    = "enabled";
constexpr const char* kArgValue      = "value";
constexpr const char* kArgDirection  = "direction";
constexpr const char* kArgFlags      = "flags";
constexpr const char* kArgKeyEvent   = "key_event";

} // namespace protocol
} // namespace core
} // namespace mediactl
