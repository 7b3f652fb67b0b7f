#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "mediactl/common/Bundle.hpp"
#include "mediactl/common/MediaTypes.hpp"
#include "mediactl/common/Result.hpp"

namespace mediactl {
namespace interfaces {

// ============================================================================
// SessionMethod - Remote methods of the session contract
// ============================================================================
// Arguments and results travel as Bundles. Argument keys are defined in
// core/SessionProtocol.hpp; query results carry their value under
// protocol::kResultValue.
// ============================================================================

enum class SessionMethod : uint32_t {
    // Queries (invoke)
    GetPlaybackState = 1,
    GetMetadata,
    GetQueue,
    GetQueueTitle,
    GetExtras,
    GetRatingType,
    GetRepeatMode,
    IsShuffleModeEnabled,
    GetFlags,
    GetVolumeAttributes,
    GetLaunchActivity,
    GetPackageName,

    // Commands (invoke_one_way)
    SendCommand,
    SendMediaButton,
    SetVolumeTo,
    AdjustVolume,
    AddQueueItem,
    AddQueueItemAt,
    RemoveQueueItem,
    RemoveQueueItemAt,

    // Transport controls (invoke_one_way)
    Prepare,
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
    Next,
    Previous,
    Rate,
    SetRepeatMode,
    SetShuffleModeEnabled,
    SendCustomAction
};

const char* session_method_name(SessionMethod method) noexcept;

// ============================================================================
// ISessionEventSink - Events pushed by the remote session
// ============================================================================
// Called on the transport's delivery thread, which may differ per call.
// Implementations must not block.
// ============================================================================

class ISessionEventSink {
public:
    virtual ~ISessionEventSink() = default;

    virtual void on_event(const std::string& event, const common::Bundle& extras) = 0;
    virtual void on_session_destroyed() = 0;
    virtual void on_playback_state_changed(const std::optional<common::PlaybackState>& state) = 0;
    virtual void on_metadata_changed(const std::optional<common::MediaMetadata>& metadata) = 0;
    virtual void on_queue_changed(const std::optional<std::vector<common::QueueItem>>& queue) = 0;
    virtual void on_queue_title_changed(const std::optional<std::string>& title) = 0;
    virtual void on_extras_changed(const common::Bundle& extras) = 0;
    virtual void on_volume_info_changed(const std::optional<common::PlaybackInfo>& info) = 0;
    virtual void on_repeat_mode_changed(common::RepeatMode mode) = 0;
    virtual void on_shuffle_mode_changed(bool enabled) = 0;
};

// ============================================================================
// IResultReceiver - One-shot result sink for generic commands
// ============================================================================

class IResultReceiver {
public:
    virtual ~IResultReceiver() = default;
    virtual void send(int32_t result_code, const common::Bundle& data) = 0;
};

// Adapts a callable to IResultReceiver
class FunctionResultReceiver : public IResultReceiver {
public:
    using Fn = std::function<void(int32_t, const common::Bundle&)>;

    explicit FunctionResultReceiver(Fn fn) : fn_(std::move(fn)) {}

    void send(int32_t result_code, const common::Bundle& data) override {
        if (fn_) fn_(result_code, data);
    }

private:
    Fn fn_;
};

// ============================================================================
// Subscription - Handle returned by on_remote_death
// ============================================================================
// Move-only. Cancels the underlying registration when reset or destroyed.
// ============================================================================

class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}

    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept : cancel_(std::move(other.cancel_)) {
        other.cancel_ = nullptr;
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            cancel_ = std::move(other.cancel_);
            other.cancel_ = nullptr;
        }
        return *this;
    }

    void reset() {
        if (cancel_) {
            auto cancel = std::move(cancel_);
            cancel_ = nullptr;
            cancel();
        }
    }

    bool active() const { return static_cast<bool>(cancel_); }

private:
    std::function<void()> cancel_;
};

// ============================================================================
// ISessionChannel - Transport handle to one remote session
// ============================================================================
// The concrete transport is owned by the host environment. Every call may
// fail with ErrorCode::RemoteGone once the remote endpoint has died.
//
// Thread Safety: all methods may be called concurrently from any thread.
// Events for one sink are delivered in the order they were produced.
// ============================================================================

class ISessionChannel {
public:
    using DeathHandler = std::function<void()>;

    virtual ~ISessionChannel() = default;

    // Synchronous round-trip
    virtual common::Result<common::Bundle> invoke(SessionMethod method, const common::Bundle& args) = 0;

    // Fire-and-forget
    virtual common::EmptyResult invoke_one_way(SessionMethod method, const common::Bundle& args) = 0;

    virtual common::EmptyResult register_event_sink(std::shared_ptr<ISessionEventSink> sink) = 0;
    virtual common::EmptyResult unregister_event_sink(const std::shared_ptr<ISessionEventSink>& sink) = 0;

    // Handler runs at most once, on a transport thread. If the remote is
    // already dead the returned subscription is inactive and the handler
    // is not called.
    virtual Subscription on_remote_death(DeathHandler handler) = 0;

    virtual bool is_alive() const = 0;
};

} // namespace interfaces
} // namespace mediactl
