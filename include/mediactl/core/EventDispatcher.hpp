#pragma once
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include "mediactl/common/Logger.hpp"
#include "mediactl/core/MediaControllerCallback.hpp"
#include "mediactl/core/SessionEvent.hpp"
#include "mediactl/interfaces/IDispatchTarget.hpp"

namespace mediactl {
namespace core {

// ============================================================================
// EventDispatcher - Ordered delivery path for one registration
// ============================================================================
// Producers (transport delivery threads) call enqueue(); the dispatcher
// keeps a FIFO mailbox and keeps at most one drain task posted on the
// dispatch target, so messages reach the callback strictly in arrival
// order even if the target itself ran tasks concurrently.
//
// Terminal state: post_session_destroyed() drops everything still queued,
// queues exactly one SessionDestroyed and refuses all later messages.
//
// Thread Safety: enqueue()/post_session_destroyed()/close() are
// thread-safe. Callback handlers only ever run on the dispatch target.
// ============================================================================

class EventDispatcher : public std::enable_shared_from_this<EventDispatcher> {
public:
    struct Stats {
        uint64_t enqueued = 0;
        uint64_t delivered = 0;
        uint64_t dropped = 0;
    };

    EventDispatcher(
        std::shared_ptr<MediaControllerCallback> callback,
        std::shared_ptr<interfaces::IDispatchTarget> target,
        std::shared_ptr<common::ILogger> logger
    );

    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    // Returns false once the dispatcher is terminal. A SessionDestroyed
    // passed here is routed to post_session_destroyed().
    bool enqueue(SessionEvent event);

    // Returns true for the call that made the dispatcher terminal
    bool post_session_destroyed();

    // The registration ended: anything not yet drained is dropped
    void close();

    bool is_terminal() const;
    bool is_open() const;
    size_t pending() const;
    Stats get_stats() const;

    const std::shared_ptr<interfaces::IDispatchTarget>& target() const { return target_; }

private:
    // Caller holds mutex_
    void schedule_drain_locked();

    // Runs on the dispatch target
    void drain();

    std::shared_ptr<MediaControllerCallback> callback_;
    std::shared_ptr<interfaces::IDispatchTarget> target_;
    std::shared_ptr<common::ILogger> logger_;

    mutable std::mutex mutex_;
    std::deque<SessionEvent> mailbox_;
    bool drain_scheduled_ = false;
    bool terminal_ = false;
    bool open_ = true;
    Stats stats_;
};

} // namespace core
} // namespace mediactl
