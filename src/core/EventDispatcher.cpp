#include "mediactl/core/EventDispatcher.hpp"
#include <exception>

namespace mediactl {
namespace core {

// ============================================================================
// Construction
// ============================================================================

EventDispatcher::EventDispatcher(
    std::shared_ptr<MediaControllerCallback> callback,
    std::shared_ptr<interfaces::IDispatchTarget> target,
    std::shared_ptr<common::ILogger> logger
)
    : callback_(std::move(callback))
    , target_(std::move(target))
    , logger_(logger ? std::move(logger) : common::default_logger())
{
}

// ============================================================================
// Producers
// ============================================================================

bool EventDispatcher::enqueue(SessionEvent event) {
    if (is_session_destroyed(event)) {
        return post_session_destroyed();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (terminal_) {
        stats_.dropped++;
        return false;
    }

    // Accepted even after close(); drain() drops it
    mailbox_.push_back(std::move(event));
    stats_.enqueued++;
    schedule_drain_locked();
    return true;
}

bool EventDispatcher::post_session_destroyed() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (terminal_) {
        return false;
    }
    terminal_ = true;

    stats_.dropped += mailbox_.size();
    mailbox_.clear();
    mailbox_.push_back(events::SessionDestroyed{});
    stats_.enqueued++;
    schedule_drain_locked();
    return true;
}

void EventDispatcher::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
}

void EventDispatcher::schedule_drain_locked() {
    if (drain_scheduled_) {
        return; // The running drain picks the new message up
    }
    drain_scheduled_ = true;

    auto self = shared_from_this();
    if (!target_->post([self]() { self->drain(); })) {
        drain_scheduled_ = false;
        stats_.dropped += mailbox_.size();
        mailbox_.clear();
        logger_->warn("[EventDispatcher] Dispatch target rejected delivery; messages dropped");
    }
}

// ============================================================================
// Consumer (dispatch target)
// ============================================================================

void EventDispatcher::drain() {
    while (true) {
        SessionEvent event;
        bool deliver = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (mailbox_.empty()) {
                drain_scheduled_ = false;
                return;
            }
            event = std::move(mailbox_.front());
            mailbox_.pop_front();

            deliver = open_ && callback_->is_registered();
            if (deliver) {
                stats_.delivered++;
            } else {
                stats_.dropped++;
            }
        }

        if (!deliver) {
            continue;
        }

        try {
            callback_->deliver(event);
        } catch (const std::exception& e) {
            logger_->error(std::string("[EventDispatcher] Callback threw in ")
                           + session_event_name(event) + ": " + e.what());
        }
    }
}

// ============================================================================
// State
// ============================================================================

bool EventDispatcher::is_terminal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminal_;
}

bool EventDispatcher::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

size_t EventDispatcher::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mailbox_.size();
}

EventDispatcher::Stats EventDispatcher::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace core
} // namespace mediactl
