#pragma once
#include <memory>
#include "mediactl/common/Logger.hpp"
#include "mediactl/core/EventDispatcher.hpp"
#include "mediactl/interfaces/ISessionChannel.hpp"

namespace mediactl {
namespace core {

// ============================================================================
// DeathMonitor - Turns remote death into SessionDestroyed
// ============================================================================
// Watches the base channel for one registration. Death and an explicit
// sessionDestroyed event race; EventDispatcher::post_session_destroyed()
// lets the first one win, so the callback sees exactly one
// on_session_destroyed().
// ============================================================================

class DeathMonitor {
public:
    DeathMonitor(std::shared_ptr<EventDispatcher> dispatcher, std::shared_ptr<common::ILogger> logger);
    ~DeathMonitor();

    DeathMonitor(const DeathMonitor&) = delete;
    DeathMonitor& operator=(const DeathMonitor&) = delete;

    // Returns false if the remote is already dead; the destroyed event is
    // then queued immediately
    bool watch(interfaces::ISessionChannel& channel);

    // Stop watching. Safe to call more than once.
    void stop();

    bool watching() const { return subscription_.active(); }

private:
    std::shared_ptr<EventDispatcher> dispatcher_;
    std::shared_ptr<common::ILogger> logger_;
    interfaces::Subscription subscription_;
};

} // namespace core
} // namespace mediactl
