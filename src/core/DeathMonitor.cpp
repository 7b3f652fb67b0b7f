#include "mediactl/core/DeathMonitor.hpp"

namespace mediactl {
namespace core {

DeathMonitor::DeathMonitor(std::shared_ptr<EventDispatcher> dispatcher, std::shared_ptr<common::ILogger> logger)
    : dispatcher_(std::move(dispatcher))
    , logger_(std::move(logger))
{
}

DeathMonitor::~DeathMonitor() {
    stop();
}

bool DeathMonitor::watch(interfaces::ISessionChannel& channel) {
    stop();

    // The handler may outlive this monitor on the transport thread
    std::weak_ptr<EventDispatcher> weak = dispatcher_;
    std::shared_ptr<common::ILogger> logger = logger_;

    subscription_ = channel.on_remote_death([weak, logger]() {
        if (auto dispatcher = weak.lock()) {
            if (dispatcher->post_session_destroyed()) {
                logger->info("[DeathMonitor] Remote session died");
            }
        }
    });

    if (!subscription_.active()) {
        logger_->warn("[DeathMonitor] Remote session already dead");
        dispatcher_->post_session_destroyed();
        return false;
    }
    return true;
}

void DeathMonitor::stop() {
    subscription_.reset();
}

} // namespace core
} // namespace mediactl
