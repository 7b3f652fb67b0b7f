#include "mediactl/core/CallbackRegistry.hpp"
#include <algorithm>
#include <atomic>
#include "mediactl/common/ControllerError.hpp"

namespace mediactl {
namespace core {

// ============================================================================
// Construction
// ============================================================================

namespace {

uint64_t next_registry_id() {
    static std::atomic<uint64_t> counter{0};
    return ++counter;
}

} // namespace

CallbackRegistry::CallbackRegistry(
    std::shared_ptr<interfaces::ISessionChannel> base_channel,
    EventPolicy policy,
    bool negotiates_extended_channel,
    std::shared_ptr<common::ILogger> logger
)
    : base_channel_(std::move(base_channel))
    , policy_(policy)
    , negotiates_extended_channel_(negotiates_extended_channel)
    , logger_(logger ? std::move(logger) : common::default_logger())
    , id_(next_registry_id())
{
}

CallbackRegistry::~CallbackRegistry() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : registrations_) {
        release_locked(*entry.second);
    }
    registrations_.clear();
    pending_.clear();
}

// ============================================================================
// Registration
// ============================================================================

void CallbackRegistry::register_callback(
    const std::shared_ptr<MediaControllerCallback>& callback,
    const std::shared_ptr<interfaces::IDispatchTarget>& target
) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (registrations_.count(callback.get()) != 0) {
        throw common::InvalidArgumentError("Callback is already registered");
    }

    auto registration = std::make_unique<Registration>();
    registration->callback = callback;
    registration->dispatcher = std::make_shared<EventDispatcher>(callback, target, logger_);
    registration->base_sink = std::make_shared<BaseChannelSink>(
        callback, registration->dispatcher, policy_, logger_);
    registration->death_monitor = std::make_unique<DeathMonitor>(registration->dispatcher, logger_);

    bool expected = false;
    if (!callback->registered_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        throw common::InvalidArgumentError("Callback is registered with another controller");
    }
    callback->registry_id_.store(id_, std::memory_order_release);
    callback->has_extended_channel_.store(false, std::memory_order_release);

    auto result = base_channel_->register_event_sink(registration->base_sink);
    if (result.is_err()) {
        // Still a registration: the caller learns about the dead session
        // through on_session_destroyed() and unregisters as usual
        logger_->error("[CallbackRegistry] Dead object in registerCallback: " + result.error().message);
        registration->dispatcher->post_session_destroyed();
    } else {
        registration->death_monitor->watch(*base_channel_);
    }

    Registration& ref = *registration;
    registrations_.emplace(callback.get(), std::move(registration));

    if (extended_channel_) {
        attach_extended_locked(ref);
    } else if (negotiates_extended_channel_) {
        pending_.push_back(callback.get());
        logger_->debug("[CallbackRegistry] Registration pending extended channel ("
                       + std::to_string(pending_.size()) + " queued)");
    }
}

void CallbackRegistry::unregister_callback(const std::shared_ptr<MediaControllerCallback>& callback) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = registrations_.find(callback.get());
    if (it == registrations_.end()) {
        // Registered here before and already released
        if (callback->registry_id_.load(std::memory_order_acquire) == id_) {
            return;
        }
        throw common::InvalidArgumentError("Callback was never registered");
    }

    release_locked(*it->second);
    pending_.erase(std::remove(pending_.begin(), pending_.end(), callback.get()), pending_.end());
    registrations_.erase(it);
}

void CallbackRegistry::release_locked(Registration& registration) {
    auto& callback = registration.callback;

    auto result = base_channel_->unregister_event_sink(registration.base_sink);
    if (result.is_err()) {
        logger_->error("[CallbackRegistry] Dead object in unregisterCallback: " + result.error().message);
    }

    if (registration.extended_sink && extended_channel_) {
        auto ext_result = extended_channel_->unregister_event_sink(registration.extended_sink);
        if (ext_result.is_err()) {
            logger_->error("[CallbackRegistry] Dead object in unregisterCallback (extended): "
                          + ext_result.error().message);
        }
    }

    registration.death_monitor->stop();
    registration.dispatcher->close();
    // Registered flag last: clearing it hands the callback to other controllers
    callback->has_extended_channel_.store(false, std::memory_order_release);
    callback->registered_.store(false, std::memory_order_release);
}

// ============================================================================
// Extended channel
// ============================================================================

bool CallbackRegistry::attach_extended_channel(std::shared_ptr<interfaces::ISessionChannel> channel) {
    if (!channel) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (extended_channel_) {
        logger_->debug("[CallbackRegistry] Extended channel already attached; ignoring");
        return false;
    }
    extended_channel_ = std::move(channel);

    size_t attached = 0;
    for (const MediaControllerCallback* key : pending_) {
        auto it = registrations_.find(key);
        if (it == registrations_.end()) {
            continue;
        }
        if (!attach_extended_locked(*it->second)) {
            break;
        }
        attached++;
    }

    logger_->info("[CallbackRegistry] Extended channel attached (" + std::to_string(attached)
                  + " of " + std::to_string(pending_.size()) + " pending registrations)");
    pending_.clear();
    return true;
}

bool CallbackRegistry::attach_extended_locked(Registration& registration) {
    auto sink = std::make_shared<ExtendedChannelSink>(registration.dispatcher, policy_, logger_);

    // Flag first: the base sink starts suppressing before the extended
    // sink can deliver, never the other way round
    registration.callback->has_extended_channel_.store(true, std::memory_order_release);

    auto result = extended_channel_->register_event_sink(sink);
    if (result.is_err()) {
        registration.callback->has_extended_channel_.store(false, std::memory_order_release);
        logger_->error("[CallbackRegistry] Dead object in registerCallback (extended): " + result.error().message);
        return false;
    }

    registration.extended_sink = std::move(sink);
    return true;
}

// ============================================================================
// State
// ============================================================================

std::shared_ptr<interfaces::ISessionChannel> CallbackRegistry::extended_channel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return extended_channel_;
}

bool CallbackRegistry::has_extended_channel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return extended_channel_ != nullptr;
}

size_t CallbackRegistry::live_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registrations_.size();
}

size_t CallbackRegistry::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool CallbackRegistry::is_registered(const std::shared_ptr<MediaControllerCallback>& callback) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registrations_.count(callback.get()) != 0;
}

bool CallbackRegistry::has_extended_sink(const std::shared_ptr<MediaControllerCallback>& callback) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registrations_.find(callback.get());
    return it != registrations_.end() && it->second->extended_sink != nullptr;
}

} // namespace core
} // namespace mediactl
