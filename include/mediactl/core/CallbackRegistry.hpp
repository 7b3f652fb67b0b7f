#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include "mediactl/common/Logger.hpp"
#include "mediactl/core/DeathMonitor.hpp"
#include "mediactl/core/EventDispatcher.hpp"
#include "mediactl/core/EventSinks.hpp"
#include "mediactl/core/MediaControllerCallback.hpp"
#include "mediactl/interfaces/IDispatchTarget.hpp"
#include "mediactl/interfaces/ISessionChannel.hpp"

namespace mediactl {
namespace core {

// ============================================================================
// CallbackRegistry - Live callback registrations of one controller
// ============================================================================
// Every registration gets a base sink on the base channel. When the
// extended channel is known (or becomes known) it also gets an extended
// sink there; registrations made before that are parked in the pending
// queue and attached, in registration order, by attach_extended_channel().
//
// Thread Safety: one mutex guards the registrations, the pending queue and
// the extended channel handle. Registration, unregistration and extended
// channel attachment are mutually exclusive. A callback is claimed by
// atomically setting its registered flag, so two registries never hold it
// at the same time.
// ============================================================================

class CallbackRegistry {
public:
    CallbackRegistry(
        std::shared_ptr<interfaces::ISessionChannel> base_channel,
        EventPolicy policy,
        bool negotiates_extended_channel,
        std::shared_ptr<common::ILogger> logger
    );

    // Unregisters everything still live
    ~CallbackRegistry();

    CallbackRegistry(const CallbackRegistry&) = delete;
    CallbackRegistry& operator=(const CallbackRegistry&) = delete;

    /**
     * @brief Register `callback`, delivering on `target`.
     * @throws InvalidArgumentError if the callback is already registered
     *         here or with another controller
     */
    void register_callback(
        const std::shared_ptr<MediaControllerCallback>& callback,
        const std::shared_ptr<interfaces::IDispatchTarget>& target
    );

    /**
     * @brief Unregister `callback`. A second call is a no-op.
     * @throws InvalidArgumentError if it was never registered here
     */
    void unregister_callback(const std::shared_ptr<MediaControllerCallback>& callback);

    /**
     * @brief Record the extended channel and attach all pending registrations.
     * @return false if a channel was already recorded (the new one is ignored)
     */
    bool attach_extended_channel(std::shared_ptr<interfaces::ISessionChannel> channel);

    std::shared_ptr<interfaces::ISessionChannel> extended_channel() const;
    bool has_extended_channel() const;

    size_t live_count() const;
    size_t pending_count() const;
    bool is_registered(const std::shared_ptr<MediaControllerCallback>& callback) const;

    // True if `callback` currently has a sink on the extended channel
    bool has_extended_sink(const std::shared_ptr<MediaControllerCallback>& callback) const;

private:
    struct Registration {
        std::shared_ptr<MediaControllerCallback> callback;
        std::shared_ptr<EventDispatcher> dispatcher;
        std::shared_ptr<BaseChannelSink> base_sink;
        std::shared_ptr<ExtendedChannelSink> extended_sink;
        std::unique_ptr<DeathMonitor> death_monitor;
    };

    // Caller holds mutex_
    bool attach_extended_locked(Registration& registration);
    void release_locked(Registration& registration);

    std::shared_ptr<interfaces::ISessionChannel> base_channel_;
    EventPolicy policy_;
    bool negotiates_extended_channel_;
    std::shared_ptr<common::ILogger> logger_;

    mutable std::mutex mutex_;
    std::shared_ptr<interfaces::ISessionChannel> extended_channel_;
    std::map<const MediaControllerCallback*, std::unique_ptr<Registration>> registrations_;
    std::vector<const MediaControllerCallback*> pending_;

    // Stamped on each callback this registry registers; outlives unregister
    const uint64_t id_;
};

} // namespace core
} // namespace mediactl
