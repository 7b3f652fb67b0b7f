#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include "mediactl/common/Logger.hpp"
#include "mediactl/interfaces/ISessionChannel.hpp"

namespace mediactl {
namespace core {

// ============================================================================
// CapabilityNegotiator - Acquires the extended channel
// ============================================================================
// Sends the reserved GET_EXTRA_CHANNEL command once and hands the channel
// from the result to `on_acquired`. The result arrives on a transport
// thread and may arrive after the owning controller is gone; dispose()
// guarantees `on_acquired` is not running and will never run afterwards.
// ============================================================================

class CapabilityNegotiator {
public:
    using AcquiredFn = std::function<void(std::shared_ptr<interfaces::ISessionChannel>)>;

    enum class State {
        Idle,
        Pending,
        Completed,
        Failed,
        Disposed
    };

    explicit CapabilityNegotiator(std::shared_ptr<common::ILogger> logger);
    ~CapabilityNegotiator();

    CapabilityNegotiator(const CapabilityNegotiator&) = delete;
    CapabilityNegotiator& operator=(const CapabilityNegotiator&) = delete;

    /**
     * @brief Send the negotiation request on `base`. Only the first call sends.
     * @return false if the request could not be sent
     */
    bool start(interfaces::ISessionChannel& base, AcquiredFn on_acquired);

    // Blocks while a completion is running on another thread
    void dispose();

    State state() const;

private:
    struct Shared {
        std::mutex mutex;
        State state = State::Idle;
        AcquiredFn on_acquired;
        std::shared_ptr<common::ILogger> logger;
    };

    class Receiver;

    std::shared_ptr<Shared> shared_;
};

const char* negotiation_state_name(CapabilityNegotiator::State state) noexcept;

} // namespace core
} // namespace mediactl
