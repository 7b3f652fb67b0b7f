#include "mediactl/core/CapabilityNegotiator.hpp"
#include "mediactl/core/SessionProtocol.hpp"

namespace mediactl {
namespace core {

// ============================================================================
// Receiver - result of GET_EXTRA_CHANNEL
// ============================================================================

class CapabilityNegotiator::Receiver : public interfaces::IResultReceiver {
public:
    explicit Receiver(std::shared_ptr<Shared> shared) : shared_(std::move(shared)) {}

    void send(int32_t result_code, const common::Bundle& data) override {
        std::lock_guard<std::mutex> lock(shared_->mutex);

        if (shared_->state != State::Pending) {
            shared_->logger->debug(std::string("[CapabilityNegotiator] Result ignored in state ")
                                   + negotiation_state_name(shared_->state));
            return;
        }

        auto channel = data.get<common::ChannelRef>(protocol::kExtraChannel);
        if (!channel || !*channel) {
            shared_->state = State::Failed;
            shared_->on_acquired = nullptr;
            shared_->logger->warn("[CapabilityNegotiator] Session returned no extended channel (code "
                                  + std::to_string(result_code) + ")");
            return;
        }

        shared_->state = State::Completed;
        auto on_acquired = std::move(shared_->on_acquired);
        shared_->on_acquired = nullptr;

        // Under the lock: dispose() waits for this to finish
        if (on_acquired) {
            on_acquired(*channel);
        }
    }

private:
    std::shared_ptr<Shared> shared_;
};

// ============================================================================
// CapabilityNegotiator
// ============================================================================

CapabilityNegotiator::CapabilityNegotiator(std::shared_ptr<common::ILogger> logger)
    : shared_(std::make_shared<Shared>())
{
    shared_->logger = logger ? std::move(logger) : common::default_logger();
}

CapabilityNegotiator::~CapabilityNegotiator() {
    dispose();
}

bool CapabilityNegotiator::start(interfaces::ISessionChannel& base, AcquiredFn on_acquired) {
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (shared_->state != State::Idle) {
            return shared_->state != State::Failed;
        }
        shared_->state = State::Pending;
        shared_->on_acquired = std::move(on_acquired);
    }

    common::Bundle args;
    args.put_string(protocol::kArgCommand, protocol::kCommandGetExtraChannel);
    args.put_bundle(protocol::kArgParams, common::Bundle());
    args.put(protocol::kArgReceiver, common::ReceiverRef(std::make_shared<Receiver>(shared_)));

    auto result = base.invoke_one_way(interfaces::SessionMethod::SendCommand, args);
    if (result.is_err()) {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (shared_->state == State::Pending) {
            shared_->state = State::Failed;
            shared_->on_acquired = nullptr;
        }
        shared_->logger->error("[CapabilityNegotiator] Dead object in requestExtraChannel: "
                              + result.error().message);
        return false;
    }

    shared_->logger->debug("[CapabilityNegotiator] Extended channel requested");
    return true;
}

void CapabilityNegotiator::dispose() {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->state = State::Disposed;
    shared_->on_acquired = nullptr;
}

CapabilityNegotiator::State CapabilityNegotiator::state() const {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->state;
}

const char* negotiation_state_name(CapabilityNegotiator::State state) noexcept {
    switch (state) {
        case CapabilityNegotiator::State::Idle:      return "Idle";
        case CapabilityNegotiator::State::Pending:   return "Pending";
        case CapabilityNegotiator::State::Completed: return "Completed";
        case CapabilityNegotiator::State::Failed:    return "Failed";
        case CapabilityNegotiator::State::Disposed:  return "Disposed";
    }
    return "Unknown";
}

} // namespace core
} // namespace mediactl
