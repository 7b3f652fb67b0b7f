#pragma once
#include <algorithm>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "mediactl/common/Bundle.hpp"
#include "mediactl/common/Result.hpp"
#include "mediactl/core/LooperThread.hpp"
#include "mediactl/core/SessionProtocol.hpp"
#include "mediactl/interfaces/ISessionChannel.hpp"

namespace mediactl {
namespace testing {

    // ========================================================================
    // FakeSessionChannel - In-process stand-in for a remote session
    // ========================================================================
    // Records every call, answers queries from a script, pushes events to
    // registered sinks and can die on request. Asynchronous work (events
    // sent with emit_async, negotiation replies) runs on the fake's own
    // "transport" thread, never on the caller's.
    // ========================================================================

    class FakeSessionChannel : public interfaces::ISessionChannel {
    public:
        enum class NegotiationMode {
            Respond, // Reply with the configured extended channel on the transport thread
            Hold,    // Keep the receiver until complete_negotiation()
            Ignore   // Never reply
        };

        struct Invocation {
            interfaces::SessionMethod method;
            common::Bundle args;
            bool one_way;

            std::string command() const { return args.get_string(core::protocol::kArgCommand); }
        };

        FakeSessionChannel()
            : state_(std::make_shared<State>())
            , transport_(std::make_unique<core::LooperThread>("fake-transport"))
        {
        }

        ~FakeSessionChannel() override {
            transport_->stop();
        }

        // ========== Scripting ==========

        void set_result(interfaces::SessionMethod method, common::Bundle result) {
            std::lock_guard<std::mutex> lock(state_->mutex);
            results_[method] = std::move(result);
        }

        template <typename T>
        void set_value(interfaces::SessionMethod method, T value) {
            common::Bundle result;
            result.put(core::protocol::kResultValue, std::move(value));
            set_result(method, std::move(result));
        }

        void set_flags(uint64_t flags) {
            set_value(interfaces::SessionMethod::GetFlags, static_cast<int64_t>(flags));
        }

        void set_negotiation(NegotiationMode mode, std::shared_ptr<interfaces::ISessionChannel> extended = nullptr) {
            std::lock_guard<std::mutex> lock(state_->mutex);
            negotiation_mode_ = mode;
            extended_ = std::move(extended);
        }

        void set_command_reply(const std::string& command, int32_t code, common::Bundle data) {
            std::lock_guard<std::mutex> lock(state_->mutex);
            command_replies_[command] = std::make_pair(code, std::move(data));
        }

        bool has_held_negotiation() const {
            std::lock_guard<std::mutex> lock(state_->mutex);
            return held_receiver_ != nullptr;
        }

        // Replies to a held negotiation on the transport thread
        bool complete_negotiation() {
            return reply_held(true);
        }

        bool complete_negotiation_without_channel() {
            return reply_held(false);
        }

        // ========== ISessionChannel ==========

        common::Result<common::Bundle> invoke(interfaces::SessionMethod method, const common::Bundle& args) override {
            std::lock_guard<std::mutex> lock(state_->mutex);
            invocations_.push_back(Invocation{method, args, false});
            if (!state_->alive) {
                return common::Result<common::Bundle>::err(common::ErrorCode::RemoteGone, "DeadObject");
            }
            auto it = results_.find(method);
            return common::Result<common::Bundle>::ok(it != results_.end() ? it->second : common::Bundle());
        }

        common::EmptyResult invoke_one_way(interfaces::SessionMethod method, const common::Bundle& args) override {
            std::lock_guard<std::mutex> lock(state_->mutex);
            invocations_.push_back(Invocation{method, args, true});
            if (!state_->alive) {
                return common::EmptyResult::err(common::ErrorCode::RemoteGone, "DeadObject");
            }
            if (method == interfaces::SessionMethod::SendCommand) {
                handle_command_locked(args);
            }
            return common::EmptyResult::success();
        }

        common::EmptyResult register_event_sink(std::shared_ptr<interfaces::ISessionEventSink> sink) override {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->alive) {
                return common::EmptyResult::err(common::ErrorCode::RemoteGone, "DeadObject");
            }
            sinks_.push_back(std::move(sink));
            return common::EmptyResult::success();
        }

        common::EmptyResult unregister_event_sink(const std::shared_ptr<interfaces::ISessionEventSink>& sink) override {
            std::lock_guard<std::mutex> lock(state_->mutex);
            sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
            if (!state_->alive) {
                return common::EmptyResult::err(common::ErrorCode::RemoteGone, "DeadObject");
            }
            return common::EmptyResult::success();
        }

        interfaces::Subscription on_remote_death(DeathHandler handler) override {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->alive) {
                return interfaces::Subscription();
            }
            uint64_t id = state_->next_handler_id++;
            state_->death_handlers[id] = std::move(handler);

            std::weak_ptr<State> weak = state_;
            return interfaces::Subscription([weak, id]() {
                if (auto state = weak.lock()) {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    state->death_handlers.erase(id);
                }
            });
        }

        bool is_alive() const override {
            std::lock_guard<std::mutex> lock(state_->mutex);
            return state_->alive;
        }

        // ========== Events ==========

        using SinkCall = std::function<void(interfaces::ISessionEventSink&)>;

        // Runs on the calling thread; exceptions from sinks propagate
        void emit(const SinkCall& call) {
            for (auto& sink : sinks_snapshot()) {
                call(*sink);
            }
        }

        // Runs on the transport thread, in call order
        void emit_async(SinkCall call) {
            auto sinks = sinks_snapshot();
            transport_->post([sinks, call]() {
                for (auto& sink : sinks) {
                    call(*sink);
                }
            });
        }

        // Waits until everything posted to the transport thread has run
        void flush() {
            auto done = std::make_shared<std::promise<void>>();
            auto future = done->get_future();
            if (transport_->post([done]() { done->set_value(); })) {
                future.wait();
            }
        }

        // Marks the session dead and runs the death handlers on this thread
        void kill() {
            std::map<uint64_t, DeathHandler> handlers;
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                if (!state_->alive) return;
                state_->alive = false;
                handlers.swap(state_->death_handlers);
            }
            for (auto& entry : handlers) {
                entry.second();
            }
        }

        // ========== Inspection ==========

        std::vector<Invocation> invocations() const {
            std::lock_guard<std::mutex> lock(state_->mutex);
            return invocations_;
        }

        size_t count(interfaces::SessionMethod method) const {
            std::lock_guard<std::mutex> lock(state_->mutex);
            return static_cast<size_t>(std::count_if(invocations_.begin(), invocations_.end(),
                [method](const Invocation& i) { return i.method == method; }));
        }

        size_t count_commands(const std::string& command) const {
            std::lock_guard<std::mutex> lock(state_->mutex);
            return static_cast<size_t>(std::count_if(invocations_.begin(), invocations_.end(),
                [&command](const Invocation& i) {
                    return i.method == interfaces::SessionMethod::SendCommand && i.command() == command;
                }));
        }

        std::optional<Invocation> last(interfaces::SessionMethod method) const {
            std::lock_guard<std::mutex> lock(state_->mutex);
            for (auto it = invocations_.rbegin(); it != invocations_.rend(); ++it) {
                if (it->method == method) return *it;
            }
            return std::nullopt;
        }

        void clear_invocations() {
            std::lock_guard<std::mutex> lock(state_->mutex);
            invocations_.clear();
        }

        size_t sink_count() const {
            std::lock_guard<std::mutex> lock(state_->mutex);
            return sinks_.size();
        }

        size_t death_handler_count() const {
            std::lock_guard<std::mutex> lock(state_->mutex);
            return state_->death_handlers.size();
        }

        std::thread::id transport_thread() const { return transport_->thread_id(); }

    private:
        // Shared with death subscriptions, which may outlive the channel
        struct State {
            mutable std::mutex mutex;
            bool alive = true;
            uint64_t next_handler_id = 1;
            std::map<uint64_t, DeathHandler> death_handlers;
        };

        std::vector<std::shared_ptr<interfaces::ISessionEventSink>> sinks_snapshot() const {
            std::lock_guard<std::mutex> lock(state_->mutex);
            return sinks_;
        }

        // Caller holds state_->mutex
        void handle_command_locked(const common::Bundle& args) {
            std::string command = args.get_string(core::protocol::kArgCommand);
            const common::ReceiverRef* receiver = args.get_if<common::ReceiverRef>(core::protocol::kArgReceiver);

            if (command == core::protocol::kCommandGetExtraChannel) {
                if (!receiver || !*receiver) return;
                switch (negotiation_mode_) {
                    case NegotiationMode::Respond:
                        post_reply(*receiver, 0, extra_channel_result(extended_));
                        break;
                    case NegotiationMode::Hold:
                        held_receiver_ = *receiver;
                        break;
                    case NegotiationMode::Ignore:
                        break;
                }
                return;
            }

            auto it = command_replies_.find(command);
            if (it != command_replies_.end() && receiver && *receiver) {
                post_reply(*receiver, it->second.first, it->second.second);
            }
        }

        bool reply_held(bool with_channel) {
            common::ReceiverRef receiver;
            std::shared_ptr<interfaces::ISessionChannel> extended;
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                receiver = std::move(held_receiver_);
                held_receiver_ = nullptr;
                extended = extended_;
            }
            if (!receiver) return false;
            post_reply(receiver, 0, with_channel ? extra_channel_result(extended) : common::Bundle());
            return true;
        }

        static common::Bundle extra_channel_result(const std::shared_ptr<interfaces::ISessionChannel>& extended) {
            common::Bundle result;
            if (extended) {
                result.put(core::protocol::kExtraChannel, common::ChannelRef(extended));
            }
            return result;
        }

        void post_reply(common::ReceiverRef receiver, int32_t code, common::Bundle data) {
            transport_->post([receiver, code, data]() { receiver->send(code, data); });
        }

        std::shared_ptr<State> state_;
        std::vector<Invocation> invocations_;
        std::map<interfaces::SessionMethod, common::Bundle> results_;
        std::map<std::string, std::pair<int32_t, common::Bundle>> command_replies_;
        std::vector<std::shared_ptr<interfaces::ISessionEventSink>> sinks_;

        NegotiationMode negotiation_mode_ = NegotiationMode::Respond;
        std::shared_ptr<interfaces::ISessionChannel> extended_;
        common::ReceiverRef held_receiver_;

        std::unique_ptr<core::LooperThread> transport_;
    };

} // namespace testing
} // namespace mediactl
