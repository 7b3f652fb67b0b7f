// ============================================================================
// Callback registry / negotiation test program
// ============================================================================
// Covers:
// - Registration errors (duplicate, never registered, double unregister)
// - Bookkeeping stays bounded across many register/unregister cycles
// - One callback claimed by two registries at once
// - Pending queue replay when the extended channel arrives
// - First-write-wins for the extended channel
// - Concurrent registration racing negotiation completion
// - CapabilityNegotiator request, completion, failure and dispose
//
// Run with: ./callback_registry_test
// ============================================================================

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "TestHarness.hpp"
#include "mediactl/common/ControllerError.hpp"
#include "mediactl/common/Logger.hpp"
#include "mediactl/core/CallbackRegistry.hpp"
#include "mediactl/core/CapabilityNegotiator.hpp"
#include "mediactl/core/EventLoop.hpp"
#include "mediactl/core/SessionProtocol.hpp"
#include "mediactl/testing/FakeSessionChannel.hpp"
#include "mediactl/testing/RecordingCallback.hpp"

using namespace mediactl;
using namespace std::chrono_literals;
using core::CapabilityLevel;
using core::CapabilityNegotiator;
using testing::FakeSessionChannel;
using testing::RecordingCallback;

namespace {

std::shared_ptr<common::ILogger> quiet() {
    return std::make_shared<common::NullLogger>();
}

// Tracks the bytes of every block allocated through it
std::atomic<long> g_callback_bytes{0};

template <typename T>
struct CountingAllocator {
    using value_type = T;

    CountingAllocator() = default;
    template <typename U>
    CountingAllocator(const CountingAllocator<U>&) {}

    T* allocate(size_t n) {
        g_callback_bytes += static_cast<long>(n * sizeof(T));
        return static_cast<T*>(::operator new(n * sizeof(T)));
    }

    void deallocate(T* p, size_t n) {
        g_callback_bytes -= static_cast<long>(n * sizeof(T));
        ::operator delete(p);
    }
};

template <typename T, typename U>
bool operator==(const CountingAllocator<T>&, const CountingAllocator<U>&) { return true; }
template <typename T, typename U>
bool operator!=(const CountingAllocator<T>&, const CountingAllocator<U>&) { return false; }

core::EventPolicy extended_policy() {
    core::EventPolicy policy;
    policy.level = CapabilityLevel::ExtendedChannel;
    return policy;
}

} // namespace

// ============================================================================
// Test: registration errors
// ============================================================================

void test_registration_errors() {
    std::cout << "\n=== Testing registration errors ===" << std::endl;

    auto channel = std::make_shared<FakeSessionChannel>();
    auto loop = std::make_shared<core::EventLoop>();
    core::CallbackRegistry registry(channel, core::EventPolicy(), false, quiet());

    auto cb = std::make_shared<RecordingCallback>();
    registry.register_callback(cb, loop);
    log_test("registered flag set", cb->is_registered() && registry.is_registered(cb));
    log_test("base sink attached", channel->sink_count() == 1);
    log_test("death handler installed", channel->death_handler_count() == 1);

    bool dup = throws<common::InvalidArgumentError>([&]() { registry.register_callback(cb, loop); });
    log_test("duplicate registration rejected", dup && registry.live_count() == 1);

    registry.unregister_callback(cb);
    log_test("unregister clears flag", !cb->is_registered() && !registry.is_registered(cb));
    log_test("unregister removes sink and death handler",
             channel->sink_count() == 0 && channel->death_handler_count() == 0);

    bool second = throws<std::exception>([&]() { registry.unregister_callback(cb); });
    log_test("second unregister is a no-op", !second);

    auto stranger = std::make_shared<RecordingCallback>();
    bool never = throws<common::InvalidArgumentError>([&]() { registry.unregister_callback(stranger); });
    log_test("unregister of never-registered callback rejected", never);

    registry.register_callback(cb, loop);
    log_test("re-registration after unregister allowed", cb->is_registered());
}

void test_register_then_unregister_delivers_nothing() {
    auto channel = std::make_shared<FakeSessionChannel>();
    auto loop = std::make_shared<core::EventLoop>();
    core::CallbackRegistry registry(channel, core::EventPolicy(), false, quiet());

    auto cb = std::make_shared<RecordingCallback>();
    registry.register_callback(cb, loop);
    registry.unregister_callback(cb);
    channel->emit([](interfaces::ISessionEventSink& s) { s.on_shuffle_mode_changed(true); });
    loop->run_pending();
    log_test("register+unregister: zero invocations", cb->count() == 0);
}

void test_bookkeeping_bounded() {
    std::cout << "\n=== Testing registration bookkeeping ===" << std::endl;

    auto channel = std::make_shared<FakeSessionChannel>();
    auto loop = std::make_shared<core::EventLoop>();
    core::CallbackRegistry registry(channel, core::EventPolicy(), false, quiet());

    const int kCycles = 1000;
    bool second_unregister_ok = true;
    for (int i = 0; i < kCycles; ++i) {
        auto cb = std::allocate_shared<RecordingCallback>(CountingAllocator<RecordingCallback>());
        registry.register_callback(cb, loop);
        registry.unregister_callback(cb);
        if (throws<std::exception>([&]() { registry.unregister_callback(cb); })) {
            second_unregister_ok = false;
        }
    }
    loop->run_pending();

    log_test("double unregister stays a no-op", second_unregister_ok);
    log_test("no live registrations left", registry.live_count() == 0 && channel->sink_count() == 0);
    log_test("dropped callbacks are freed while the registry lives", g_callback_bytes.load() == 0,
             std::to_string(g_callback_bytes.load()) + " bytes still held");
}

void test_claim_across_registries() {
    std::cout << "\n=== Testing one callback, two registries ===" << std::endl;

    auto channel_a = std::make_shared<FakeSessionChannel>();
    auto channel_b = std::make_shared<FakeSessionChannel>();
    auto loop = std::make_shared<core::EventLoop>();
    core::CallbackRegistry a(channel_a, core::EventPolicy(), false, quiet());
    core::CallbackRegistry b(channel_b, core::EventPolicy(), false, quiet());

    const int kRounds = 500;
    int single_winner = 0;
    for (int round = 0; round < kRounds; ++round) {
        auto cb = std::make_shared<RecordingCallback>();
        std::atomic<int> ready{0};
        std::atomic<int> won{0};

        auto contend = [&](core::CallbackRegistry& registry) {
            ready++;
            while (ready.load() < 2) std::this_thread::yield();
            if (!throws<common::InvalidArgumentError>([&]() { registry.register_callback(cb, loop); })) {
                won++;
            }
        };
        std::thread ta(contend, std::ref(a));
        std::thread tb(contend, std::ref(b));
        ta.join();
        tb.join();

        if (won.load() == 1 && a.is_registered(cb) != b.is_registered(cb)) {
            single_winner++;
        }
        if (a.is_registered(cb)) a.unregister_callback(cb);
        if (b.is_registered(cb)) b.unregister_callback(cb);
    }
    log_test("exactly one registry wins every claim", single_winner == kRounds,
             std::to_string(single_winner) + " of " + std::to_string(kRounds));

    // Hand-off: once A lets go, B may take it, and A no longer owns it
    auto cb = std::make_shared<RecordingCallback>();
    a.register_callback(cb, loop);
    bool blocked = throws<common::InvalidArgumentError>([&]() { b.register_callback(cb, loop); });
    a.unregister_callback(cb);
    b.register_callback(cb, loop);
    log_test("live callback blocked on second registry", blocked);
    log_test("callback moves to second registry after unregister", b.is_registered(cb) && cb->is_registered());

    bool stale = throws<common::InvalidArgumentError>([&]() { a.unregister_callback(cb); });
    log_test("first registry no longer owns the callback", stale);
    log_test("second registration left intact", b.is_registered(cb) && cb->is_registered());

    channel_b->emit([](interfaces::ISessionEventSink& s) { s.on_shuffle_mode_changed(true); });
    loop->run_pending();
    log_test("second registry still delivers", cb->count("shuffleModeChanged") == 1);
}

// ============================================================================
// Test: pending queue
// ============================================================================

void test_pending_replay() {
    std::cout << "\n=== Testing pending registration replay ===" << std::endl;

    auto base = std::make_shared<FakeSessionChannel>();
    auto extended = std::make_shared<FakeSessionChannel>();
    auto loop = std::make_shared<core::EventLoop>();
    core::CallbackRegistry registry(base, extended_policy(), true, quiet());

    std::vector<std::shared_ptr<RecordingCallback>> callbacks;
    for (int i = 0; i < 3; ++i) {
        callbacks.push_back(std::make_shared<RecordingCallback>());
        registry.register_callback(callbacks.back(), loop);
    }
    log_test("registrations wait for extended channel", registry.pending_count() == 3);
    log_test("no extended flag while pending", !callbacks[0]->has_extended_channel());

    // Unregistered while pending: must not be replayed
    registry.unregister_callback(callbacks[1]);
    log_test("unregister removes from pending", registry.pending_count() == 2);

    bool attached = registry.attach_extended_channel(extended);
    log_test("extended channel attached", attached && registry.has_extended_channel());
    log_test("pending queue drained", registry.pending_count() == 0);
    log_test("one extended sink per live registration", extended->sink_count() == 2,
             std::to_string(extended->sink_count()) + " sinks");
    log_test("extended flag set on replayed callbacks",
             callbacks[0]->has_extended_channel() && callbacks[2]->has_extended_channel());
    log_test("unregistered callback not replayed",
             !callbacks[1]->has_extended_channel() && !registry.has_extended_sink(callbacks[1]));

    auto late = std::make_shared<RecordingCallback>();
    registry.register_callback(late, loop);
    log_test("late registration attaches immediately",
             registry.has_extended_sink(late) && registry.pending_count() == 0 && extended->sink_count() == 3);

    auto other = std::make_shared<FakeSessionChannel>();
    bool replaced = registry.attach_extended_channel(other);
    log_test("second extended channel ignored", !replaced && registry.extended_channel() == extended);

    registry.unregister_callback(late);
    log_test("unregister removes extended sink", extended->sink_count() == 2 && !late->has_extended_channel());
}

void test_no_pending_without_negotiation() {
    auto base = std::make_shared<FakeSessionChannel>();
    auto loop = std::make_shared<core::EventLoop>();
    core::CallbackRegistry registry(base, core::EventPolicy(), false, quiet());

    auto cb = std::make_shared<RecordingCallback>();
    registry.register_callback(cb, loop);
    log_test("legacy registration is never pending", registry.pending_count() == 0);
}

void test_concurrent_replay() {
    std::cout << "\n=== Testing concurrent registration and attachment ===" << std::endl;

    auto base = std::make_shared<FakeSessionChannel>();
    auto extended = std::make_shared<FakeSessionChannel>();
    auto loop = std::make_shared<core::EventLoop>();
    core::CallbackRegistry registry(base, extended_policy(), true, quiet());

    const int kThreads = 8;
    const int kPerThread = 25;
    std::vector<std::shared_ptr<RecordingCallback>> callbacks;
    for (int i = 0; i < kThreads * kPerThread; ++i) {
        callbacks.push_back(std::make_shared<RecordingCallback>());
    }

    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            while (!go) std::this_thread::yield();
            for (int i = 0; i < kPerThread; ++i) {
                registry.register_callback(callbacks[t * kPerThread + i], loop);
            }
        });
    }
    threads.emplace_back([&]() {
        while (!go) std::this_thread::yield();
        std::this_thread::sleep_for(1ms);
        registry.attach_extended_channel(extended);
    });

    go = true;
    for (auto& th : threads) th.join();

    size_t with_sink = 0;
    for (const auto& cb : callbacks) {
        if (registry.has_extended_sink(cb) && cb->has_extended_channel()) with_sink++;
    }
    log_test("every registration attached exactly once",
             with_sink == callbacks.size() && extended->sink_count() == callbacks.size(),
             std::to_string(extended->sink_count()) + " extended sinks");
    log_test("pending queue empty after race", registry.pending_count() == 0);
}

// ============================================================================
// Test: CapabilityNegotiator
// ============================================================================

void test_negotiator_completion() {
    std::cout << "\n=== Testing CapabilityNegotiator ===" << std::endl;

    auto base = std::make_shared<FakeSessionChannel>();
    auto extended = std::make_shared<FakeSessionChannel>();
    base->set_negotiation(FakeSessionChannel::NegotiationMode::Respond, extended);

    CapabilityNegotiator negotiator(quiet());
    std::atomic<bool> acquired{false};
    std::shared_ptr<interfaces::ISessionChannel> got;
    std::mutex got_mutex;

    bool sent = negotiator.start(*base, [&](std::shared_ptr<interfaces::ISessionChannel> channel) {
        std::lock_guard<std::mutex> lock(got_mutex);
        got = std::move(channel);
        acquired = true;
    });
    base->flush();

    log_test("negotiation request sent once", sent
             && base->count_commands(core::protocol::kCommandGetExtraChannel) == 1);
    log_test("request carries a receiver",
             base->last(interfaces::SessionMethod::SendCommand).has_value()
             && base->last(interfaces::SessionMethod::SendCommand)->args.contains(core::protocol::kArgReceiver));
    {
        std::lock_guard<std::mutex> lock(got_mutex);
        log_test("extended channel handed over", acquired && got == extended);
    }
    log_test("state is Completed", negotiator.state() == CapabilityNegotiator::State::Completed);

    negotiator.start(*base, [](std::shared_ptr<interfaces::ISessionChannel>) {});
    log_test("start only sends once", base->count_commands(core::protocol::kCommandGetExtraChannel) == 1);
}

void test_negotiator_empty_result() {
    auto base = std::make_shared<FakeSessionChannel>();
    base->set_negotiation(FakeSessionChannel::NegotiationMode::Hold, nullptr);

    CapabilityNegotiator negotiator(quiet());
    std::atomic<bool> acquired{false};
    negotiator.start(*base, [&](std::shared_ptr<interfaces::ISessionChannel>) { acquired = true; });
    log_test("held negotiation pending", base->has_held_negotiation()
             && negotiator.state() == CapabilityNegotiator::State::Pending);

    base->complete_negotiation_without_channel();
    base->flush();
    log_test("empty result leaves base mode", !acquired && negotiator.state() == CapabilityNegotiator::State::Failed);
}

void test_negotiator_dispose() {
    auto base = std::make_shared<FakeSessionChannel>();
    auto extended = std::make_shared<FakeSessionChannel>();
    base->set_negotiation(FakeSessionChannel::NegotiationMode::Hold, extended);

    std::atomic<bool> acquired{false};
    {
        CapabilityNegotiator negotiator(quiet());
        negotiator.start(*base, [&](std::shared_ptr<interfaces::ISessionChannel>) { acquired = true; });
        negotiator.dispose();
        log_test("dispose sets Disposed", negotiator.state() == CapabilityNegotiator::State::Disposed);
    }

    // Late reply after the owner is gone
    base->complete_negotiation();
    base->flush();
    log_test("late result after dispose ignored", !acquired);
}

void test_negotiator_dead_remote() {
    auto base = std::make_shared<FakeSessionChannel>();
    base->kill();

    CapabilityNegotiator negotiator(quiet());
    bool sent = negotiator.start(*base, [](std::shared_ptr<interfaces::ISessionChannel>) {});
    log_test("dead remote: request fails without throwing",
             !sent && negotiator.state() == CapabilityNegotiator::State::Failed);
}

int main() {
    std::cout << "mediactl Callback Registry Test Suite" << std::endl;
    std::cout << "=====================================" << std::endl;

    run_case("registration errors", test_registration_errors);
    run_case("register then unregister", test_register_then_unregister_delivers_nothing);
    run_case("bookkeeping bounded", test_bookkeeping_bounded);
    run_case("claim across registries", test_claim_across_registries);
    run_case("pending replay", test_pending_replay);
    run_case("no pending without negotiation", test_no_pending_without_negotiation);
    run_case("concurrent replay", test_concurrent_replay);
    run_case("negotiator completion", test_negotiator_completion);
    run_case("negotiator empty result", test_negotiator_empty_result);
    run_case("negotiator dispose", test_negotiator_dispose);
    run_case("negotiator dead remote", test_negotiator_dead_remote);

    return print_summary();
}
