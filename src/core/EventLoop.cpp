#include "mediactl/core/EventLoop.hpp"
#include <algorithm>

namespace mediactl {
namespace core {

// ============================================================================
// Construction
// ============================================================================

EventLoop::EventLoop() : owner_(std::this_thread::get_id()) {}

EventLoop::~EventLoop() {
    quit();
}

// ============================================================================
// IDispatchTarget
// ============================================================================

bool EventLoop::post(Task task) {
    if (!task) return false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (quit_) return false;
        tasks_.push_back(std::move(task));
    }
    condition_.notify_one();
    return true;
}

bool EventLoop::is_current_thread() const {
    return owner_.load(std::memory_order_acquire) == std::this_thread::get_id();
}

// ============================================================================
// Pumping
// ============================================================================

void EventLoop::bind_to_current_thread() {
    owner_.store(std::this_thread::get_id(), std::memory_order_release);
}

// Caller holds mutex_
bool EventLoop::pop_task_locked(Task& out) {
    if (tasks_.empty()) return false;
    out = std::move(tasks_.front());
    tasks_.pop_front();
    return true;
}

void EventLoop::run() {
    bind_to_current_thread();
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this]() {
                return quit_ || !tasks_.empty();
            });

            if (quit_) {
                return;
            }
            pop_task_locked(task);
        }

        // Execute task outside the lock
        task();
    }
}

bool EventLoop::run_one(std::chrono::milliseconds timeout) {
    bind_to_current_thread();
    Task task;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait_for(lock, timeout, [this]() {
            return quit_ || !tasks_.empty();
        });
        if (quit_ || !pop_task_locked(task)) {
            return false;
        }
    }
    task();
    return true;
}

size_t EventLoop::run_pending() {
    bind_to_current_thread();
    size_t ran = 0;
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (quit_ || !pop_task_locked(task)) {
                return ran;
            }
        }
        task();
        ++ran;
    }
}

bool EventLoop::run_until(const std::function<bool()>& done, std::chrono::milliseconds timeout) {
    bind_to_current_thread();
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (!done()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return done();
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        // Poll in short slices so a predicate that changes without a task still ends the wait
        run_one(std::min(remaining, std::chrono::milliseconds(10)));
    }
    return true;
}

void EventLoop::quit() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        quit_ = true;
        tasks_.clear();
    }
    condition_.notify_all();
}

bool EventLoop::is_quitting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return quit_;
}

size_t EventLoop::pending_tasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

} // namespace core
} // namespace mediactl
