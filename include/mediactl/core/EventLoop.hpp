#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include "mediactl/interfaces/IDispatchTarget.hpp"

namespace mediactl {
namespace core {

/**
 * @brief Caller-driven FIFO task queue.
 *
 * Tasks posted from any thread run on whichever thread pumps the loop
 * (run(), run_one(), run_pending() or run_until()). The pumping thread
 * becomes the loop's thread; pump from one thread only.
 */
class EventLoop : public interfaces::IDispatchTarget {
public:
    EventLoop();
    ~EventLoop() override;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    bool post(Task task) override;
    bool is_current_thread() const override;

    /**
     * @brief Run tasks until quit() is called.
     */
    void run();

    /**
     * @brief Wait up to `timeout` for one task and run it.
     * @return true if a task ran
     */
    bool run_one(std::chrono::milliseconds timeout);

    /**
     * @brief Run everything currently queued, including tasks those tasks post.
     * @return number of tasks run
     */
    size_t run_pending();

    /**
     * @brief Pump tasks until `done()` holds or `timeout` elapses.
     * @return the final value of done()
     */
    bool run_until(const std::function<bool()>& done, std::chrono::milliseconds timeout);

    /**
     * @brief Stop run(). Tasks posted afterwards are rejected.
     */
    void quit();

    bool is_quitting() const;
    size_t pending_tasks() const;

private:
    bool pop_task_locked(Task& out);
    void bind_to_current_thread();

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<Task> tasks_;
    bool quit_ = false;

    std::atomic<std::thread::id> owner_;
};

} // namespace core
} // namespace mediactl
