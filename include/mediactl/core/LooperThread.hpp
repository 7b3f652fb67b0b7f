#pragma once

#include <memory>
#include <string>
#include <thread>
#include "mediactl/core/EventLoop.hpp"
#include "mediactl/interfaces/IDispatchTarget.hpp"

namespace mediactl {
namespace core {

/**
 * @brief Dispatch target backed by its own worker thread.
 *
 * Runs an EventLoop on a dedicated thread until stop() or destruction.
 * Tasks still queued at stop() are discarded. Must not be destroyed from
 * one of its own tasks.
 */
class LooperThread : public interfaces::IDispatchTarget {
public:
    explicit LooperThread(std::string name = "looper");
    ~LooperThread() override;

    // Non-copyable, non-movable
    LooperThread(const LooperThread&) = delete;
    LooperThread& operator=(const LooperThread&) = delete;

    bool post(Task task) override;
    bool is_current_thread() const override;

    void stop();

    const std::string& name() const { return name_; }
    std::thread::id thread_id() const { return thread_id_; }

private:
    std::string name_;
    EventLoop loop_;
    std::thread thread_;
    std::thread::id thread_id_;
};

} // namespace core
} // namespace mediactl
