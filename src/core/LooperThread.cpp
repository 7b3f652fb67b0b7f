#include "mediactl/core/LooperThread.hpp"
#include <future>

namespace mediactl {
namespace core {

LooperThread::LooperThread(std::string name) : name_(std::move(name)) {
    std::promise<std::thread::id> started;
    auto started_future = started.get_future();

    thread_ = std::thread([this, &started]() {
        started.set_value(std::this_thread::get_id());
        loop_.run();
    });

    // is_current_thread() must be correct before the first post
    thread_id_ = started_future.get();
}

LooperThread::~LooperThread() {
    stop();
}

bool LooperThread::post(Task task) {
    return loop_.post(std::move(task));
}

bool LooperThread::is_current_thread() const {
    return std::this_thread::get_id() == thread_id_;
}

void LooperThread::stop() {
    loop_.quit();
    // From one of our own tasks the loop exits once that task returns;
    // the join happens in the destructor
    if (thread_.joinable() && std::this_thread::get_id() != thread_id_) {
        thread_.join();
    }
}

} // namespace core
} // namespace mediactl
