#pragma once
#include <functional>

namespace mediactl {
namespace interfaces {

// ============================================================================
// IDispatchTarget - Single-threaded execution context chosen by the caller
// ============================================================================
// Tasks posted to one target run one at a time, in the order they were
// posted, on the target's thread. post() may be called from any thread.
// ============================================================================

class IDispatchTarget {
public:
    using Task = std::function<void()>;

    virtual ~IDispatchTarget() = default;

    // Returns false if the target has been shut down and the task was dropped
    virtual bool post(Task task) = 0;

    // True when called from the thread that runs this target's tasks
    virtual bool is_current_thread() const = 0;
};

} // namespace interfaces
} // namespace mediactl
