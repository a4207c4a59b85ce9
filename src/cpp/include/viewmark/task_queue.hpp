#pragma once

#include <cstddef>
#include <deque>
#include <functional>

namespace viewmark {

/// Cooperative single-threaded task queue.
///
/// The host drives it once per frame with run_pending(). Tasks posted
/// while a turn is running wait for the next turn, so a task can never
/// observe a half-finished mutation from the code that posted it.
class TaskQueue {
public:
    using Task = std::function<void()>;

    /// Queue a task for the next turn.
    void post(Task task);

    /// Run every task that was queued before this call. Returns the
    /// number of tasks run.
    std::size_t run_pending();

    /// Number of tasks waiting for the next turn.
    std::size_t pending() const { return tasks_.size(); }

    bool empty() const { return tasks_.empty(); }

private:
    std::deque<Task> tasks_;
};

} // namespace viewmark
