#include "viewmark/task_queue.hpp"

#include <utility>

namespace viewmark {

void TaskQueue::post(Task task) {
    if (task) {
        tasks_.push_back(std::move(task));
    }
}

std::size_t TaskQueue::run_pending() {
    std::deque<Task> turn;
    turn.swap(tasks_);

    std::size_t ran = 0;
    while (!turn.empty()) {
        Task task = std::move(turn.front());
        turn.pop_front();
        task();
        ++ran;
    }
    return ran;
}

} // namespace viewmark
