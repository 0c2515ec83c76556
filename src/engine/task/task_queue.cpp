#include "task_queue.hpp"

namespace Harvest {
namespace Engine {

void TaskQueue::push(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push(std::move(task));
    }
    cv_.notify_one();
}

void TaskQueue::push_all(std::vector<Task> tasks) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& task : tasks)
            queue_.push(std::move(task));
    }
    cv_.notify_all();
}

std::optional<Task> TaskQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });

    if (closed_)
        return std::nullopt;

    Task task = queue_.top();
    queue_.pop();
    return task;
}

void TaskQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

std::vector<Task> TaskQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Task>           tasks;
    tasks.reserve(queue_.size());
    while (!queue_.empty()) {
        tasks.push_back(queue_.top());
        queue_.pop();
    }
    return tasks;
}

bool TaskQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t TaskQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool TaskQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

}  // namespace Engine
}  // namespace Harvest
