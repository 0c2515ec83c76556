#pragma once
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

#include "task.hpp"

namespace Harvest {
namespace Engine {

// Priority-ordered hand-off from the Master to the workers. Higher priority
// pops first; equal priorities pop in ascending id order.
class TaskQueue {
public:
    void push(Task task);

    // Admits a batch under one lock so workers see it in priority order.
    void push_all(std::vector<Task> tasks);

    // Blocks until a task is available or the queue is closed. Returns nullopt
    // once closed, even if tasks remain (those are collected with drain()).
    std::optional<Task> pop();

    void              close();
    std::vector<Task> drain();

    bool   closed() const;
    size_t size() const;
    bool   empty() const;

private:
    struct Order {
        bool operator()(const Task& a, const Task& b) const {
            if (a.priority != b.priority)
                return a.priority < b.priority;
            return a.id > b.id;
        }
    };

    std::priority_queue<Task, std::vector<Task>, Order> queue_;
    mutable std::mutex                                  mutex_;
    std::condition_variable                             cv_;
    bool                                                closed_ = false;
};

}  // namespace Engine
}  // namespace Harvest
