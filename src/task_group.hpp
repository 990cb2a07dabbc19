#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <string>
#include <thread>
#include <vector>

namespace filemover {

/**
 * Set of threads started together and awaited together.
 *
 * An exception thrown by a task is logged when the task is collected and
 * does not affect the other tasks. Tasks still running when the group is
 * abandoned or destroyed are detached; they must own (via shared_ptr)
 * everything they touch.
 */
class TaskGroup {
public:
    explicit TaskGroup(std::string name = "tasks") : name_(std::move(name)) {}
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    // Returns false if the thread could not be created
    bool spawn(std::function<void()> fn);

    // True once every task has finished; finished tasks are joined
    bool wait_all_for(std::chrono::steady_clock::duration timeout);

    // Detaches unfinished tasks and returns how many there were
    size_t abandon();

    size_t pending() const;

private:
    struct Task {
        std::thread thread;
        std::future<void> done;
        bool collected = false;
    };

    void collect(Task& task);

    std::string name_;
    std::vector<Task> tasks_;
};

} // namespace filemover
