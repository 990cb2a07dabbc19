#include "task_group.hpp"
#include "logger.hpp"

namespace filemover {

TaskGroup::~TaskGroup() {
    for (auto& task : tasks_) {
        if (!task.thread.joinable()) continue;
        if (task.done.valid() &&
            task.done.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            task.thread.join();
        } else {
            task.thread.detach();
        }
    }
}

bool TaskGroup::spawn(std::function<void()> fn) {
    std::packaged_task<void()> packaged(std::move(fn));
    Task task;
    task.done = packaged.get_future();
    try {
        task.thread = std::thread(std::move(packaged));
    } catch (const std::system_error& e) {
        Logger::error("[TaskGroup] " + name_ + ": failed to start thread: " + e.what());
        return false;
    }
    tasks_.push_back(std::move(task));
    return true;
}

void TaskGroup::collect(Task& task) {
    if (task.collected) return;
    if (task.thread.joinable()) {
        task.thread.join();
    }
    try {
        task.done.get();
    } catch (const std::exception& e) {
        Logger::error("[TaskGroup] " + name_ + ": task failed: " + e.what());
    }
    task.collected = true;
}

bool TaskGroup::wait_all_for(std::chrono::steady_clock::duration timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool all_done = true;
    for (auto& task : tasks_) {
        if (task.collected) continue;
        if (task.done.wait_until(deadline) == std::future_status::ready) {
            collect(task);
        } else {
            all_done = false;
        }
    }
    return all_done;
}

size_t TaskGroup::abandon() {
    size_t abandoned = 0;
    for (auto& task : tasks_) {
        if (task.collected) continue;
        if (task.done.valid() &&
            task.done.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            collect(task);
            continue;
        }
        if (task.thread.joinable()) {
            task.thread.detach();
            ++abandoned;
        }
    }
    if (abandoned > 0) {
        Logger::warn("[TaskGroup] " + name_ + ": abandoned " + std::to_string(abandoned) + " unfinished task(s)");
    }
    return abandoned;
}

size_t TaskGroup::pending() const {
    size_t count = 0;
    for (const auto& task : tasks_) {
        if (!task.collected) ++count;
    }
    return count;
}

} // namespace filemover
