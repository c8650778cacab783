/**
 * TaskGroup.hpp - Worker threads with cooperative cancellation
 */

#pragma once

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace emv::core {

class TaskHandle {
public:
    TaskHandle() = default;

    void cancel() const {
        if (state_) state_->cancelled = true;
    }
    bool cancelled() const { return state_ && state_->cancelled.load(); }
    bool finished() const { return !state_ || state_->finished.load(); }
    bool valid() const { return state_ != nullptr; }
    void reset() { state_.reset(); }

private:
    friend class TaskGroup;

    struct State {
        std::string name;
        std::atomic<bool> cancelled{false};
        std::atomic<bool> finished{false};
    };

    explicit TaskHandle(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

using TaskBody = std::function<void(const TaskHandle&)>;

/**
 * Owns the threads it spawns. Finished threads are joined lazily on the
 * next spawn() / reap(); the destructor cancels and joins everything.
 */
class TaskGroup {
public:
    TaskGroup() = default;
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    TaskHandle spawn(const std::string& name, TaskBody body);

    void cancelAll();

    /// Join threads whose body has returned. Returns how many were joined.
    size_t reap();

    /// Cancel and join every thread.
    void joinAll();

    size_t running() const;

private:
    struct Entry {
        std::thread thread;
        TaskHandle handle;
    };

    mutable std::mutex mutex_;
    std::list<Entry> entries_;
};

} // namespace emv::core
