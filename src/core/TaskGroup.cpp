/**
 * TaskGroup.cpp - Spawning, reaping and joining worker threads
 */

#include "emv/core/TaskGroup.hpp"

#include <exception>
#include <iostream>

namespace emv::core {

TaskGroup::~TaskGroup() {
    joinAll();
}

TaskHandle TaskGroup::spawn(const std::string& name, TaskBody body) {
    reap();

    auto state = std::make_shared<TaskHandle::State>();
    state->name = name;
    TaskHandle handle(state);

    std::thread thread([handle, body = std::move(body)]() {
        try {
            body(handle);
        } catch (const std::exception& e) {
            std::cerr << "[TaskGroup] Task '" << handle.state_->name
                      << "' failed: " << e.what() << std::endl;
        }
        handle.state_->finished = true;
    });

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back({std::move(thread), handle});
    return handle;
}

void TaskGroup::cancelAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : entries_) {
        entry.handle.cancel();
    }
}

size_t TaskGroup::reap() {
    std::list<Entry> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->handle.finished()) {
                done.splice(done.end(), entries_, it++);
            } else {
                ++it;
            }
        }
    }

    for (auto& entry : done) {
        if (entry.thread.joinable()) entry.thread.join();
    }
    return done.size();
}

void TaskGroup::joinAll() {
    std::list<Entry> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : entries_) entry.handle.cancel();
        all.swap(entries_);
    }

    for (auto& entry : all) {
        if (entry.thread.joinable()) {
            if (entry.thread.get_id() == std::this_thread::get_id()) {
                entry.thread.detach();
            } else {
                entry.thread.join();
            }
        }
    }
}

size_t TaskGroup::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& entry : entries_) {
        if (!entry.handle.finished()) n++;
    }
    return n;
}

} // namespace emv::core
