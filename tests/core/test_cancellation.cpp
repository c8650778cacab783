/**
 * test_cancellation.cpp - Generation epochs and task cancellation
 */

#include "emv/core/CancellationController.hpp"
#include "emv/core/TaskGroup.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <set>
#include <thread>
#include <vector>

using namespace emv::core;

void test_epoch_is_monotonic() {
    CancellationController ctl;
    assert(ctl.current() == 0);
    assert(ctl.cancel() == 1);
    assert(ctl.cancel() == 2);
    assert(ctl.isCurrent(2));
    assert(!ctl.isCurrent(1));

    std::cout << "[PASS] test_epoch_is_monotonic" << std::endl;
}

void test_concurrent_cancels_are_distinct() {
    CancellationController ctl;
    std::mutex seen_mutex;
    std::set<uint64_t> seen;

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 100; ++i) {
                uint64_t g = ctl.cancel();
                std::lock_guard<std::mutex> lock(seen_mutex);
                assert(seen.insert(g).second);
            }
        });
    }
    for (auto& t : threads) t.join();

    assert(seen.size() == 800);
    assert(ctl.current() == 800);

    std::cout << "[PASS] test_concurrent_cancels_are_distinct" << std::endl;
}

void test_emit_if_current() {
    CancellationController ctl;
    const uint64_t g = ctl.current();

    int emitted = 0;
    assert(ctl.emitIfCurrent(g, [&]() { emitted++; }));
    ctl.cancel();
    assert(!ctl.emitIfCurrent(g, [&]() { emitted++; }));
    assert(emitted == 1);

    std::cout << "[PASS] test_emit_if_current" << std::endl;
}

void test_cancel_hook_sees_new_epoch() {
    CancellationController ctl;
    uint64_t hook_value = 0;
    uint64_t result = ctl.cancel([&](uint64_t next) {
        hook_value = next;
        // Already current inside the hook
        assert(ctl.isCurrent(next));
    });
    assert(result == 1);
    assert(hook_value == 1);

    std::cout << "[PASS] test_cancel_hook_sees_new_epoch" << std::endl;
}

void test_no_emission_after_cancel() {
    CancellationController ctl;
    std::atomic<bool> stop{false};
    std::atomic<uint64_t> stale_after_cancel{0};
    std::atomic<uint64_t> cancelled_at{0};

    const uint64_t g = ctl.current();
    std::thread emitter([&]() {
        while (!stop) {
            ctl.emitIfCurrent(g, [&]() {
                if (cancelled_at.load() != 0) stale_after_cancel++;
            });
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    ctl.cancel([&](uint64_t next) { cancelled_at = next; });
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    stop = true;
    emitter.join();

    assert(stale_after_cancel == 0);
    std::cout << "[PASS] test_no_emission_after_cancel" << std::endl;
}

void test_task_group_cancel_and_join() {
    TaskGroup group;
    std::atomic<int> observed_cancel{0};

    for (int i = 0; i < 3; ++i) {
        group.spawn("worker", [&](const TaskHandle& self) {
            while (!self.cancelled()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            observed_cancel++;
        });
    }
    assert(group.running() == 3);

    group.cancelAll();
    group.joinAll();
    assert(observed_cancel == 3);
    assert(group.running() == 0);

    std::cout << "[PASS] test_task_group_cancel_and_join" << std::endl;
}

void test_task_handle_state() {
    TaskGroup group;
    TaskHandle empty;
    assert(!empty.valid());
    assert(empty.finished());
    assert(!empty.cancelled());

    TaskHandle handle = group.spawn("quick", [](const TaskHandle&) {});
    while (!handle.finished()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    assert(handle.valid());
    assert(!handle.cancelled());
    assert(group.reap() == 1);

    // Exceptions are contained in the task
    TaskHandle failing = group.spawn("failing", [](const TaskHandle&) {
        throw std::runtime_error("boom");
    });
    group.joinAll();
    assert(failing.finished());

    std::cout << "[PASS] test_task_handle_state" << std::endl;
}

int main() {
    std::cout << "=== EMV Cancellation Tests ===" << std::endl;

    test_epoch_is_monotonic();
    test_concurrent_cancels_are_distinct();
    test_emit_if_current();
    test_cancel_hook_sees_new_epoch();
    test_no_emission_after_cancel();
    test_task_group_cancel_and_join();
    test_task_handle_state();

    std::cout << "\nAll cancellation tests passed!" << std::endl;
    return 0;
}
