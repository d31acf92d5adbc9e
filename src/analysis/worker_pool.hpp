#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <limits>
#include <mutex>
#include <thread>
#include <vector>

namespace bench_analysis {

// Resolve a requested worker count. 0 defers to the
// BENCH_ANALYSIS_MAX_THREADS environment variable and then to 1.
std::size_t resolve_worker_count(std::size_t requested);

// Invoke `fn(index)` for every index in [0, count) on at most `max_threads`
// workers. Indices are claimed in ascending order from a shared cursor and
// callers write results into pre-sized, index-addressed storage, so output
// order never depends on scheduling. Once an invocation throws no further
// index is claimed; invocations already running finish, and the exception of
// the lowest failing index is rethrown after all workers have joined.
template <typename Fn>
void for_each_index(std::size_t count, std::size_t max_threads, Fn&& fn) {
    if (count == 0) {
        return;
    }
    const std::size_t worker_count = std::min(count, std::max<std::size_t>(1, max_threads));
    if (worker_count == 1) {
        for (std::size_t index = 0; index < count; ++index) {
            fn(index);
        }
        return;
    }

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    std::atomic<std::size_t> next_index{0};
    std::atomic<bool> stop{false};
    std::mutex failure_mutex;
    std::exception_ptr failure;
    std::size_t failure_index = std::numeric_limits<std::size_t>::max();

    for (std::size_t worker_idx = 0; worker_idx < worker_count; ++worker_idx) {
        workers.emplace_back([&]() {
            while (!stop.load(std::memory_order_acquire)) {
                const std::size_t index = next_index.fetch_add(1, std::memory_order_relaxed);
                if (index >= count) {
                    return;
                }
                try {
                    fn(index);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(failure_mutex);
                    if (index < failure_index) {
                        failure_index = index;
                        failure = std::current_exception();
                    }
                    stop.store(true, std::memory_order_release);
                    return;
                }
            }
        });
    }

    for (auto& worker : workers) {
        worker.join();
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
}

}  // namespace bench_analysis
