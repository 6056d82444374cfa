// Do not include this file directly. Include "parallel_dispatch.hpp" instead.

#pragma once

#include <algorithm>
#include <memory>
#include <new>
#include <utility>

#ifndef REGIONBRIDGE_PARALLEL_DISPATCH_HEADER
#include "../parallel_dispatch.hpp" // for linters
#endif

namespace regionbridge {

namespace detail {
    /// True on pool threads; nested map() calls there run sequentially
    inline bool& on_worker_thread() noexcept {
        thread_local bool flag = false;
        return flag;
    }
} // namespace detail

// ============================================================================
// ParallelDispatcher
// ============================================================================
//
// Invariants
// ----------
// - Worker threads are persistent and shared by all map() calls
// - A job's tasks_remaining reaches 0 only after every block has returned
// - Slots are only read by the calling thread after tasks_remaining == 0
// - A block stops early only past an index that already failed, so the lowest
//   failing index is always evaluated
// - map() called from a pool thread never waits on the pool
//
// ============================================================================

inline ParallelDispatcher::ParallelDispatcher(Config config = {})
    : config_(config) {
    if (config_.worker_threads == 0) {
        config_.worker_threads = std::thread::hardware_concurrency();
        if (config_.worker_threads == 0) config_.worker_threads = 1;
    }

    for (std::size_t i = 0; i < config_.worker_threads; ++i) {
        threads_.emplace_back(&ParallelDispatcher::worker_loop, this);
    }
}

inline ParallelDispatcher::~ParallelDispatcher() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_threads_ = true;
    }
    queue_cv_.notify_all();

    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

inline void ParallelDispatcher::worker_loop() {
    detail::on_worker_thread() = true;

    while (true) {
        WorkerTask task;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return stop_threads_ || !pending_tasks_.empty();
            });

            if (stop_threads_ && pending_tasks_.empty()) return;

            task = std::move(pending_tasks_.front());
            pending_tasks_.pop_front();
        }

        if (task) {
            task();
        }
    }
}

inline void ParallelDispatcher::JobState::record_error(std::size_t index, Error error) {
    std::lock_guard lock(mutex);
    if (index < first_error_index.load(std::memory_order_relaxed)) {
        first_error_index.store(index, std::memory_order_release);
        first_error = std::move(error);
    }
}

template <typename T, typename U, typename F>
inline void ParallelDispatcher::process_block(
    std::span<const T> items,
    std::vector<std::optional<U>>& slots,
    F& func,
    std::size_t begin,
    std::size_t end,
    JobState& state) noexcept {

    struct TaskGuard {
        JobState& state;
        ~TaskGuard() {
            std::lock_guard lock(state.mutex);
            state.tasks_remaining--;
            state.cv.notify_one();
        }
    };
    TaskGuard guard{state};

    for (std::size_t i = begin; i < end; ++i) {
        if (i > state.first_error_index.load(std::memory_order_acquire)) [[unlikely]] {
            return;
        }
        try {
            auto converted = func(items[i]);
            if (!converted) [[unlikely]] {
                state.record_error(i, converted.error());
                return;
            }
            slots[i].emplace(std::move(converted).value());
        } catch (const std::bad_alloc&) {
            state.record_error(i, Err(Error::Code::MemoryError, "Out of memory in parallel conversion"));
            return;
        }
    }
}

template <typename T, typename F>
inline auto ParallelDispatcher::map(std::span<const T> items, std::size_t threshold, F&& func)
    -> Result<std::vector<detail::result_value_t<std::invoke_result_t<F&, const T&>>>> {
    return map(items, select_execution(items.size(), threshold), std::forward<F>(func));
}

template <typename T, typename F>
inline auto ParallelDispatcher::map(std::span<const T> items, ExecutionMode mode, F&& func)
    -> Result<std::vector<detail::result_value_t<std::invoke_result_t<F&, const T&>>>> {

    using U = detail::result_value_t<std::invoke_result_t<F&, const T&>>;

    std::vector<U> output;
    output.reserve(items.size());

    if (mode == ExecutionMode::Sequential || items.size() <= 1 || detail::on_worker_thread()) {
        for (const auto& item : items) {
            auto converted = func(item);
            if (!converted) {
                return converted.error();
            }
            output.push_back(std::move(converted).value());
        }
        return Ok(std::move(output));
    }

    // Scatter
    std::vector<std::optional<U>> slots(items.size());

    const std::size_t num_real_workers = config_.worker_threads + 1; // Including calling thread
    const std::size_t items_per_task = (items.size() + num_real_workers - 1) / num_real_workers;
    const std::size_t total_tasks = (items.size() + items_per_task - 1) / items_per_task;

    auto job_state = std::make_shared<JobState>();
    job_state->tasks_remaining = total_tasks;

    if (total_tasks > 1) {
        {
            std::lock_guard lock(queue_mutex_);
            for (std::size_t task_idx = 1; task_idx < total_tasks; ++task_idx) {
                const std::size_t begin = task_idx * items_per_task;
                const std::size_t end = std::min(begin + items_per_task, items.size());
                // slots and func are captured by reference: we wait below
                pending_tasks_.push_back([items, &slots, &func, begin, end, job_state]() {
                    ParallelDispatcher::process_block<T, U>(items, slots, func, begin, end, *job_state);
                });
            }
        }
        queue_cv_.notify_all();
    }

    ParallelDispatcher::process_block<T, U>(
        items, slots, func, 0, std::min(items_per_task, items.size()), *job_state);

    // Gather
    {
        std::unique_lock lock(job_state->mutex);
        job_state->cv.wait(lock, [&] {
            return job_state->tasks_remaining == 0;
        });

        if (job_state->first_error) {
            return *job_state->first_error;
        }
    }

    for (auto& slot : slots) {
        output.push_back(std::move(*slot));
    }
    return Ok(std::move(output));
}

inline ParallelDispatcher& default_dispatcher() {
    static ParallelDispatcher dispatcher;
    return dispatcher;
}

} // namespace regionbridge
