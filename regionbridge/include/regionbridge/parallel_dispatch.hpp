#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <mutex>
#include <optional>
#include <span>
#include <thread>
#include <type_traits>
#include <vector>
#include "types/result.hpp"

namespace regionbridge {

enum class ExecutionMode : uint8_t {
    Sequential,
    Concurrent
};

/// @brief Choose how a bulk conversion runs
/// @param collection_size Number of elements to convert
/// @param threshold Minimum size for the concurrent path
/// @return Concurrent when collection_size >= threshold
[[nodiscard]] constexpr ExecutionMode select_execution(
    std::size_t collection_size,
    std::size_t threshold) noexcept {
    return collection_size >= threshold ? ExecutionMode::Concurrent : ExecutionMode::Sequential;
}

namespace detail {
    template <typename R>
    struct result_value;

    template <typename U>
    struct result_value<Result<U>> {
        using type = U;
    };

    template <typename R>
    using result_value_t = typename result_value<std::remove_cvref_t<R>>::type;
} // namespace detail

/// @brief Element-wise conversion over a persistent worker pool
///
/// Design:
/// - Scatter: the input index range is cut into contiguous blocks, one per
///   worker plus one run on the calling thread.
/// - Gather: every block writes into result slots addressed by input index,
///   so the n-th output always corresponds to the n-th input.
/// - Errors: the error of the lowest failing input index is returned, which is
///   the error the sequential path would have returned.
///
/// @note map() is thread-safe and may be called concurrently; worker threads
///       are shared across calls
/// @note The conversion function must be safe to call from several threads at
///       once and must not throw (std::bad_alloc is reported as MemoryError)
class ParallelDispatcher {
public:
    struct Config {
        std::size_t worker_threads = 0; // 0 = auto-detect
    };

    explicit ParallelDispatcher(Config config);
    ~ParallelDispatcher();

    ParallelDispatcher(const ParallelDispatcher&) = delete;
    ParallelDispatcher& operator=(const ParallelDispatcher&) = delete;

    /// @brief Number of pool threads (the calling thread is not counted)
    [[nodiscard]] std::size_t worker_count() const noexcept {
        return config_.worker_threads;
    }

    /// @brief Convert every element, choosing the path with select_execution()
    /// @tparam T Input element type
    /// @tparam F Callable const T& -> Result<U>
    /// @param items Input elements
    /// @param threshold Minimum size for the concurrent path
    /// @param func Conversion function
    /// @return Result<std::vector<U>> in input order
    template <typename T, typename F>
    [[nodiscard]] auto map(std::span<const T> items, std::size_t threshold, F&& func)
        -> Result<std::vector<detail::result_value_t<std::invoke_result_t<F&, const T&>>>>;

    /// @brief Convert every element on an explicitly chosen path
    template <typename T, typename F>
    [[nodiscard]] auto map(std::span<const T> items, ExecutionMode mode, F&& func)
        -> Result<std::vector<detail::result_value_t<std::invoke_result_t<F&, const T&>>>>;

private:
    using WorkerTask = std::function<void()>;

    /// @brief Per-call state shared between the calling thread and workers
    struct JobState {
        std::mutex mutex;                   // Protects tasks_remaining and first_error
        std::condition_variable cv;         // Signals the calling thread
        std::size_t tasks_remaining{0};
        std::atomic<std::size_t> first_error_index{std::numeric_limits<std::size_t>::max()};
        std::optional<Error> first_error;

        void record_error(std::size_t index, Error error);
    };

    template <typename T, typename U, typename F>
    static void process_block(
        std::span<const T> items,
        std::vector<std::optional<U>>& slots,
        F& func,
        std::size_t begin,
        std::size_t end,
        JobState& state) noexcept;

    void worker_loop();

    Config config_;

    std::vector<std::thread> threads_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<WorkerTask> pending_tasks_;
    bool stop_threads_ = false;
};

/// @brief Process-wide dispatcher used by the geometry codec bulk stages
[[nodiscard]] ParallelDispatcher& default_dispatcher();

} // namespace regionbridge

#define REGIONBRIDGE_PARALLEL_DISPATCH_HEADER
#include "impl/parallel_dispatch_impl.hpp"
