#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <numeric>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "../regionbridge/include/regionbridge/parallel_dispatch.hpp"

using namespace regionbridge;

// ============================================================================
// select_execution
// ============================================================================

TEST(SelectExecution, ThresholdIsInclusive) {
    EXPECT_EQ(select_execution(9, 10), ExecutionMode::Sequential);
    EXPECT_EQ(select_execution(10, 10), ExecutionMode::Concurrent);
    EXPECT_EQ(select_execution(11, 10), ExecutionMode::Concurrent);
    EXPECT_EQ(select_execution(0, 4), ExecutionMode::Sequential);
    EXPECT_EQ(select_execution(0, 0), ExecutionMode::Concurrent);
}

// ============================================================================
// ParallelDispatcher::map
// ============================================================================

namespace {

std::vector<int> make_input(int n) {
    std::vector<int> input(static_cast<std::size_t>(n));
    std::iota(input.begin(), input.end(), 0);
    return input;
}

/// Conversion with uneven, shuffled latencies so workers finish out of order
auto jittered_square() {
    return [](const int& value) -> Result<long> {
        thread_local std::mt19937 rng(std::random_device{}());
        std::uniform_int_distribution<int> dist(0, 50);
        std::this_thread::sleep_for(std::chrono::microseconds(dist(rng)));
        return Ok(static_cast<long>(value) * value);
    };
}

} // namespace

TEST(ParallelDispatcher, WorkerCountDefaultsToHardware) {
    ParallelDispatcher dispatcher;
    EXPECT_GE(dispatcher.worker_count(), 1u);

    ParallelDispatcher two({.worker_threads = 2});
    EXPECT_EQ(two.worker_count(), 2u);
}

TEST(ParallelDispatcher, SequentialAndConcurrentAgree) {
    ParallelDispatcher dispatcher({.worker_threads = 4});
    for (int n : {0, 1, 2, 5, 17, 250, 1000}) {
        auto input = make_input(n);
        std::span<const int> items(input);

        auto sequential = dispatcher.map(items, ExecutionMode::Sequential, jittered_square());
        auto concurrent = dispatcher.map(items, ExecutionMode::Concurrent, jittered_square());
        ASSERT_TRUE(sequential.is_ok());
        ASSERT_TRUE(concurrent.is_ok());
        ASSERT_EQ(concurrent.value().size(), input.size());
        EXPECT_EQ(sequential.value(), concurrent.value()) << "n=" << n;

        for (std::size_t i = 0; i < input.size(); ++i) {
            EXPECT_EQ(concurrent.value()[i], static_cast<long>(i) * static_cast<long>(i));
        }
    }
}

TEST(ParallelDispatcher, ThresholdSelectsPath) {
    ParallelDispatcher dispatcher({.worker_threads = 3});
    auto input = make_input(64);

    std::set<std::thread::id> below_threads;
    std::mutex mutex;
    auto record = [&](std::set<std::thread::id>& ids) {
        return [&](const int& value) -> Result<int> {
            std::lock_guard lock(mutex);
            ids.insert(std::this_thread::get_id());
            return Ok(value);
        };
    };

    auto below = dispatcher.map(std::span<const int>(input), 1000, record(below_threads));
    ASSERT_TRUE(below.is_ok());
    ASSERT_EQ(below_threads.size(), 1u);
    EXPECT_EQ(*below_threads.begin(), std::this_thread::get_id());
    EXPECT_EQ(below.value(), input);
}

TEST(ParallelDispatcher, UsesSeveralThreadsWhenConcurrent) {
    ParallelDispatcher dispatcher({.worker_threads = 3});
    auto input = make_input(400);

    std::set<std::thread::id> ids;
    std::mutex mutex;
    auto result = dispatcher.map(std::span<const int>(input), ExecutionMode::Concurrent,
        [&](const int& value) -> Result<int> {
            std::this_thread::sleep_for(std::chrono::microseconds(100));
            std::lock_guard lock(mutex);
            ids.insert(std::this_thread::get_id());
            return Ok(value);
        });
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), input);
    EXPECT_GT(ids.size(), 1u);
}

TEST(ParallelDispatcher, ReturnsLowestIndexError) {
    ParallelDispatcher dispatcher({.worker_threads = 4});
    auto input = make_input(500);

    auto fail_on = [](const int& value) -> Result<int> {
        if (value == 123 || value == 321 || value == 480) {
            return Err(Error::Code::DecodeError, "bad element " + std::to_string(value));
        }
        return Ok(value);
    };

    for (auto mode : {ExecutionMode::Sequential, ExecutionMode::Concurrent}) {
        auto result = dispatcher.map(std::span<const int>(input), mode, fail_on);
        ASSERT_TRUE(result.is_error());
        EXPECT_EQ(result.error().code, Error::Code::DecodeError);
        EXPECT_EQ(result.error().message, "bad element 123");
    }
}

TEST(ParallelDispatcher, NestedMapDoesNotDeadlock) {
    ParallelDispatcher dispatcher({.worker_threads = 2});
    auto outer = make_input(16);
    auto inner = make_input(32);

    auto result = dispatcher.map(std::span<const int>(outer), ExecutionMode::Concurrent,
        [&](const int& value) -> Result<int> {
            auto nested = dispatcher.map(std::span<const int>(inner), ExecutionMode::Concurrent,
                [value](const int& x) -> Result<int> { return Ok(x + value); });
            if (!nested) return nested.error();
            return Ok(std::accumulate(nested.value().begin(), nested.value().end(), 0));
        });

    ASSERT_TRUE(result.is_ok());
    const int inner_sum = 31 * 32 / 2;
    for (std::size_t i = 0; i < outer.size(); ++i) {
        EXPECT_EQ(result.value()[i], inner_sum + 32 * static_cast<int>(i));
    }
}

TEST(ParallelDispatcher, ConcurrentCallersShareThePool) {
    ParallelDispatcher dispatcher({.worker_threads = 2});
    auto input = make_input(300);
    std::atomic<int> failures{0};

    std::vector<std::thread> callers;
    for (int c = 0; c < 4; ++c) {
        callers.emplace_back([&] {
            for (int round = 0; round < 5; ++round) {
                auto result = dispatcher.map(std::span<const int>(input), ExecutionMode::Concurrent, jittered_square());
                if (!result || result.value().size() != input.size() || result.value()[299] != 299L * 299L) {
                    ++failures;
                }
            }
        });
    }
    for (auto& t : callers) t.join();
    EXPECT_EQ(failures.load(), 0);
}

TEST(ParallelDispatcher, DefaultDispatcherIsShared) {
    EXPECT_EQ(&default_dispatcher(), &default_dispatcher());
}
