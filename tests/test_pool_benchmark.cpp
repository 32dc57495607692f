// CPU Benchmark - Pool orchestrator tests

#include <gtest/gtest.h>

#include "pool_benchmark.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace std::chrono;

namespace {

// Work unit that only increments a shared counter
WorkUnitFactory counter_factory(std::shared_ptr<std::atomic<uint64_t>> counter) {
    return [counter](unsigned) -> WorkUnit {
        return [counter]() { counter->fetch_add(1, std::memory_order_relaxed); };
    };
}

// Records when each worker executed its first Step
struct FirstStepRecorder {
    std::mutex mutex;
    std::vector<steady_clock::time_point> first_steps;
    std::vector<steady_clock::time_point> inits;

    WorkUnitFactory factory() {
        return [this](unsigned) -> WorkUnit {
            {
                std::lock_guard<std::mutex> lock(mutex);
                inits.push_back(steady_clock::now());
            }
            auto seen = std::make_shared<bool>(false);
            return [this, seen]() {
                if (!*seen) {
                    *seen = true;
                    std::lock_guard<std::mutex> lock(mutex);
                    first_steps.push_back(steady_clock::now());
                }
            };
        };
    }
};

} // namespace

TEST(PoolBenchmarkTest, RejectsZeroWorkers) {
    auto counter = std::make_shared<std::atomic<uint64_t>>(0);
    EXPECT_THROW(PoolBenchmark(0, seconds(1), counter_factory(counter)), std::invalid_argument);
}

TEST(PoolBenchmarkTest, RejectsEmptyFactory) {
    EXPECT_THROW(PoolBenchmark(2, seconds(1), WorkUnitFactory()), std::invalid_argument);
}

TEST(PoolBenchmarkTest, BatchSizeScalesWithWorkers) {
    auto counter = std::make_shared<std::atomic<uint64_t>>(0);
    PoolBenchmark benchmark(3, seconds(0), counter_factory(counter));
    EXPECT_EQ(benchmark.worker_count(), 3u);
    EXPECT_EQ(benchmark.batch_size(), 3u * STEP_BATCH_FANOUT);
}

TEST(PoolBenchmarkTest, RejectsWorkerCountAboveLimit) {
    auto counter = std::make_shared<std::atomic<uint64_t>>(0);
    EXPECT_THROW(PoolBenchmark(MAX_WORKERS + 1, seconds(0), counter_factory(counter)),
                 std::invalid_argument);
    EXPECT_THROW(PoolBenchmark(268435456u, seconds(0), counter_factory(counter)),
                 std::invalid_argument);

    PoolBenchmark largest(MAX_WORKERS, seconds(0), counter_factory(counter));
    EXPECT_EQ(largest.batch_size(), static_cast<size_t>(MAX_WORKERS) * STEP_BATCH_FANOUT);
}

TEST(PoolBenchmarkTest, FourWorkersOneSecond) {
    auto counter = std::make_shared<std::atomic<uint64_t>>(0);
    PoolBenchmark benchmark(4, seconds(1), counter_factory(counter));

    const auto start = steady_clock::now();
    ThroughputResult result = benchmark.run();
    const auto wall = steady_clock::now() - start;

    EXPECT_EQ(result.workers, 4u);
    EXPECT_EQ(result.ready_signals, 4u);
    EXPECT_EQ(result.exit_acks, 4u);
    EXPECT_GT(result.total_count, 0u);
    EXPECT_EQ(result.total_count, counter->load());
    EXPECT_GE(result.elapsed_ns, duration_cast<nanoseconds>(seconds(1)).count());
    EXPECT_LT(wall, seconds(10));
    EXPECT_GT(result.throughput, 0.0);
    EXPECT_DOUBLE_EQ(result.throughput, compute_throughput(result.total_count, result.elapsed_ns));
}

TEST(PoolBenchmarkTest, CountsMatchEnqueuedSteps) {
    auto counter = std::make_shared<std::atomic<uint64_t>>(0);
    PoolBenchmark benchmark(3, milliseconds(200), counter_factory(counter));
    ThroughputResult result = benchmark.run();

    EXPECT_EQ(result.total_count, result.steps_enqueued);
    EXPECT_EQ(result.steps_enqueued % benchmark.batch_size(), 0u);
}

TEST(PoolBenchmarkTest, OneWorkerZeroDurationCompletes) {
    for (int attempt = 0; attempt < 2; ++attempt) {
        auto counter = std::make_shared<std::atomic<uint64_t>>(0);
        PoolBenchmark benchmark(1, seconds(0), counter_factory(counter));
        ThroughputResult result = benchmark.run();

        EXPECT_EQ(result.ready_signals, 1u);
        EXPECT_EQ(result.exit_acks, 1u);
        EXPECT_EQ(result.total_count, result.steps_enqueued);
        EXPECT_GE(result.throughput, 0.0);
        EXPECT_GE(result.elapsed_ns, 0);
    }
}

TEST(PoolBenchmarkTest, NoStepBeforeBarrierRelease) {
    FirstStepRecorder recorder;
    PoolBenchmark benchmark(4, milliseconds(200), recorder.factory());
    ThroughputResult result = benchmark.run();

    ASSERT_EQ(recorder.inits.size(), 4u);
    for (const auto& t : recorder.inits) {
        EXPECT_LE(t, result.started_at);
    }
    ASSERT_FALSE(recorder.first_steps.empty());
    for (const auto& t : recorder.first_steps) {
        EXPECT_GE(t, result.started_at);
    }
}

TEST(PoolBenchmarkTest, ThroughputDoesNotOverflowForLargeCounts) {
    const uint64_t count = 5000000000ULL;
    EXPECT_DOUBLE_EQ(compute_throughput(count, 1000000000LL), 5.0e9);
    EXPECT_DOUBLE_EQ(compute_throughput(count, 0), 0.0);
    EXPECT_DOUBLE_EQ(compute_throughput(0, 1000), 0.0);
}

TEST(PoolBenchmarkTest, SyntheticUnitRunsEndToEnd) {
    ThroughputResult result = run_benchmark(2, milliseconds(100));
    EXPECT_EQ(result.ready_signals, 2u);
    EXPECT_EQ(result.exit_acks, 2u);
    EXPECT_EQ(result.total_count, result.steps_enqueued);
    EXPECT_GT(result.throughput, 0.0);
}
