#pragma once
// CPU Benchmark - Worker pool throughput benchmark
//
// One iteration:
//   1. spawn N workers and send each an Init
//   2. barrier: wait for N readiness signals
//   3. flood the work queue with Step batches until the deadline fires
//   4. send N Exit commands and sum the N final counts
// Throughput = total steps * 1e9 / elapsed ns.

#include "types.hpp"
#include "worker.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>

class PoolBenchmark {
public:
    // Uses config.workers (must be resolved, 1..MAX_WORKERS) and config.duration_sec
    explicit PoolBenchmark(const BenchConfig& config);

    // Same, with a custom work unit (instrumented units in tests)
    PoolBenchmark(const BenchConfig& config, WorkUnitFactory factory);

    PoolBenchmark(unsigned workers,
                  std::chrono::steady_clock::duration duration,
                  WorkUnitFactory factory);

    // Run one iteration. Throws std::runtime_error if a worker cannot be started.
    ThroughputResult run();

    unsigned worker_count() const { return workers_; }
    size_t batch_size() const { return static_cast<size_t>(workers_) * STEP_BATCH_FANOUT; }

private:
    unsigned workers_;
    std::chrono::steady_clock::duration duration_;
    WorkUnitFactory factory_;
};

// Convenience wrapper around PoolBenchmark with the synthetic work unit
ThroughputResult run_benchmark(unsigned workers, std::chrono::steady_clock::duration duration);
