// CPU Benchmark - Worker pool throughput benchmark

#include "pool_benchmark.hpp"
#include "deadline_timer.hpp"
#include "debug_log.hpp"

#include <memory>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace {

// Owns the worker threads of one iteration and joins them on every exit path.
// Unless the iteration completed, the queues are closed first so that
// workers blocked on them return.
class WorkerThreads {
public:
    WorkerThreads(CommandQueue& init_queue, CommandQueue& work_queue, ResultChannel& results)
        : init_queue_(init_queue), work_queue_(work_queue), results_(results) {}

    ~WorkerThreads() {
        if (!completed_) {
            init_queue_.close();
            work_queue_.close();
            results_.close();
        }
        join_all();
    }

    WorkerThreads(const WorkerThreads&) = delete;
    WorkerThreads& operator=(const WorkerThreads&) = delete;

    void spawn(Worker& worker) {
        threads_.emplace_back(&Worker::run, &worker);
    }

    void reserve(size_t n) { threads_.reserve(n); }

    void mark_completed() { completed_ = true; }

    void join_all() {
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        threads_.clear();
    }

private:
    CommandQueue& init_queue_;
    CommandQueue& work_queue_;
    ResultChannel& results_;
    std::vector<std::thread> threads_;
    bool completed_ = false;
};

} // namespace

PoolBenchmark::PoolBenchmark(const BenchConfig& config)
    : PoolBenchmark(config, synthetic_work_factory())
{
}

PoolBenchmark::PoolBenchmark(const BenchConfig& config, WorkUnitFactory factory)
    : PoolBenchmark(config.workers, config.duration(), std::move(factory))
{
}

PoolBenchmark::PoolBenchmark(unsigned workers,
                             std::chrono::steady_clock::duration duration,
                             WorkUnitFactory factory)
    : workers_(workers)
    , duration_(duration)
    , factory_(std::move(factory))
{
    if (workers_ == 0) {
        throw std::invalid_argument("Worker count must be greater than 0");
    }
    if (workers_ > MAX_WORKERS) {
        throw std::invalid_argument("Worker count must not exceed " + std::to_string(MAX_WORKERS));
    }
    if (!factory_) {
        throw std::invalid_argument("Work unit factory must not be empty");
    }
}

ThroughputResult PoolBenchmark::run() {
    ThroughputResult result;
    result.workers = workers_;

    CommandQueue init_queue(workers_);
    CommandQueue work_queue(static_cast<size_t>(workers_) * WORK_QUEUE_FANOUT);
    ResultChannel results(workers_);

    std::vector<std::unique_ptr<Worker>> workers;
    workers.reserve(workers_);
    WorkerThreads threads(init_queue, work_queue, results);
    threads.reserve(workers_);

    debug_log("Initializing workers");

    // Spawn workers and trigger initialization
    for (unsigned i = 0; i < workers_; ++i) {
        workers.push_back(std::make_unique<Worker>(i, init_queue, work_queue, results, factory_));
        try {
            threads.spawn(*workers.back());
        } catch (const std::system_error& e) {
            throw std::runtime_error("Failed to create worker thread " + std::to_string(i) +
                                     "/" + std::to_string(workers_) + ": " + e.what());
        }
        if (!init_queue.push(WorkerCommand::Init)) {
            throw std::runtime_error("Init queue closed during startup");
        }
    }

    // Wait for all workers to be initialized
    for (unsigned i = 0; i < workers_; ++i) {
        uint64_t ready = 0;
        if (!results.pop(ready)) {
            throw std::runtime_error("Result channel closed before all workers were ready");
        }
        ++result.ready_signals;
    }

    debug_log("Start");
    const auto begin = std::chrono::steady_clock::now();
    result.started_at = begin;

    // The deadline is only checked once per batch
    const size_t batch = batch_size();
    {
        DeadlineTimer timer(duration_);
        while (!timer.fired()) {
            for (size_t i = 0; i < batch; ++i) {
                if (!work_queue.push(WorkerCommand::Step)) {
                    throw std::runtime_error("Work queue closed during benchmark");
                }
            }
            result.steps_enqueued += batch;
        }
    }

    // Signal the end of the benchmark to workers, and aggregate results
    for (unsigned i = 0; i < workers_; ++i) {
        if (!work_queue.push(WorkerCommand::Exit)) {
            throw std::runtime_error("Work queue closed during shutdown");
        }
    }
    for (unsigned i = 0; i < workers_; ++i) {
        uint64_t count = 0;
        if (!results.pop(count)) {
            throw std::runtime_error("Result channel closed before all workers reported");
        }
        result.total_count += count;
        ++result.exit_acks;
    }
    const auto end = std::chrono::steady_clock::now();
    debug_log("End");

    threads.mark_completed();
    threads.join_all();

    result.elapsed_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - begin).count();
    result.throughput = compute_throughput(result.total_count, result.elapsed_ns);

    if (debug_enabled()) {
        std::ostringstream oss;
        oss << "THROUGHPUT " << std::fixed << std::setprecision(6) << result.throughput
            << " (" << result.total_count << " steps in " << result.elapsed_ns << " ns)";
        debug_log(oss.str());
    }

    return result;
}

ThroughputResult run_benchmark(unsigned workers, std::chrono::steady_clock::duration duration) {
    PoolBenchmark benchmark(workers, duration, synthetic_work_factory());
    return benchmark.run();
}
