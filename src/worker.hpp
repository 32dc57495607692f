#pragma once
// CPU Benchmark - Benchmark worker

#include "types.hpp"
#include "bounded_queue.hpp"

#include <cstdint>
#include <functional>

using CommandQueue = BoundedQueue<WorkerCommand>;
using ResultChannel = BoundedQueue<uint64_t>;

// One unit of work executed per Step command.
// Called only from the worker's own thread.
using WorkUnit = std::function<void()>;

// Builds the work unit of a worker; called on the worker thread during Init
using WorkUnitFactory = std::function<WorkUnit(unsigned worker_id)>;

// Default factory: one SyntheticWork instance per worker
WorkUnitFactory synthetic_work_factory();

// Worker protocol:
//   init queue  -> exactly one Init, answered by a 0 on the result channel
//   work queue  -> Step (run one unit, count it) until Exit
//   Exit        -> final count on the result channel, then return
class Worker {
public:
    Worker(unsigned id,
           CommandQueue& init_queue,
           CommandQueue& work_queue,
           ResultChannel& results,
           WorkUnitFactory factory);

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // Thread body. Returns when Exit is processed or a queue is closed.
    void run();

    unsigned id() const { return id_; }

private:
    unsigned id_;
    CommandQueue& init_queue_;
    CommandQueue& work_queue_;
    ResultChannel& results_;
    WorkUnitFactory factory_;
};
