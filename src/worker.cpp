// CPU Benchmark - Benchmark worker

#include "worker.hpp"
#include "synthetic_work.hpp"
#include "debug_log.hpp"

#include <memory>
#include <string>
#include <utility>

namespace {
// A worker's synthetic unit; its checksum is published when the unit is released
class PublishedWork {
public:
    explicit PublishedWork(unsigned worker_id) : work_(worker_id) {}
    ~PublishedWork() { publish_result(work_.checksum()); }

    PublishedWork(const PublishedWork&) = delete;
    PublishedWork& operator=(const PublishedWork&) = delete;

    void step() { work_.step(); }

private:
    SyntheticWork work_;
};
} // namespace

WorkUnitFactory synthetic_work_factory() {
    return [](unsigned worker_id) -> WorkUnit {
        auto work = std::make_shared<PublishedWork>(worker_id);
        return [work]() { work->step(); };
    };
}

Worker::Worker(unsigned id,
               CommandQueue& init_queue,
               CommandQueue& work_queue,
               ResultChannel& results,
               WorkUnitFactory factory)
    : id_(id)
    , init_queue_(init_queue)
    , work_queue_(work_queue)
    , results_(results)
    , factory_(std::move(factory))
{
}

void Worker::run() {
    WorkerCommand cmd = WorkerCommand::Exit;
    if (!init_queue_.pop(cmd)) {
        return;
    }
    if (cmd != WorkerCommand::Init) {
        debug_log("[worker " + std::to_string(id_) + "] expected Init, got " +
                  command_to_string(cmd));
        return;
    }

    WorkUnit unit = factory_(id_);

    // Readiness signal
    if (!results_.push(0)) {
        return;
    }

    uint64_t count = 0;
    while (work_queue_.pop(cmd)) {
        switch (cmd) {
            case WorkerCommand::Step:
                unit();
                ++count;
                break;
            case WorkerCommand::Exit:
                if (!results_.push(count)) {
                    debug_log("[worker " + std::to_string(id_) + "] result channel closed, count lost");
                }
                return;
            case WorkerCommand::Init:
                debug_log("[worker " + std::to_string(id_) + "] ignoring Init on work queue");
                break;
        }
    }
}
