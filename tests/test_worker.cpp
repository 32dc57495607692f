// CPU Benchmark - Worker protocol tests

#include <gtest/gtest.h>

#include "worker.hpp"
#include "synthetic_work.hpp"

#include <atomic>
#include <chrono>
#include <thread>

namespace {

struct WorkerHarness {
    CommandQueue init_queue{1};
    CommandQueue work_queue{64};
    ResultChannel results{1};
    std::atomic<int> units_created{0};
    std::atomic<int> steps_run{0};

    WorkUnitFactory counting_factory() {
        return [this](unsigned) -> WorkUnit {
            ++units_created;
            return [this]() { ++steps_run; };
        };
    }
};

} // namespace

TEST(WorkerTest, InitStepExitSequence) {
    WorkerHarness h;
    Worker worker(0, h.init_queue, h.work_queue, h.results, h.counting_factory());
    std::thread thread(&Worker::run, &worker);

    ASSERT_TRUE(h.init_queue.push(WorkerCommand::Init));
    uint64_t ready = 99;
    ASSERT_TRUE(h.results.pop(ready));
    EXPECT_EQ(ready, 0u);
    EXPECT_EQ(h.units_created.load(), 1);

    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(h.work_queue.push(WorkerCommand::Step));
    }
    ASSERT_TRUE(h.work_queue.push(WorkerCommand::Exit));

    uint64_t count = 0;
    ASSERT_TRUE(h.results.pop(count));
    EXPECT_EQ(count, 10u);
    EXPECT_EQ(h.steps_run.load(), 10);

    thread.join();
}

TEST(WorkerTest, ExitWithoutStepsReportsZero) {
    WorkerHarness h;
    Worker worker(1, h.init_queue, h.work_queue, h.results, h.counting_factory());
    std::thread thread(&Worker::run, &worker);

    ASSERT_TRUE(h.init_queue.push(WorkerCommand::Init));
    uint64_t ready = 99;
    ASSERT_TRUE(h.results.pop(ready));

    ASSERT_TRUE(h.work_queue.push(WorkerCommand::Exit));
    uint64_t count = 99;
    ASSERT_TRUE(h.results.pop(count));
    EXPECT_EQ(count, 0u);

    thread.join();
}

TEST(WorkerTest, StepsAreNotExecutedBeforeInit) {
    WorkerHarness h;
    ASSERT_TRUE(h.work_queue.push(WorkerCommand::Step));
    ASSERT_TRUE(h.work_queue.push(WorkerCommand::Exit));

    Worker worker(2, h.init_queue, h.work_queue, h.results, h.counting_factory());
    std::thread thread(&Worker::run, &worker);

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(h.steps_run.load(), 0);
    EXPECT_EQ(h.work_queue.size(), 2u);

    ASSERT_TRUE(h.init_queue.push(WorkerCommand::Init));
    uint64_t ready = 99;
    ASSERT_TRUE(h.results.pop(ready));
    uint64_t count = 0;
    ASSERT_TRUE(h.results.pop(count));
    EXPECT_EQ(count, 1u);

    thread.join();
}

TEST(WorkerTest, ClosedQueuesStopTheWorker) {
    WorkerHarness h;
    Worker worker(3, h.init_queue, h.work_queue, h.results, h.counting_factory());
    std::thread thread(&Worker::run, &worker);

    h.init_queue.close();
    thread.join();
    EXPECT_EQ(h.units_created.load(), 0);
}

TEST(WorkerTest, SyntheticFactoryBuildsRunnableUnits) {
    WorkUnitFactory factory = synthetic_work_factory();
    WorkUnit unit = factory(5);
    ASSERT_TRUE(static_cast<bool>(unit));
    unit();
    unit();
}

TEST(WorkerTest, SyntheticUnitPublishesChecksumWhenReleased) {
    SyntheticWork reference(7);
    reference.step();
    reference.step();

    const uint64_t before = published_results();
    {
        WorkUnit unit = synthetic_work_factory()(7);
        unit();
        WorkUnit copy = unit;
        unit = nullptr;
        copy();
        EXPECT_EQ(published_results(), before);
    }
    EXPECT_EQ(published_results(), before ^ reference.checksum());
}
