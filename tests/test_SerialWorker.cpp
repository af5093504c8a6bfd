#include <gtest/gtest.h>
#include "utils/SerialWorker.h"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <vector>

TEST(SerialWorkerTest, RunsJobsInSubmissionOrder) {
    SerialWorker worker;
    std::vector<int> order;
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 5; ++i) {
        futures.push_back(worker.submit([&order, i]() { order.push_back(i); }));
    }
    for (auto& f : futures) f.get();
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST(SerialWorkerTest, ExceptionsReachTheFuture) {
    SerialWorker worker;
    auto f = worker.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(f.get(), std::runtime_error);

    auto g = worker.submit([]() { return 7; });
    EXPECT_EQ(g.get(), 7);
}

TEST(SerialWorkerTest, AbandonedJobStillCompletes) {
    std::atomic<bool> done{false};
    {
        SerialWorker worker;
        auto f = worker.submit([&done]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            done = true;
        });
        EXPECT_EQ(f.wait_for(std::chrono::milliseconds(10)), std::future_status::timeout);
    }
    // The destructor drains queued work before joining.
    EXPECT_TRUE(done);
}

TEST(SerialWorkerTest, JobsRunOnWorkerThread) {
    SerialWorker worker;
    EXPECT_FALSE(worker.isWorkerThread());
    auto f = worker.submit([&worker]() { return worker.isWorkerThread(); });
    EXPECT_TRUE(f.get());
}

TEST(SerialWorkerTest, PendingCountsQueuedJobs) {
    SerialWorker worker;
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    auto first = worker.submit([opened]() { opened.wait(); });
    auto second = worker.submit([]() {});

    // The first job may or may not have been picked up yet; the second is still queued.
    EXPECT_GE(worker.pending(), 1u);
    gate.set_value();
    first.get();
    second.get();
    EXPECT_EQ(worker.pending(), 0u);
}
