#pragma once
#include <queue>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <thread>
#include <functional>
#include <future>
#include <memory>

/**
 * @brief One background thread running submitted jobs in order.
 *
 * Callers get a future and decide how long to wait for it. A job whose caller
 * gave up still runs to completion; its result is dropped with the future.
 */
class SerialWorker {
public:
    SerialWorker() : worker(&SerialWorker::run, this) {}

    ~SerialWorker() {
        {
            std::lock_guard<std::mutex> lock(mtx);
            stopping = true;
        }
        cv.notify_all();
        if (worker.joinable()) worker.join();
    }

    SerialWorker(const SerialWorker&) = delete;
    SerialWorker& operator=(const SerialWorker&) = delete;

    template <typename F>
    auto submit(F&& fn) -> std::future<decltype(fn())> {
        using Result = decltype(fn());
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
        std::future<Result> future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mtx);
            jobs.push([task]() { (*task)(); });
        }
        cv.notify_one();
        return future;
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mtx);
        return jobs.size();
    }

    bool isWorkerThread() const { return std::this_thread::get_id() == worker.get_id(); }

private:
    std::queue<std::function<void()>> jobs;
    mutable std::mutex mtx;
    std::condition_variable cv;
    bool stopping = false;
    std::thread worker;

    void run() {
        while (true) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(mtx);
                cv.wait(lock, [this] { return !jobs.empty() || stopping; });
                if (stopping && jobs.empty()) return;
                job = std::move(jobs.front());
                jobs.pop();
            }
            job();
        }
    }
};
