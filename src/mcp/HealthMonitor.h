#pragma once
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>

class ConnectionSupervisor;

/**
 * @brief Background thread calling ConnectionSupervisor::sweep() on a fixed period.
 */
class HealthMonitor {
public:
    HealthMonitor(ConnectionSupervisor& supervisor, int intervalSec);
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    /** No-op when the interval is not positive or the thread already runs. */
    void start();
    void stop();

    bool isRunning() const { return running; }
    int sweepCount() const { return sweeps; }

private:
    ConnectionSupervisor& supervisor;
    int intervalSec;
    std::thread thread;
    std::mutex mtx;
    std::condition_variable cv;
    bool stopRequested = false;
    std::atomic<bool> running{false};
    std::atomic<int> sweeps{0};

    void loop();
};
