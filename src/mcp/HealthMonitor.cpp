#include "mcp/HealthMonitor.h"
#include "mcp/ConnectionSupervisor.h"
#include "utils/Logger.h"
#include <chrono>

HealthMonitor::HealthMonitor(ConnectionSupervisor& supervisor, int intervalSec)
    : supervisor(supervisor), intervalSec(intervalSec) {}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::start() {
    if (intervalSec <= 0 || running) return;
    {
        std::lock_guard<std::mutex> lock(mtx);
        stopRequested = false;
    }
    running = true;
    thread = std::thread(&HealthMonitor::loop, this);
    Logger::getInstance().debug("Health sweep every " + std::to_string(intervalSec) + "s");
}

void HealthMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        stopRequested = true;
    }
    cv.notify_all();
    if (thread.joinable()) thread.join();
    running = false;
}

void HealthMonitor::loop() {
    std::unique_lock<std::mutex> lock(mtx);
    while (!stopRequested) {
        if (cv.wait_for(lock, std::chrono::seconds(intervalSec), [this] { return stopRequested; })) break;
        lock.unlock();
        supervisor.sweep();
        ++sweeps;
        lock.lock();
    }
}
