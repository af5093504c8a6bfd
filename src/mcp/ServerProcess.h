#pragma once
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <sys/types.h>

/**
 * @brief The running tool-server subprocess.
 *
 * Owns the child's pid and the parent ends of its stdin/stdout/stderr pipes.
 * A background thread drains stderr into a bounded tail buffer so the child
 * never blocks on a full pipe and a startup failure can be reported with the
 * child's own diagnostics.
 */
class ServerProcess {
public:
    struct LaunchSpec {
        std::string command;
        std::vector<std::string> args;
        std::map<std::string, std::string> env;  // merged over the parent environment
    };

    ServerProcess() = default;
    ~ServerProcess();

    ServerProcess(const ServerProcess&) = delete;
    ServerProcess& operator=(const ServerProcess&) = delete;

    /**
     * @brief fork/exec the command with piped stdio.
     *
     * Waits graceMs and throws ToolServerError(SpawnFailed) if the child has
     * already exited by then; the message carries the exit code and the
     * captured stderr.
     */
    void start(const LaunchSpec& spec, int graceMs);

    /**
     * @brief Closes stdin, sends SIGTERM, waits up to graceMs, then SIGKILL.
     * Safe to call repeatedly.
     */
    void terminate(int graceMs);

    bool isAlive();
    int exitCode() const { return exitStatus; }
    pid_t getPid() const { return pid; }
    int stdinFd() const { return writeFd; }
    int stdoutFd() const { return readFd; }

    std::string stderrTail();

private:
    pid_t pid = -1;
    int writeFd = -1;
    int readFd = -1;
    int errFd = -1;
    bool exited = false;
    int exitStatus = -1;
    std::chrono::steady_clock::time_point startTime;

    std::thread stderrThread;
    std::atomic<bool> stopDrain{false};
    std::mutex tailMtx;
    std::string tail;
    static constexpr size_t maxTail = 8192;

    void drainLoop();
    void appendTail(const char* data, size_t n);
    void stopStderrDrain();
    void closeFds();
    void reap(int status);
};
