#include "mcp/ServerProcess.h"
#include "mcp/ToolServerError.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>

extern char** environ;

namespace {
std::string toLower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::string startupHint(const std::string& stderrText) {
    std::string lower = toLower(stderrText);
    if (lower.find("not found") != std::string::npos || lower.find("no such file") != std::string::npos) {
        return "Install uv/uvx (https://docs.astral.sh/uv/getting-started/installation/ or `pip install uv`) "
               "or point tool_server.command at an existing binary.";
    }
    if (lower.find("permission denied") != std::string::npos) {
        return "Check the executable permissions of the tool server command.";
    }
    if (lower.find("github") != std::string::npos && lower.find("token") != std::string::npos) {
        return "Check that GITHUB_TOKEN is valid and has repository read access.";
    }
    return "";
}

void closePair(int fds[2]) {
    close(fds[0]);
    close(fds[1]);
}
} // namespace

ServerProcess::~ServerProcess() {
    terminate(2000);
}

void ServerProcess::start(const LaunchSpec& spec, int graceMs) {
    if (pid > 0) return;
    if (spec.command.empty()) {
        throw ToolServerError(ErrorKind::SpawnFailed, "No tool server command configured");
    }

    // A dead child must surface as a write error, not kill the whole process.
    std::signal(SIGPIPE, SIG_IGN);

    // Everything the child needs is prepared before fork: only exec-safe calls after it.
    std::vector<std::string> argStore;
    argStore.push_back(spec.command);
    argStore.insert(argStore.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    for (auto& a : argStore) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    std::map<std::string, std::string> envMap;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        envMap[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& [key, value] : spec.env) {
        envMap[key] = value;
    }
    std::vector<std::string> envStore;
    envStore.reserve(envMap.size());
    for (const auto& [key, value] : envMap) envStore.push_back(key + "=" + value);
    std::vector<char*> envp;
    for (auto& e : envStore) envp.push_back(const_cast<char*>(e.c_str()));
    envp.push_back(nullptr);

    std::string execFailPrefix = "failed to exec '" + spec.command + "': ";

    int inPipe[2];
    int outPipe[2];
    int errPipe[2];
    if (pipe2(inPipe, O_CLOEXEC) != 0) {
        throw ToolServerError(ErrorKind::SpawnFailed, std::string("pipe() failed: ") + std::strerror(errno));
    }
    if (pipe2(outPipe, O_CLOEXEC) != 0) {
        closePair(inPipe);
        throw ToolServerError(ErrorKind::SpawnFailed, std::string("pipe() failed: ") + std::strerror(errno));
    }
    if (pipe2(errPipe, O_CLOEXEC) != 0) {
        closePair(inPipe);
        closePair(outPipe);
        throw ToolServerError(ErrorKind::SpawnFailed, std::string("pipe() failed: ") + std::strerror(errno));
    }

    pid = fork();
    if (pid == 0) {
        dup2(inPipe[0], STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        execvpe(argv[0], argv.data(), envp.data());

        int err = errno;
        ssize_t ignored = write(STDERR_FILENO, execFailPrefix.c_str(), execFailPrefix.size());
        const char* reason = std::strerror(err);
        ignored = write(STDERR_FILENO, reason, std::strlen(reason));
        ignored = write(STDERR_FILENO, "\n", 1);
        (void)ignored;
        _exit(127);
    }

    if (pid < 0) {
        int err = errno;
        closePair(inPipe);
        closePair(outPipe);
        closePair(errPipe);
        pid = -1;
        throw ToolServerError(ErrorKind::SpawnFailed, std::string("fork() failed: ") + std::strerror(err));
    }

    close(inPipe[0]);
    close(outPipe[1]);
    close(errPipe[1]);
    writeFd = inPipe[1];
    readFd = outPipe[0];
    errFd = errPipe[0];
    exited = false;
    exitStatus = -1;
    startTime = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(tailMtx);
        tail.clear();
    }
    stopDrain = false;
    stderrThread = std::thread(&ServerProcess::drainLoop, this);

    Logger::getInstance().debug("Spawned tool server pid " + std::to_string(pid) + ": " + spec.command);

    // Startup grace window: a missing binary or a crash on launch shows up here.
    auto deadline = startTime + std::chrono::milliseconds(graceMs);
    while (std::chrono::steady_clock::now() < deadline) {
        if (!isAlive()) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    if (!isAlive()) {
        stopStderrDrain();
        std::string errText = stderrTail();
        int code = exitStatus;
        closeFds();
        pid = -1;

        std::string message = "Tool server process failed to start (exit code: " + std::to_string(code) + ")";
        if (!errText.empty()) message += "\nError: " + errText;
        throw ToolServerError(ErrorKind::SpawnFailed, message, startupHint(errText));
    }
}

void ServerProcess::terminate(int graceMs) {
    if (pid <= 0) {
        stopStderrDrain();
        closeFds();
        return;
    }

    // EOF on stdin is the polite shutdown request for stdio servers.
    if (writeFd >= 0) {
        close(writeFd);
        writeFd = -1;
    }

    if (!exited) {
        kill(pid, SIGTERM);
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(graceMs);
        while (std::chrono::steady_clock::now() < deadline) {
            if (!isAlive()) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        if (!exited) {
            Logger::getInstance().warn("Graceful termination timed out, force killing tool server pid " +
                                       std::to_string(pid));
            kill(pid, SIGKILL);
            int status = 0;
            if (waitpid(pid, &status, 0) == pid) {
                reap(status);
            } else {
                exited = true;
            }
        }
    }

    stopStderrDrain();
    closeFds();
    pid = -1;
}

bool ServerProcess::isAlive() {
    if (pid <= 0 || exited) return false;
    int status = 0;
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid) {
        reap(status);
        return false;
    }
    if (r < 0) {
        exited = true;
        return false;
    }
    return true;
}

std::string ServerProcess::stderrTail() {
    std::lock_guard<std::mutex> lock(tailMtx);
    std::string out = tail;
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) out.pop_back();
    return out;
}

void ServerProcess::drainLoop() {
    char buffer[1024];
    while (!stopDrain) {
        struct pollfd pfd;
        pfd.fd = errFd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int r = poll(&pfd, 1, 50);
        if (r < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (r == 0) continue;
        ssize_t n = read(errFd, buffer, sizeof(buffer));
        if (n <= 0) break;
        appendTail(buffer, static_cast<size_t>(n));
    }
}

void ServerProcess::appendTail(const char* data, size_t n) {
    std::string chunk(data, n);
    Logger::getInstance().debug("[tool-server stderr] " + chunk);
    std::lock_guard<std::mutex> lock(tailMtx);
    tail += chunk;
    if (tail.size() > maxTail) {
        tail.erase(0, tail.size() - maxTail);
    }
}

void ServerProcess::stopStderrDrain() {
    stopDrain = true;
    if (stderrThread.joinable()) stderrThread.join();

    // Pick up whatever the child wrote right before exiting.
    if (errFd >= 0) {
        int flags = fcntl(errFd, F_GETFL, 0);
        if (flags >= 0) fcntl(errFd, F_SETFL, flags | O_NONBLOCK);
        char buffer[1024];
        while (true) {
            ssize_t n = read(errFd, buffer, sizeof(buffer));
            if (n <= 0) break;
            appendTail(buffer, static_cast<size_t>(n));
        }
    }
}

void ServerProcess::closeFds() {
    if (writeFd >= 0) {
        close(writeFd);
        writeFd = -1;
    }
    if (readFd >= 0) {
        close(readFd);
        readFd = -1;
    }
    if (errFd >= 0) {
        close(errFd);
        errFd = -1;
    }
}

void ServerProcess::reap(int status) {
    exited = true;
    if (WIFEXITED(status)) {
        exitStatus = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exitStatus = 128 + WTERMSIG(status);
    }
}
