#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <functional>
#include "mcp/ToolServerError.h"
#include "mcp/ToolServerConfig.h"
#include "mcp/ConnectionSupervisor.h"
#include "mcp/HealthMonitor.h"
#include "mcp/RepositoryResults.h"
#include "utils/SerialWorker.h"

/**
 * @brief Result of a facade call: a value, or the failure kind with message and hint.
 *
 * EmptyResult is reported through kind but is not a failure: the call worked
 * and the server had nothing to return.
 */
template <typename T>
struct Outcome {
    ErrorKind kind = ErrorKind::None;
    ToolErrorKind toolKind = ToolErrorKind::None;  // set for ToolInvocationError
    std::string message;
    std::string hint;
    T value{};

    bool ok() const { return kind == ErrorKind::None; }
    bool empty() const { return kind == ErrorKind::EmptyResult; }

    static Outcome success(T v) {
        Outcome o;
        o.value = std::move(v);
        return o;
    }

    static Outcome failure(ErrorKind kind, const std::string& message, const std::string& hint = "",
                           ToolErrorKind toolKind = ToolErrorKind::None) {
        Outcome o;
        o.kind = kind;
        o.toolKind = toolKind;
        o.message = message;
        o.hint = hint;
        return o;
    }
};

/**
 * @brief Blocking API over the tool server.
 *
 * Every call runs on one background worker and is bounded by the call
 * deadline. When the deadline passes the caller gets a Timeout outcome; the
 * work itself finishes in the background and its result is dropped.
 */
class RepositoryClient {
public:
    explicit RepositoryClient(ToolServerConfig config);
    ~RepositoryClient();

    RepositoryClient(const RepositoryClient&) = delete;
    RepositoryClient& operator=(const RepositoryClient&) = delete;

    Outcome<bool> connect();
    Outcome<bool> disconnect();
    bool checkHealth();

    Outcome<IndexResult> indexRepository(const std::string& location);
    Outcome<std::vector<SearchMatch>> search(const std::string& location, const std::string& query, int limit = 10);
    Outcome<FileContent> fetchFile(const std::string& location, const std::string& path);
    Outcome<DirectoryListing> listStructure(const std::string& location);
    Outcome<std::vector<SearchMatch>> searchCode(const std::string& location, const std::string& pattern,
                                                 const std::string& fileType = "");

    void startHealthMonitor() { monitor.start(); }
    void stopHealthMonitor() { monitor.stop(); }

    void setCallDeadline(std::chrono::milliseconds deadline) { callDeadline = deadline; }
    std::chrono::milliseconds getCallDeadline() const { return callDeadline; }

    ConnectionSupervisor& getSupervisor() { return supervisor; }

private:
    ConnectionSupervisor supervisor;
    HealthMonitor monitor;
    std::chrono::milliseconds callDeadline;
    // Declared last: destroyed first, so no job outlives the supervisor.
    SerialWorker worker;

    template <typename T>
    Outcome<T> run(const std::string& what, std::function<T()> job);
};
