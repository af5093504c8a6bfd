#pragma once
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>
#include "mcp/ToolServerConfig.h"
#include "mcp/ServerProcess.h"
#include "mcp/LineTransport.h"
#include "mcp/MCPHandshake.h"
#include "mcp/ToolCatalog.h"
#include "mcp/ToolInvoker.h"

enum class ConnectionState { Disconnected, Connecting, Connected, Unhealthy };

const char* connectionStateName(ConnectionState state);

/**
 * @brief Owns the tool-server subprocess and its connection.
 *
 * Every state change, health check and tool call runs under one mutex, so at
 * most one request is ever in flight and concurrent ensureConnected() calls
 * spawn a single process. Failures are thrown as ToolServerError.
 */
class ConnectionSupervisor {
public:
    explicit ConnectionSupervisor(ToolServerConfig config);
    ~ConnectionSupervisor();

    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    /** No-op when already connected and healthy; otherwise spawn + handshake + discovery. */
    void connect();

    /** Terminates the subprocess and forgets the catalog and indexed set. Idempotent. */
    void disconnect();

    /**
     * @brief Connected and the process alive; probes with ping after a long idle.
     * Re-evaluated at most once per health interval, the cached value is returned in between.
     * While a call or reconnect holds the connection the last verdict is returned without waiting.
     */
    bool checkHealth();

    /** Connects if disconnected, reconnects if unhealthy. */
    void ensureConnected();

    /**
     * @brief One round of the background health sweep: reconnects an unhealthy
     * connection. A connection the user closed is left closed.
     */
    bool sweep();

    /**
     * @brief Runs the operation with the configured retry budget.
     * NoSuchToolAvailable, EmptyResult and InvalidArgument are not retried;
     * the last failure propagates unchanged. A tool the server reports as
     * unknown forces a reconnect before the next attempt.
     */
    ToolInvoker::Invocation invokeWithRetry(LogicalOperation op, const OperationParams& params);

    void recordIndexed(const std::string& repository, const std::string& indexLocation);
    std::optional<std::string> indexLocationFor(const std::string& repository) const;

    ConnectionState getState() const;
    std::vector<std::string> toolNames() const;
    std::map<std::string, std::string> indexedRepositories() const;
    nlohmann::json serverInfo() const;
    int spawnCount() const;
    int probeCount() const;
    pid_t pid() const;
    const ToolServerConfig& getConfig() const { return config; }

private:
    ToolServerConfig config;

    mutable std::mutex mtx;
    ConnectionState state = ConnectionState::Disconnected;
    std::unique_ptr<ServerProcess> process;
    std::unique_ptr<StdioLineTransport> transport;
    MCPHandshake handshake;
    ToolCatalog catalog;
    std::map<std::string, std::string> indexed;

    bool healthCached = false;
    bool lastHealthResult = false;
    std::atomic<bool> lastVerdict{false};
    std::chrono::steady_clock::time_point lastHealthCheck;
    std::chrono::steady_clock::time_point lastActivity;

    int spawns = 0;
    int probes = 0;

    void connectLocked();
    void teardownLocked();
    bool checkHealthLocked();
    bool evaluateHealthLocked(std::chrono::steady_clock::time_point now);
    void ensureConnectedLocked();
    void markUnhealthyLocked(const std::string& reason);
    MCPHandshake::ClientIdentity identity() const;
};
