#include "mcp/ConnectionSupervisor.h"
#include "mcp/ToolServerError.h"
#include "utils/Logger.h"
#include <thread>

const char* connectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Unhealthy: return "unhealthy";
    }
    return "unknown";
}

ConnectionSupervisor::ConnectionSupervisor(ToolServerConfig config)
    : config(std::move(config)), handshake(identity()) {}

ConnectionSupervisor::~ConnectionSupervisor() {
    std::lock_guard<std::mutex> lock(mtx);
    teardownLocked();
}

MCPHandshake::ClientIdentity ConnectionSupervisor::identity() const {
    MCPHandshake::ClientIdentity id;
    id.name = config.clientName;
    id.version = config.clientVersion;
    id.protocolVersion = config.protocolVersion;
    return id;
}

void ConnectionSupervisor::connect() {
    std::lock_guard<std::mutex> lock(mtx);
    if (state == ConnectionState::Connected && checkHealthLocked()) {
        Logger::getInstance().info("Already connected and healthy");
        return;
    }
    if (state != ConnectionState::Disconnected) {
        teardownLocked();
    }
    connectLocked();
}

void ConnectionSupervisor::disconnect() {
    std::lock_guard<std::mutex> lock(mtx);
    if (state == ConnectionState::Disconnected && !process) return;
    teardownLocked();
    Logger::getInstance().info("Tool server disconnected");
}

bool ConnectionSupervisor::checkHealth() {
    std::unique_lock<std::mutex> lock(mtx, std::try_to_lock);
    if (!lock.owns_lock()) {
        // A call or reconnect holds the connection; report the last verdict instead of waiting.
        return lastVerdict.load();
    }
    return checkHealthLocked();
}

void ConnectionSupervisor::ensureConnected() {
    std::lock_guard<std::mutex> lock(mtx);
    ensureConnectedLocked();
}

bool ConnectionSupervisor::sweep() {
    std::lock_guard<std::mutex> lock(mtx);
    if (state == ConnectionState::Disconnected) return false;
    if (checkHealthLocked()) return true;

    Logger::getInstance().warn("Health sweep found the tool server unhealthy, reconnecting");
    try {
        ensureConnectedLocked();
    } catch (const ToolServerError& e) {
        Logger::getInstance().error(std::string("Reconnect from health sweep failed: ") + e.what());
        return false;
    }
    return state == ConnectionState::Connected;
}

ToolInvoker::Invocation ConnectionSupervisor::invokeWithRetry(LogicalOperation op, const OperationParams& params) {
    const int retries = config.retry.retriesFor(op);
    for (int attempt = 0;; ++attempt) {
        try {
            std::lock_guard<std::mutex> lock(mtx);
            ensureConnectedLocked();
            try {
                auto inv = ToolInvoker::invoke(*transport, catalog, op, params);
                lastActivity = std::chrono::steady_clock::now();
                return inv;
            } catch (const nlohmann::json::exception& e) {
                throw ToolServerError(ErrorKind::MalformedResponse,
                                      std::string("Unexpected data from tool server: ") + e.what());
            }
        } catch (const ToolServerError& e) {
            if (isTransportFailure(e.kind())) {
                std::lock_guard<std::mutex> lock(mtx);
                markUnhealthyLocked(e.what());
            }
            if (e.kind() == ErrorKind::NoSuchToolAvailable || e.kind() == ErrorKind::EmptyResult ||
                e.kind() == ErrorKind::InvalidArgument || attempt >= retries) {
                throw;
            }
            if (e.toolKind() == ToolErrorKind::UnknownTool) {
                // The catalog is stale; the next attempt reconnects and rediscovers it.
                std::lock_guard<std::mutex> lock(mtx);
                Logger::getInstance().warn("Tool server no longer knows the resolved tool, refreshing the tool list");
                teardownLocked();
            }
            Logger::getInstance().warn(std::string(operationName(op)) + " attempt " + std::to_string(attempt + 1) +
                                       " failed (" + errorKindName(e.kind()) + "), retrying: " + e.what());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(config.retry.pauseMs));
    }
}

void ConnectionSupervisor::recordIndexed(const std::string& repository, const std::string& indexLocation) {
    std::lock_guard<std::mutex> lock(mtx);
    indexed[repository] = indexLocation.empty() ? ToolRouting::repositoryLocalName(repository) : indexLocation;
}

std::optional<std::string> ConnectionSupervisor::indexLocationFor(const std::string& repository) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = indexed.find(repository);
    if (it == indexed.end()) return std::nullopt;
    return it->second;
}

ConnectionState ConnectionSupervisor::getState() const {
    std::lock_guard<std::mutex> lock(mtx);
    return state;
}

std::vector<std::string> ConnectionSupervisor::toolNames() const {
    std::lock_guard<std::mutex> lock(mtx);
    return catalog.names();
}

std::map<std::string, std::string> ConnectionSupervisor::indexedRepositories() const {
    std::lock_guard<std::mutex> lock(mtx);
    return indexed;
}

nlohmann::json ConnectionSupervisor::serverInfo() const {
    std::lock_guard<std::mutex> lock(mtx);
    if (state == ConnectionState::Disconnected) return nlohmann::json::object();
    return handshake.serverInfo();
}

int ConnectionSupervisor::spawnCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return spawns;
}

int ConnectionSupervisor::probeCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return probes;
}

pid_t ConnectionSupervisor::pid() const {
    std::lock_guard<std::mutex> lock(mtx);
    return process ? process->getPid() : -1;
}

void ConnectionSupervisor::connectLocked() {
    state = ConnectionState::Connecting;
    Logger::getInstance().info("Starting tool server: " + config.command);
    for (const auto& [key, value] : config.env) {
        bool secret = key.find("TOKEN") != std::string::npos || key.find("KEY") != std::string::npos;
        Logger::getInstance().debug("  env " + key + "=" + (secret ? Logger::mask(value) : value));
    }

    ServerProcess::LaunchSpec spec;
    spec.command = config.command;
    spec.args = config.args;
    spec.env = config.env;

    try {
        process = std::make_unique<ServerProcess>();
        ++spawns;
        process->start(spec, config.startupGraceMs);

        transport = std::make_unique<StdioLineTransport>(process->stdinFd(), process->stdoutFd(),
                                                         config.requestTimeoutMs);
        handshake = MCPHandshake(identity());
        handshake.initialize(*transport);
        handshake.discoverTools(*transport, catalog);
    } catch (const ToolServerError& e) {
        std::string errText = process ? process->stderrTail() : "";
        Logger::getInstance().error(std::string("Connection failed (") + errorKindName(e.kind()) + "): " + e.what());
        if (!errText.empty() && e.kind() != ErrorKind::SpawnFailed) {
            Logger::getInstance().error("Tool server stderr: " + errText);
        }
        teardownLocked();
        throw;
    } catch (const nlohmann::json::exception& e) {
        Logger::getInstance().error(std::string("Connection failed on unexpected server data: ") + e.what());
        teardownLocked();
        throw ToolServerError(ErrorKind::HandshakeFailed,
                              std::string("Tool server sent unexpected data during the handshake: ") + e.what());
    }

    state = ConnectionState::Connected;
    auto now = std::chrono::steady_clock::now();
    lastActivity = now;
    lastHealthCheck = now;
    lastHealthResult = true;
    healthCached = true;
    lastVerdict = true;
    Logger::getInstance().success("Connected to tool server (pid " + std::to_string(process->getPid()) + ", " +
                                  std::to_string(catalog.size()) + " tools)");
}

void ConnectionSupervisor::teardownLocked() {
    transport.reset();
    if (process) {
        process->terminate(config.shutdownGraceMs);
        process.reset();
    }
    catalog.clear();
    indexed.clear();
    handshake = MCPHandshake(identity());
    healthCached = false;
    lastHealthResult = false;
    lastVerdict = false;
    state = ConnectionState::Disconnected;
}

bool ConnectionSupervisor::checkHealthLocked() {
    auto now = std::chrono::steady_clock::now();
    if (healthCached && now - lastHealthCheck < std::chrono::seconds(config.healthIntervalSec)) {
        return lastHealthResult;
    }
    lastHealthResult = evaluateHealthLocked(now);
    lastHealthCheck = now;
    healthCached = true;
    lastVerdict = lastHealthResult;
    return lastHealthResult;
}

bool ConnectionSupervisor::evaluateHealthLocked(std::chrono::steady_clock::time_point now) {
    if (state != ConnectionState::Connected || !process || !transport) return false;

    if (!process->isAlive()) {
        markUnhealthyLocked("tool server process exited with code " + std::to_string(process->exitCode()));
        return false;
    }

    if (now - lastActivity >= std::chrono::seconds(config.idleProbeSec)) {
        try {
            ++probes;
            transport->probe(ILineTransport::makeRequest(transport->nextRequestId(), "ping", nlohmann::json::object()));
            lastActivity = now;
        } catch (const ToolServerError& e) {
            markUnhealthyLocked(std::string("liveness probe failed: ") + e.what());
            return false;
        }
    }
    return true;
}

void ConnectionSupervisor::ensureConnectedLocked() {
    switch (state) {
        case ConnectionState::Disconnected:
            connectLocked();
            break;
        case ConnectionState::Unhealthy:
        case ConnectionState::Connecting:
            Logger::getInstance().info("Reconnecting to tool server");
            teardownLocked();
            connectLocked();
            break;
        case ConnectionState::Connected:
            if (!checkHealthLocked()) {
                Logger::getInstance().info("Reconnecting to tool server");
                teardownLocked();
                connectLocked();
            }
            break;
    }
}

void ConnectionSupervisor::markUnhealthyLocked(const std::string& reason) {
    if (state == ConnectionState::Connected) {
        state = ConnectionState::Unhealthy;
        Logger::getInstance().warn("Tool server marked unhealthy: " + reason);
    }
    healthCached = false;
    lastVerdict = false;
}
