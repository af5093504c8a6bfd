#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "mcp/LineTransport.h"
#include "mcp/ToolCatalog.h"

/**
 * @brief initialize / notifications/initialized exchange and tools/list discovery.
 */
class MCPHandshake {
public:
    enum class State { Uninitialized, Initializing, Initialized };

    struct ClientIdentity {
        std::string name = "RepoScout";
        std::string version = "1.0.0";
        std::string protocolVersion = "2024-11-05";
    };

    MCPHandshake() : MCPHandshake(ClientIdentity{}) {}
    explicit MCPHandshake(ClientIdentity identity) : identity(std::move(identity)) {}

    /**
     * @brief Runs initialize then sends the initialized notification.
     * Throws ToolServerError(HandshakeFailed) on any failure.
     */
    void initialize(ILineTransport& transport);

    /**
     * @brief tools/list into the catalog. Never throws: on failure the
     * catalog is left empty and false is returned.
     */
    bool discoverTools(ILineTransport& transport, ToolCatalog& catalog);

    State getState() const { return state; }
    const nlohmann::json& serverInfo() const { return serverInfoJson; }
    const nlohmann::json& serverCapabilities() const { return capabilitiesJson; }

private:
    ClientIdentity identity;
    State state = State::Uninitialized;
    nlohmann::json serverInfoJson = nlohmann::json::object();
    nlohmann::json capabilitiesJson = nlohmann::json::object();
};
