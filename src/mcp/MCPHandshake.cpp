#include "mcp/MCPHandshake.h"
#include "mcp/ToolServerError.h"
#include "mcp/ResponseClassifier.h"
#include "utils/Logger.h"

namespace {
// Servers are not strict about member types; anything unexpected reads as the fallback.
std::string stringMember(const nlohmann::json& obj, const char* key, const std::string& fallback) {
    if (obj.is_object() && obj.contains(key) && obj[key].is_string()) return obj[key].get<std::string>();
    return fallback;
}

nlohmann::json objectMember(const nlohmann::json& obj, const char* key) {
    if (obj.is_object() && obj.contains(key) && obj[key].is_object()) return obj[key];
    return nlohmann::json::object();
}
} // namespace

void MCPHandshake::initialize(ILineTransport& transport) {
    state = State::Initializing;

    nlohmann::json params = {
        {"protocolVersion", identity.protocolVersion},
        {"capabilities", {
            {"roots", {{"listChanged", true}}},
            {"sampling", nlohmann::json::object()}
        }},
        {"clientInfo", {{"name", identity.name}, {"version", identity.version}}}
    };

    std::optional<nlohmann::json> res;
    try {
        res = transport.send(ILineTransport::makeRequest(transport.nextRequestId(), "initialize", params));
    } catch (const ToolServerError& e) {
        state = State::Uninitialized;
        throw ToolServerError(ErrorKind::HandshakeFailed,
                              std::string("initialize failed (") + errorKindName(e.kind()) + "): " + e.what(),
                              e.hint());
    }

    if (!res) {
        state = State::Uninitialized;
        throw ToolServerError(ErrorKind::HandshakeFailed, "initialize produced no response");
    }

    ResponseClass cls = classifyResponse(*res);
    if (!cls.ok()) {
        state = State::Uninitialized;
        throw ToolServerError(ErrorKind::HandshakeFailed, "Tool server rejected initialize: " + cls.message);
    }

    const auto& result = cls.payload;
    if (result.is_object()) {
        serverInfoJson = objectMember(result, "serverInfo");
        capabilitiesJson = objectMember(result, "capabilities");
        if (result.contains("protocolVersion") && result["protocolVersion"].is_string() &&
            result["protocolVersion"].get<std::string>() != identity.protocolVersion) {
            Logger::getInstance().warn("Tool server negotiated protocol " +
                                       result["protocolVersion"].get<std::string>());
        }
    }

    try {
        transport.send(ILineTransport::makeNotification("notifications/initialized", nlohmann::json::object()));
    } catch (const ToolServerError& e) {
        state = State::Uninitialized;
        throw ToolServerError(ErrorKind::HandshakeFailed,
                              std::string("initialized notification failed: ") + e.what());
    }

    state = State::Initialized;
    Logger::getInstance().info("Handshake complete with " + stringMember(serverInfoJson, "name", "tool server") +
                               " " + stringMember(serverInfoJson, "version", ""));
}

bool MCPHandshake::discoverTools(ILineTransport& transport, ToolCatalog& catalog) {
    catalog.clear();
    if (state != State::Initialized) {
        Logger::getInstance().warn("tools/list skipped: handshake not complete");
        return false;
    }

    try {
        auto res = transport.send(
            ILineTransport::makeRequest(transport.nextRequestId(), "tools/list", nlohmann::json::object()));
        if (!res) return false;

        ResponseClass cls = classifyResponse(*res);
        if (!cls.ok()) {
            Logger::getInstance().warn("tools/list failed: " + cls.message);
            return false;
        }
        if (!cls.payload.is_object() || !cls.payload.contains("tools") || !cls.payload["tools"].is_array()) {
            Logger::getInstance().warn("tools/list returned no tools array");
            return false;
        }
        catalog.replace(cls.payload["tools"]);
    } catch (const ToolServerError& e) {
        Logger::getInstance().warn(std::string("Tool discovery failed: ") + e.what());
        catalog.clear();
        return false;
    } catch (const nlohmann::json::exception& e) {
        Logger::getInstance().warn(std::string("Tool discovery returned unexpected data: ") + e.what());
        catalog.clear();
        return false;
    }

    Logger::getInstance().info("Discovered " + std::to_string(catalog.size()) + " tools");
    return true;
}
