#include <gtest/gtest.h>
#include "mcp/MCPHandshake.h"
#include "mcp/ToolServerError.h"
#include "ScriptedTransport.h"

namespace {
nlohmann::json initializeResult() {
    return {{"protocolVersion", "2024-11-05"},
            {"capabilities", {{"tools", nlohmann::json::object()}}},
            {"serverInfo", {{"name", "git-repo-research"}, {"version", "1.2.0"}}}};
}
} // namespace

TEST(MCPHandshakeTest, InitializeSendsClientIdentityAndNotification) {
    ScriptedTransport transport;
    transport.onResult("initialize", initializeResult());

    MCPHandshake::ClientIdentity id;
    id.name = "RepoScout-Test";
    id.version = "9.9";
    MCPHandshake handshake(id);
    EXPECT_EQ(handshake.getState(), MCPHandshake::State::Uninitialized);

    handshake.initialize(transport);
    EXPECT_EQ(handshake.getState(), MCPHandshake::State::Initialized);
    EXPECT_EQ(handshake.serverInfo()["name"], "git-repo-research");

    ASSERT_EQ(transport.sent.size(), 2u);
    const auto& init = transport.sent[0];
    EXPECT_EQ(init["method"], "initialize");
    EXPECT_EQ(init["params"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ(init["params"]["clientInfo"]["name"], "RepoScout-Test");
    EXPECT_EQ(init["params"]["clientInfo"]["version"], "9.9");
    EXPECT_EQ(init["params"]["capabilities"]["roots"]["listChanged"], true);
    EXPECT_TRUE(init["params"]["capabilities"].contains("sampling"));

    const auto& notification = transport.sent[1];
    EXPECT_EQ(notification["method"], "notifications/initialized");
    EXPECT_FALSE(notification.contains("id"));
}

TEST(MCPHandshakeTest, ErrorResponseIsHandshakeFailed) {
    ScriptedTransport transport;
    transport.onError("initialize", -32600, "unsupported protocol");

    MCPHandshake handshake;
    try {
        handshake.initialize(transport);
        FAIL() << "expected HandshakeFailed";
    } catch (const ToolServerError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::HandshakeFailed);
        EXPECT_NE(std::string(e.what()).find("unsupported protocol"), std::string::npos);
    }
    EXPECT_EQ(handshake.getState(), MCPHandshake::State::Uninitialized);
}

TEST(MCPHandshakeTest, TransportFailureIsHandshakeFailed) {
    ScriptedTransport transport;
    transport.onFailure("initialize", ErrorKind::TransportClosed);

    MCPHandshake handshake;
    try {
        handshake.initialize(transport);
        FAIL() << "expected HandshakeFailed";
    } catch (const ToolServerError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::HandshakeFailed);
    }
}

TEST(MCPHandshakeTest, DiscoveryFillsCatalog) {
    ScriptedTransport transport;
    transport.onResult("initialize", initializeResult());
    transport.onResult("tools/list", {{"tools", nlohmann::json::array({
        {{"name", "create_research_repository"}, {"inputSchema", {{"type", "object"}}}},
        {{"name", "search_research_repository"}, {"inputSchema", {{"type", "object"}}}}})}});

    MCPHandshake handshake;
    handshake.initialize(transport);
    ToolCatalog catalog;
    EXPECT_TRUE(handshake.discoverTools(transport, catalog));
    EXPECT_EQ(catalog.size(), 2u);
    EXPECT_TRUE(catalog.contains("search_research_repository"));
}

TEST(MCPHandshakeTest, DiscoveryFailureLeavesEmptyCatalog) {
    ScriptedTransport transport;
    transport.onResult("initialize", initializeResult());
    transport.onError("tools/list", -32601, "Method not found");

    MCPHandshake handshake;
    handshake.initialize(transport);

    ToolCatalog catalog;
    catalog.replace(nlohmann::json::array({{{"name", "stale_tool"}}}));
    EXPECT_FALSE(handshake.discoverTools(transport, catalog));
    EXPECT_TRUE(catalog.empty());
}

TEST(MCPHandshakeTest, DiscoveryTimeoutIsNotFatal) {
    ScriptedTransport transport;
    transport.onResult("initialize", initializeResult());
    transport.onFailure("tools/list", ErrorKind::Timeout);

    MCPHandshake handshake;
    handshake.initialize(transport);
    ToolCatalog catalog;
    EXPECT_NO_THROW(EXPECT_FALSE(handshake.discoverTools(transport, catalog)));
    EXPECT_TRUE(catalog.empty());
}

TEST(MCPHandshakeTest, DiscoveryRequiresInitialize) {
    ScriptedTransport transport;
    MCPHandshake handshake;
    ToolCatalog catalog;
    EXPECT_FALSE(handshake.discoverTools(transport, catalog));
    EXPECT_TRUE(transport.sent.empty());
}

TEST(MCPHandshakeTest, RecordsServerCapabilities) {
    ScriptedTransport transport;
    transport.onResult("initialize", initializeResult());

    MCPHandshake handshake;
    handshake.initialize(transport);
    EXPECT_TRUE(handshake.serverCapabilities().contains("tools"));
}

TEST(MCPHandshakeTest, UnexpectedMemberTypesAreTolerated) {
    ScriptedTransport transport;
    transport.onResult("initialize", {{"protocolVersion", 20241105},
                                      {"capabilities", nlohmann::json::array({"tools"})},
                                      {"serverInfo", {{"name", 5}}}});

    MCPHandshake handshake;
    EXPECT_NO_THROW(handshake.initialize(transport));
    EXPECT_EQ(handshake.getState(), MCPHandshake::State::Initialized);
    EXPECT_EQ(handshake.serverInfo()["name"], 5);
    EXPECT_TRUE(handshake.serverCapabilities().empty());
}
