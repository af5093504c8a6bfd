#include <gtest/gtest.h>
#include "mcp/ToolInvoker.h"
#include "mcp/ToolServerError.h"
#include "ScriptedTransport.h"

namespace {
nlohmann::json text(const std::string& t, bool isError = false) {
    nlohmann::json r = {{"content", nlohmann::json::array({{{"type", "text"}, {"text", t}}})}};
    if (isError) r["isError"] = true;
    return r;
}

ToolCatalog researchCatalog() {
    ToolCatalog catalog;
    catalog.replace(nlohmann::json::array({{{"name", "create_research_repository"}},
                                           {{"name", "search_research_repository"}},
                                           {{"name", "access_file"}}}));
    return catalog;
}
} // namespace

TEST(ToolInvokerTest, CallsResolvedToolWithBuiltArguments) {
    ScriptedTransport transport;
    transport.onResult("tools/call", text("{\"results\": []}"));

    OperationParams p;
    p.repository = "octocat/Hello-World";
    p.query = "greeting";
    p.limit = 3;
    auto inv = ToolInvoker::invoke(transport, researchCatalog(), LogicalOperation::SearchRepository, p);

    EXPECT_EQ(inv.toolName, "search_research_repository");
    const nlohmann::json* call = transport.lastSent("tools/call");
    ASSERT_NE(call, nullptr);
    EXPECT_EQ((*call)["params"]["name"], "search_research_repository");
    EXPECT_EQ((*call)["params"]["arguments"]["index_path"], "Hello-World");
    EXPECT_EQ((*call)["params"]["arguments"]["limit"], 3);
}

TEST(ToolInvokerTest, EachCallGetsAFreshId) {
    ScriptedTransport transport;
    transport.onResult("tools/call", text("a"));
    transport.onResult("tools/call", text("b"));

    OperationParams p;
    p.repository = "octocat/Hello-World";
    auto catalog = researchCatalog();
    ToolInvoker::invoke(transport, catalog, LogicalOperation::ListStructure, p);
    ToolInvoker::invoke(transport, catalog, LogicalOperation::ListStructure, p);

    ASSERT_EQ(transport.sent.size(), 2u);
    EXPECT_NE(transport.sent[0]["id"], transport.sent[1]["id"]);
}

TEST(ToolInvokerTest, ToolReportedErrorCarriesHint) {
    ScriptedTransport transport;
    transport.onResult("tools/call", text("Repository not indexed", true));

    OperationParams p;
    p.repository = "octocat/Hello-World";
    p.query = "x";
    try {
        ToolInvoker::invoke(transport, researchCatalog(), LogicalOperation::SearchRepository, p);
        FAIL() << "expected ToolInvocationError";
    } catch (const ToolServerError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ToolInvocationError);
        EXPECT_NE(std::string(e.what()).find("not indexed"), std::string::npos);
        EXPECT_FALSE(e.hint().empty());
    }
}

TEST(ToolInvokerTest, ProtocolErrorIsToolInvocationError) {
    ScriptedTransport transport;
    transport.onError("tools/call", -32602, "Unknown tool: access_file");

    OperationParams p;
    p.repository = "octocat/Hello-World";
    p.filePath = "README";
    try {
        ToolInvoker::invoke(transport, researchCatalog(), LogicalOperation::FetchFile, p);
        FAIL() << "expected ToolInvocationError";
    } catch (const ToolServerError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ToolInvocationError);
        EXPECT_FALSE(e.hint().empty());
    }
}

TEST(ToolInvokerTest, EmptyContentIsEmptyResult) {
    ScriptedTransport transport;
    transport.onResult("tools/call", {{"content", nlohmann::json::array()}});

    OperationParams p;
    p.repository = "octocat/Hello-World";
    try {
        ToolInvoker::invoke(transport, researchCatalog(), LogicalOperation::IndexRepository, p);
        FAIL() << "expected EmptyResult";
    } catch (const ToolServerError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::EmptyResult);
    }
}

TEST(ToolInvokerTest, NoCandidateNeverReachesTheServer) {
    ScriptedTransport transport;
    OperationParams p;
    p.repository = "octocat/Hello-World";
    p.pattern = "main";
    try {
        ToolInvoker::invoke(transport, researchCatalog(), LogicalOperation::SearchCode, p);
        FAIL() << "expected NoSuchToolAvailable";
    } catch (const ToolServerError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NoSuchToolAvailable);
    }
    EXPECT_TRUE(transport.sent.empty());
}

TEST(ToolInvokerTest, EmptyResultDetection) {
    EXPECT_TRUE(ToolInvoker::isEmptyResult(nullptr));
    EXPECT_TRUE(ToolInvoker::isEmptyResult(text("")));
    EXPECT_FALSE(ToolInvoker::isEmptyResult(text("x")));
    EXPECT_FALSE(ToolInvoker::isEmptyResult({{"structuredContent", {{"results", nlohmann::json::array()}}}}));
    EXPECT_FALSE(ToolInvoker::isEmptyResult({{"results", nlohmann::json::array()}}));
    EXPECT_TRUE(ToolInvoker::isEmptyResult(nlohmann::json::object()));
}
