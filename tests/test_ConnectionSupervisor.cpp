#include <gtest/gtest.h>
#include "mcp/ConnectionSupervisor.h"
#include "mcp/HealthMonitor.h"
#include "mcp/ToolServerError.h"
#include "FakeServer.h"
#include <algorithm>
#include <thread>
#include <chrono>
#include <signal.h>

namespace {
bool hasTool(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

void killAndWait(pid_t pid) {
    ASSERT_GT(pid, 0);
    kill(pid, SIGKILL);
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
}
} // namespace

TEST(ConnectionSupervisorTest, HealthFollowsConnectDisconnectCycles) {
    ConnectionSupervisor supervisor(fakeServerConfig("research"));
    for (int i = 0; i < 3; ++i) {
        supervisor.connect();
        EXPECT_EQ(supervisor.getState(), ConnectionState::Connected);
        EXPECT_TRUE(supervisor.checkHealth());

        supervisor.disconnect();
        EXPECT_EQ(supervisor.getState(), ConnectionState::Disconnected);
        EXPECT_FALSE(supervisor.checkHealth());
    }
    EXPECT_EQ(supervisor.spawnCount(), 3);
}

TEST(ConnectionSupervisorTest, ConnectDiscoversToolsAndServerInfo) {
    ConnectionSupervisor supervisor(fakeServerConfig("research"));
    supervisor.connect();

    auto names = supervisor.toolNames();
    EXPECT_EQ(names.size(), 3u);
    EXPECT_TRUE(hasTool(names, "search_research_repository"));
    EXPECT_EQ(supervisor.serverInfo()["name"], "fake-tool-server");
    EXPECT_GT(supervisor.pid(), 0);

    supervisor.disconnect();
    EXPECT_TRUE(supervisor.toolNames().empty());
    EXPECT_EQ(supervisor.pid(), -1);
}

TEST(ConnectionSupervisorTest, ConnectIsIdempotent) {
    ConnectionSupervisor supervisor(fakeServerConfig("research"));
    supervisor.connect();
    pid_t first = supervisor.pid();
    supervisor.connect();
    EXPECT_EQ(supervisor.pid(), first);
    EXPECT_EQ(supervisor.spawnCount(), 1);

    supervisor.disconnect();
    supervisor.disconnect();
    EXPECT_EQ(supervisor.getState(), ConnectionState::Disconnected);
}

TEST(ConnectionSupervisorTest, ConcurrentEnsureConnectedSpawnsOnce) {
    ConnectionSupervisor supervisor(fakeServerConfig("research"));
    std::thread a([&] { supervisor.ensureConnected(); });
    std::thread b([&] { supervisor.ensureConnected(); });
    a.join();
    b.join();

    EXPECT_EQ(supervisor.spawnCount(), 1);
    EXPECT_EQ(supervisor.getState(), ConnectionState::Connected);
}

TEST(ConnectionSupervisorTest, ImmediateExitIsSpawnFailed) {
    ConnectionSupervisor supervisor(fakeServerConfig("exit-immediately"));
    try {
        supervisor.connect();
        FAIL() << "expected SpawnFailed";
    } catch (const ToolServerError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SpawnFailed);
        std::string message = e.what();
        EXPECT_NE(message.find("exit code: 3"), std::string::npos) << message;
        EXPECT_NE(message.find("GITHUB_TOKEN rejected"), std::string::npos) << message;
        EXPECT_FALSE(e.hint().empty());
    }
    EXPECT_EQ(supervisor.getState(), ConnectionState::Disconnected);
    EXPECT_EQ(supervisor.pid(), -1);
}

TEST(ConnectionSupervisorTest, MissingBinaryIsSpawnFailed) {
    ToolServerConfig config = fakeServerConfig("research");
    config.command = "/nonexistent/reposcout-no-such-server";
    ConnectionSupervisor supervisor(config);
    try {
        supervisor.connect();
        FAIL() << "expected SpawnFailed";
    } catch (const ToolServerError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SpawnFailed);
        EXPECT_NE(e.hint().find("uvx"), std::string::npos) << e.hint();
    }
    EXPECT_EQ(supervisor.getState(), ConnectionState::Disconnected);
}

TEST(ConnectionSupervisorTest, EnvironmentOverridesReachTheChild) {
    ToolServerConfig config = fakeServerConfig("research");
    config.env["REPOSCOUT_TEST_MARK"] = "mark-42";
    ConnectionSupervisor supervisor(config);
    supervisor.connect();
    EXPECT_EQ(supervisor.serverInfo()["mark"], "mark-42");
}

TEST(ConnectionSupervisorTest, HealthIsCachedWithinInterval) {
    ConnectionSupervisor supervisor(fakeServerConfig("research"));
    supervisor.connect();
    EXPECT_TRUE(supervisor.checkHealth());

    killAndWait(supervisor.pid());
    // Inside the 30 s window the previous verdict stands.
    EXPECT_TRUE(supervisor.checkHealth());
    EXPECT_EQ(supervisor.probeCount(), 0);
    EXPECT_EQ(supervisor.getState(), ConnectionState::Connected);
}

TEST(ConnectionSupervisorTest, DeadProcessMakesConnectionUnhealthy) {
    ToolServerConfig config = fakeServerConfig("research");
    config.healthIntervalSec = 0;
    ConnectionSupervisor supervisor(config);
    supervisor.connect();

    killAndWait(supervisor.pid());
    EXPECT_FALSE(supervisor.checkHealth());
    EXPECT_EQ(supervisor.getState(), ConnectionState::Unhealthy);

    supervisor.ensureConnected();
    EXPECT_EQ(supervisor.getState(), ConnectionState::Connected);
    EXPECT_EQ(supervisor.spawnCount(), 2);
    EXPECT_TRUE(supervisor.checkHealth());
}

TEST(ConnectionSupervisorTest, IdleProbeDoesNotDisturbLaterCalls) {
    ToolServerConfig config = fakeServerConfig("research");
    config.healthIntervalSec = 0;
    config.idleProbeSec = 0;
    ConnectionSupervisor supervisor(config);
    supervisor.connect();

    EXPECT_TRUE(supervisor.checkHealth());
    EXPECT_TRUE(supervisor.checkHealth());
    EXPECT_EQ(supervisor.probeCount(), 2);

    // The ping replies are still queued; the call must skip them.
    OperationParams p;
    p.repository = "octocat/Hello-World";
    p.query = "hello";
    auto inv = supervisor.invokeWithRetry(LogicalOperation::SearchRepository, p);
    EXPECT_EQ(inv.toolName, "search_research_repository");
    EXPECT_EQ(supervisor.spawnCount(), 1);
}

TEST(ConnectionSupervisorTest, NoToolsIsNotRetried) {
    ConnectionSupervisor supervisor(fakeServerConfig("none"));
    OperationParams p;
    p.repository = "octocat/Hello-World";
    p.query = "hello";
    try {
        supervisor.invokeWithRetry(LogicalOperation::SearchRepository, p);
        FAIL() << "expected NoSuchToolAvailable";
    } catch (const ToolServerError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NoSuchToolAvailable);
    }
    EXPECT_EQ(supervisor.spawnCount(), 1);
    EXPECT_EQ(supervisor.getState(), ConnectionState::Connected);
}

TEST(ConnectionSupervisorTest, CrashingServerIsRetriedThenReported) {
    ConnectionSupervisor supervisor(fakeServerConfig("crash"));
    OperationParams p;
    p.repository = "octocat/Hello-World";
    p.query = "hello";
    try {
        supervisor.invokeWithRetry(LogicalOperation::SearchRepository, p);
        FAIL() << "expected a transport failure";
    } catch (const ToolServerError& e) {
        EXPECT_TRUE(isTransportFailure(e.kind())) << errorKindName(e.kind());
    }
    // First attempt plus two retries, each on a fresh process.
    EXPECT_EQ(supervisor.spawnCount(), 3);
    EXPECT_EQ(supervisor.getState(), ConnectionState::Unhealthy);
}

TEST(ConnectionSupervisorTest, IndexRetriedOnce) {
    ConnectionSupervisor supervisor(fakeServerConfig("crash"));
    OperationParams p;
    p.repository = "octocat/Hello-World";
    EXPECT_THROW(supervisor.invokeWithRetry(LogicalOperation::IndexRepository, p), ToolServerError);
    EXPECT_EQ(supervisor.spawnCount(), 2);
}

TEST(ConnectionSupervisorTest, SearchUsesRecordedIndexLocation) {
    ConnectionSupervisor supervisor(fakeServerConfig("research"));
    supervisor.connect();
    supervisor.recordIndexed("octocat/Hello-World", "indexes/Hello-World");

    OperationParams p;
    p.repository = "octocat/Hello-World";
    p.query = "hello";
    p.indexLocation = supervisor.indexLocationFor(p.repository).value_or("");
    auto inv = supervisor.invokeWithRetry(LogicalOperation::SearchRepository, p);
    EXPECT_EQ(inv.arguments["index_path"], "indexes/Hello-World");

    supervisor.disconnect();
    EXPECT_TRUE(supervisor.indexedRepositories().empty());
    EXPECT_FALSE(supervisor.indexLocationFor("octocat/Hello-World").has_value());
}

TEST(ConnectionSupervisorTest, SweepReconnectsUnhealthyConnection) {
    ToolServerConfig config = fakeServerConfig("research");
    config.healthIntervalSec = 0;
    ConnectionSupervisor supervisor(config);

    // Never connected: the sweep leaves it alone.
    EXPECT_FALSE(supervisor.sweep());
    EXPECT_EQ(supervisor.spawnCount(), 0);

    supervisor.connect();
    killAndWait(supervisor.pid());
    EXPECT_TRUE(supervisor.sweep());
    EXPECT_EQ(supervisor.spawnCount(), 2);
    EXPECT_EQ(supervisor.getState(), ConnectionState::Connected);
}

TEST(ConnectionSupervisorTest, HealthMonitorRunsSweeps) {
    ConnectionSupervisor supervisor(fakeServerConfig("research"));
    HealthMonitor monitor(supervisor, 1);
    monitor.start();
    EXPECT_TRUE(monitor.isRunning());
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    monitor.stop();
    EXPECT_FALSE(monitor.isRunning());
    EXPECT_GE(monitor.sweepCount(), 1);
    EXPECT_EQ(supervisor.spawnCount(), 0);

    HealthMonitor disabled(supervisor, 0);
    disabled.start();
    EXPECT_FALSE(disabled.isRunning());
}

TEST(ConnectionSupervisorTest, OddlyTypedServerDataDoesNotBreakConnect) {
    ConnectionSupervisor supervisor(fakeServerConfig("odd-types"));
    supervisor.connect();
    EXPECT_EQ(supervisor.getState(), ConnectionState::Connected);
    EXPECT_EQ(supervisor.serverInfo()["name"], 5);

    // isError arrives as a string; the result is treated as a normal reply.
    OperationParams p;
    p.repository = "octocat/Hello-World";
    p.query = "hello";
    auto inv = supervisor.invokeWithRetry(LogicalOperation::SearchRepository, p);
    EXPECT_EQ(inv.toolName, "search_research_repository");
    EXPECT_EQ(supervisor.spawnCount(), 1);
}

TEST(ConnectionSupervisorTest, UnknownToolRefreshesCatalogBeforeRetry) {
    ConnectionSupervisor supervisor(fakeServerConfig("stale"));
    OperationParams p;
    p.repository = "octocat/Hello-World";
    p.query = "hello";
    try {
        supervisor.invokeWithRetry(LogicalOperation::SearchRepository, p);
        FAIL() << "expected ToolInvocationError";
    } catch (const ToolServerError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ToolInvocationError);
        EXPECT_EQ(e.toolKind(), ToolErrorKind::UnknownTool);
    }
    // Each retry ran against a freshly discovered catalog.
    EXPECT_EQ(supervisor.spawnCount(), 3);
    EXPECT_EQ(supervisor.getState(), ConnectionState::Connected);
}
