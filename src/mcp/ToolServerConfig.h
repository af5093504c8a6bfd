#pragma once
#include <string>
#include <vector>
#include <map>
#include "mcp/ToolRouting.h"

/**
 * @brief How many times each operation is retried after its first attempt.
 */
struct RetryPolicy {
    int indexRetries = 1;
    int searchRetries = 2;
    int otherRetries = 1;
    int pauseMs = 1000;

    int retriesFor(LogicalOperation op) const {
        switch (op) {
            case LogicalOperation::IndexRepository: return indexRetries;
            case LogicalOperation::SearchRepository: return searchRetries;
            default: return otherRetries;
        }
    }
};

/**
 * @brief Everything the supervisor needs to launch and talk to the tool server.
 * Protocol code never reads the environment; overrides are collected here.
 */
struct ToolServerConfig {
    std::string command = "uvx";
    std::vector<std::string> args = {"awslabs.git-repo-research-mcp-server@latest"};
    std::map<std::string, std::string> env;

    int startupGraceMs = 2000;
    int requestTimeoutMs = 30000;
    int shutdownGraceMs = 5000;
    int healthIntervalSec = 30;
    int idleProbeSec = 300;
    int callDeadlineSec = 120;
    int sweepIntervalSec = 60;

    std::string clientName = "RepoScout";
    std::string clientVersion = "1.0.0";
    std::string protocolVersion = "2024-11-05";

    RetryPolicy retry;
};
