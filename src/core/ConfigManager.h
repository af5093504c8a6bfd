#pragma once
#include <string>
#include <vector>
#include <map>
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "mcp/ToolServerConfig.h"

struct Config {
    struct LLM {
        std::string apiKey;
        std::string baseUrl = "https://api.openai.com/v1";
        std::string model = "gpt-4o-mini";
        std::string systemRole;
        int maxTokens = 4000;
        double temperature = 0.1;
    } llm;

    ToolServerConfig toolServer;

    struct Chat {
        std::string repository;
        int maxResults = 10;
    } chat;

    struct Logging {
        std::string level = "info";
        std::string file = "reposcout.log";
    } logging;

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }

        try {
            return fromJson(j);
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid config " + path.string() + ": " + e.what());
        }
    }

    static Config fromJson(const nlohmann::json& j) {
        Config cfg;
        const auto& llm = j.at("llm");
        cfg.llm.apiKey = llm.value("api_key", "");
        cfg.llm.baseUrl = llm.at("base_url").get<std::string>();
        cfg.llm.model = llm.at("model").get<std::string>();
        cfg.llm.systemRole = llm.value("system_role", "");
        cfg.llm.maxTokens = llm.value("max_tokens", 4000);
        cfg.llm.temperature = llm.value("temperature", 0.1);

        if (j.contains("tool_server")) {
            const auto& ts = j["tool_server"];
            ToolServerConfig& t = cfg.toolServer;
            t.command = ts.value("command", t.command);
            if (ts.contains("args")) {
                t.args = ts["args"].get<std::vector<std::string>>();
            }
            if (ts.contains("env")) {
                t.env = ts["env"].get<std::map<std::string, std::string>>();
            }
            t.startupGraceMs = ts.value("startup_grace_ms", t.startupGraceMs);
            t.requestTimeoutMs = ts.value("request_timeout_ms", t.requestTimeoutMs);
            t.shutdownGraceMs = ts.value("shutdown_grace_ms", t.shutdownGraceMs);
            t.healthIntervalSec = ts.value("health_interval_sec", t.healthIntervalSec);
            t.idleProbeSec = ts.value("idle_probe_sec", t.idleProbeSec);
            t.callDeadlineSec = ts.value("call_deadline_sec", t.callDeadlineSec);
            t.sweepIntervalSec = ts.value("sweep_interval_sec", t.sweepIntervalSec);
            t.clientName = ts.value("client_name", t.clientName);
            t.clientVersion = ts.value("client_version", t.clientVersion);
            t.protocolVersion = ts.value("protocol_version", t.protocolVersion);
        }

        if (j.contains("retry")) {
            const auto& r = j["retry"];
            RetryPolicy& p = cfg.toolServer.retry;
            p.indexRetries = r.value("index_retries", p.indexRetries);
            p.searchRetries = r.value("search_retries", p.searchRetries);
            p.otherRetries = r.value("other_retries", p.otherRetries);
            p.pauseMs = r.value("pause_ms", p.pauseMs);
        }

        if (j.contains("chat")) {
            cfg.chat.repository = j["chat"].value("repository", "");
            cfg.chat.maxResults = j["chat"].value("max_results", 10);
        }

        if (j.contains("logging")) {
            cfg.logging.level = j["logging"].value("level", cfg.logging.level);
            cfg.logging.file = j["logging"].value("file", cfg.logging.file);
        }
        return cfg;
    }

    /** Fills tool-server credentials and the LLM key from the process environment where unset. */
    void applyEnvironment() {
        auto fromEnv = [](const char* name) -> std::string {
            const char* v = std::getenv(name);
            return v ? std::string(v) : std::string();
        };
        auto setDefault = [this](const std::string& key, const std::string& value) {
            if (!value.empty() && toolServer.env.find(key) == toolServer.env.end()) {
                toolServer.env[key] = value;
            }
        };

        setDefault("GITHUB_TOKEN", fromEnv("GITHUB_TOKEN"));
        std::string region = fromEnv("AWS_REGION");
        setDefault("AWS_REGION", region.empty() ? "us-west-2" : region);
        std::string profile = fromEnv("AWS_PROFILE");
        setDefault("AWS_PROFILE", profile.empty() ? "default" : profile);
        std::string level = fromEnv("FASTMCP_LOG_LEVEL");
        setDefault("FASTMCP_LOG_LEVEL", level.empty() ? "ERROR" : level);

        if (llm.apiKey.empty()) {
            llm.apiKey = fromEnv("LLM_API_KEY");
        }
    }

    /** Human-readable configuration problems; empty when usable. */
    std::vector<std::string> validate() const {
        std::vector<std::string> problems;
        if (toolServer.command.empty()) {
            problems.push_back("tool_server.command is empty");
        }
        auto token = toolServer.env.find("GITHUB_TOKEN");
        if (token == toolServer.env.end() || token->second.empty()) {
            problems.push_back("GITHUB_TOKEN is not set");
        } else if (token->second.find("your_") == 0 || token->second.find("<") == 0) {
            problems.push_back("GITHUB_TOKEN still holds a placeholder value");
        }
        if (toolServer.startupGraceMs <= 0) problems.push_back("tool_server.startup_grace_ms must be positive");
        if (toolServer.requestTimeoutMs <= 0) problems.push_back("tool_server.request_timeout_ms must be positive");
        if (toolServer.shutdownGraceMs <= 0) problems.push_back("tool_server.shutdown_grace_ms must be positive");
        if (toolServer.callDeadlineSec <= 0) problems.push_back("tool_server.call_deadline_sec must be positive");
        if (toolServer.healthIntervalSec < 0) problems.push_back("tool_server.health_interval_sec must not be negative");
        if (chat.maxResults <= 0) problems.push_back("chat.max_results must be positive");
        if (llm.apiKey.empty()) problems.push_back("llm.api_key is not set (and LLM_API_KEY is empty)");
        return problems;
    }
};
