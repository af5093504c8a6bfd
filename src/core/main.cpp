#include <iostream>
#include <string>
#include <memory>
#include <vector>
#include <sstream>
#include <filesystem>
#include "core/ConfigManager.h"
#include "core/LLMClient.h"
#include "core/ChatSession.h"
#include "mcp/RepositoryClient.h"
#include "utils/RepoFormat.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

// ANSI Color Codes
const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string RED = "\033[38;5;196m";
const std::string GREEN = "\033[38;5;46m";
const std::string YELLOW = "\033[38;5;226m";
const std::string CYAN = "\033[38;5;51m";
const std::string ITALIC = "\033[3m";
const std::string GRAY = "\033[38;5;242m";

void printLogo() {
    std::string frame = CYAN + "  ==================================================" + RESET;
    std::cout << "\n" << frame << std::endl;
    std::cout << CYAN << BOLD << "     RepoScout" << RESET << GRAY << "  repository research chat" << RESET << std::endl;
    std::cout << frame << std::endl;
    std::cout << GRAY << "        ─── " << ITALIC << "type /help for commands" << RESET << GRAY << " ───\n" << std::endl;
}

void printUsage() {
    std::cout << "Usage: reposcout [config_path]" << std::endl;
}

void printHelp() {
    std::cout << GRAY
              << "  /connect            start the tool server\n"
              << "  /disconnect         stop the tool server\n"
              << "  /health             connection health\n"
              << "  /tools              tools advertised by the server\n"
              << "  /repo <owner/name>  set the active repository\n"
              << "  /index              index the active repository\n"
              << "  /file <path>        show a file of the active repository\n"
              << "  /tree               show the repository structure\n"
              << "  /grep <pattern>     search code by pattern\n"
              << "  /suggest            suggest search queries\n"
              << "  /clear              clear the conversation\n"
              << "  /quit               exit\n"
              << "  anything else is a question about the repository" << RESET << std::endl;
}

template <typename T>
void printFailure(const Outcome<T>& outcome) {
    if (outcome.empty()) {
        std::cout << YELLOW << "  (no results) " << outcome.message << RESET << std::endl;
        return;
    }
    std::cout << RED << "✖ " << errorKindName(outcome.kind) << ": " << outcome.message << RESET << std::endl;
    if (!outcome.hint.empty()) {
        std::cout << GRAY << "  hint: " << outcome.hint << RESET << std::endl;
    }
}

std::string resolveConfigPath(int argc, char* argv[]) {
    if (argc >= 2) return argv[1];
    if (fs::exists(fs::u8path("config.json"))) return "config.json";
    if (fs::exists(fs::u8path("../config.json"))) return "../config.json";
    return "config.json";
}

int main(int argc, char* argv[]) {
    printLogo();

    std::string configPath = resolveConfigPath(argc, argv);
    Config cfg;
    try {
        if (!fs::exists(fs::u8path(configPath))) {
            throw std::runtime_error("Configuration file not found: " + configPath);
        }
        cfg = Config::load(configPath);
        std::cout << GREEN << "✔ Loaded configuration from: " << BOLD << configPath << RESET << std::endl;
    } catch (const std::exception& e) {
        std::cerr << RED << "✖ Failed to load config: " << e.what() << RESET << std::endl;
        printUsage();
        return 1;
    }

    cfg.applyEnvironment();
    Logger::getInstance().setLevel(Logger::parseLevel(cfg.logging.level));
    Logger::getInstance().setLogFile(cfg.logging.file);
    for (const auto& problem : cfg.validate()) {
        std::cout << YELLOW << "  ⚠ " << problem << RESET << std::endl;
    }
    auto token = cfg.toolServer.env.find("GITHUB_TOKEN");
    if (token != cfg.toolServer.env.end()) {
        Logger::getInstance().info("Using GitHub token " + Logger::mask(token->second));
    }

    LLMClient llm(cfg.llm.apiKey, cfg.llm.baseUrl, cfg.llm.model);
    llm.setSystemRole(cfg.llm.systemRole);
    llm.setMaxTokens(cfg.llm.maxTokens);
    llm.setTemperature(cfg.llm.temperature);

    RepositoryClient client(cfg.toolServer);
    client.startHealthMonitor();

    ChatSession session(llm, &client, cfg.chat.maxResults);
    if (!cfg.chat.repository.empty()) {
        session.setRepository(cfg.chat.repository);
        std::cout << GRAY << "  Active repository: " << cfg.chat.repository << RESET << std::endl;
    }

    std::string userInput;
    while (true) {
        std::string repoTag = session.getRepository().empty() ? "" : GRAY + "(" + session.getRepository() + ") " + RESET;
        std::cout << "\n" << repoTag << CYAN << BOLD << "❯ " << RESET << std::flush;
        if (!std::getline(std::cin, userInput)) break;
        if (userInput.empty()) continue;

        std::istringstream iss(userInput);
        std::string command;
        iss >> command;
        std::string argument;
        std::getline(iss, argument);
        size_t start = argument.find_first_not_of(' ');
        argument = start == std::string::npos ? "" : argument.substr(start);

        if (command == "/quit" || command == "/exit" || userInput == "exit") break;

        if (command == "/help") {
            printHelp();
        } else if (command == "/connect") {
            auto outcome = client.connect();
            if (outcome.ok()) {
                std::cout << GREEN << "✔ Connected (" << client.getSupervisor().toolNames().size() << " tools)" << RESET
                          << std::endl;
            } else {
                printFailure(outcome);
            }
        } else if (command == "/disconnect") {
            auto outcome = client.disconnect();
            if (outcome.ok()) std::cout << GREEN << "✔ Disconnected" << RESET << std::endl;
            else printFailure(outcome);
        } else if (command == "/health") {
            bool healthy = client.checkHealth();
            auto& sup = client.getSupervisor();
            std::cout << (healthy ? GREEN + "✔ healthy" : RED + "✖ not healthy") << RESET << GRAY << "  state="
                      << connectionStateName(sup.getState()) << " pid=" << sup.pid() << " spawns=" << sup.spawnCount()
                      << " probes=" << sup.probeCount() << RESET << std::endl;
            auto info = sup.serverInfo();
            if (!info.empty()) std::cout << GRAY << "  server: " << info.dump() << RESET << std::endl;
        } else if (command == "/tools") {
            auto names = client.getSupervisor().toolNames();
            if (names.empty()) std::cout << YELLOW << "  No tools known (connect first)" << RESET << std::endl;
            for (const auto& name : names) std::cout << "  - " << name << std::endl;
        } else if (command == "/repo") {
            if (!RepoFormat::isValidGithubRepo(argument)) {
                std::cout << RED << "✖ Expected owner/name or a GitHub URL" << RESET << std::endl;
                continue;
            }
            session.setRepository(argument);
            std::cout << GREEN << "✔ Active repository: " << RepoFormat::extractRepositoryInfo(argument).fullName
                      << RESET << std::endl;
        } else if (command == "/index") {
            std::cout << GRAY << "  Indexing, this can take several minutes..." << RESET << std::endl;
            auto outcome = session.indexRepository();
            if (outcome.ok()) {
                std::cout << GREEN << "✔ Indexed at " << outcome.value.indexLocation << RESET << std::endl;
                if (!outcome.value.message.empty()) std::cout << GRAY << "  " << outcome.value.message << RESET << std::endl;
            } else {
                printFailure(outcome);
            }
        } else if (command == "/file") {
            auto outcome = client.fetchFile(session.getRepository(), argument);
            if (outcome.ok()) std::cout << outcome.value.content << std::endl;
            else printFailure(outcome);
        } else if (command == "/tree") {
            auto outcome = client.listStructure(session.getRepository());
            if (outcome.ok()) std::cout << RepoFormat::formatFileTree(outcome.value) << std::endl;
            else printFailure(outcome);
        } else if (command == "/grep") {
            auto outcome = client.searchCode(session.getRepository(), argument);
            if (outcome.ok()) {
                std::cout << RepoFormat::formatSearchResults(outcome.value) << std::endl;
                std::cout << session.analyzeResults(argument, outcome.value) << std::endl;
            } else {
                printFailure(outcome);
            }
        } else if (command == "/suggest") {
            auto info = RepoFormat::extractRepositoryInfo(session.getRepository());
            auto queries = session.suggestQueries("Repository: " + info.fullName);
            if (queries.empty()) std::cout << YELLOW << "  No suggestions available" << RESET << std::endl;
            for (const auto& q : queries) std::cout << "  - " << q << std::endl;
        } else if (command == "/clear") {
            session.clear();
            std::cout << GRAY << "  Conversation cleared" << RESET << std::endl;
        } else if (!command.empty() && command[0] == '/') {
            std::cout << YELLOW << "  Unknown command " << command << RESET << std::endl;
            printHelp();
        } else {
            std::cout << session.handleUserInput(userInput) << std::endl;
        }
    }

    client.stopHealthMonitor();
    client.disconnect();
    return 0;
}
