#pragma once
#include <string>
#include <vector>
#include <map>
#include <functional>
#include <nlohmann/json.hpp>

/**
 * @brief Caller-facing actions, independent of the concrete tool that implements them.
 */
enum class LogicalOperation {
    IndexRepository,
    SearchRepository,
    FetchFile,
    ListStructure,
    SearchCode
};

const char* operationName(LogicalOperation op);

/**
 * @brief Parameters of a logical operation. Unused fields stay empty.
 */
struct OperationParams {
    std::string repository;     // location as given by the caller (URL or owner/name)
    std::string indexLocation;  // where the server stored the index, if known
    std::string query;
    int limit = 10;
    std::string filePath;
    std::string pattern;
    std::string fileType;
};

/**
 * @brief Maps logical operations onto the tool names and argument shapes of
 * the different tool-server builds.
 *
 * Each operation has an ordered candidate list and an argument-builder table
 * keyed by resolved tool name. Names without a table entry use the
 * operation's default builder.
 */
class ToolRouting {
public:
    using ArgumentBuilder = std::function<nlohmann::json(const OperationParams&)>;

    static const std::vector<std::string>& candidates(LogicalOperation op);

    static nlohmann::json buildArguments(LogicalOperation op, const std::string& toolName,
                                         const OperationParams& params);

    /** True if toolName has its own builder for op (not the default one). */
    static bool hasSpecialBuilder(LogicalOperation op, const std::string& toolName);

    /**
     * @brief Repository-local name the server clones into.
     * "https://github.com/octocat/Hello-World.git" and "octocat/Hello-World" both give "Hello-World".
     */
    static std::string repositoryLocalName(const std::string& location);

private:
    struct Route {
        std::vector<std::string> candidates;
        std::map<std::string, ArgumentBuilder> builders;
        ArgumentBuilder fallback;
    };

    static const Route& route(LogicalOperation op);
};
