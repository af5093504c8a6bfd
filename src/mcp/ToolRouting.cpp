#include "mcp/ToolRouting.h"
#include <stdexcept>

namespace {
std::string indexPathFor(const OperationParams& p) {
    if (!p.indexLocation.empty()) return p.indexLocation;
    return ToolRouting::repositoryLocalName(p.repository);
}
} // namespace

const char* operationName(LogicalOperation op) {
    switch (op) {
        case LogicalOperation::IndexRepository: return "index repository";
        case LogicalOperation::SearchRepository: return "search repository";
        case LogicalOperation::FetchFile: return "fetch file";
        case LogicalOperation::ListStructure: return "list structure";
        case LogicalOperation::SearchCode: return "search code";
    }
    return "unknown";
}

const ToolRouting::Route& ToolRouting::route(LogicalOperation op) {
    static const Route indexRoute{
        {"create_research_repository", "index_repository", "index-repository", "index_repo", "index-repo",
         "repository_index", "repo_index", "clone_and_index", "clone-and-index"},
        {
            // Research-server builds take the clone location as repository_path.
            {"create_research_repository", [](const OperationParams& p) {
                return nlohmann::json{{"repository_path", p.repository}};
            }},
        },
        [](const OperationParams& p) {
            return nlohmann::json{{"repository", p.repository}};
        }};

    static const Route searchRoute{
        {"search_research_repository", "semantic_search", "semantic-search", "search", "search_repository",
         "search-repository", "repo_search", "repo-search", "query", "find"},
        {
            {"search_research_repository", [](const OperationParams& p) {
                return nlohmann::json{{"index_path", indexPathFor(p)}, {"query", p.query}, {"limit", p.limit}};
            }},
        },
        [](const OperationParams& p) {
            return nlohmann::json{{"repository", p.repository}, {"query", p.query}, {"max_results", p.limit}};
        }};

    static const Route fetchRoute{
        {"access_file", "get_file_content", "get-file-content", "file_content", "file-content", "read_file",
         "read-file", "get_file", "get-file"},
        {
            // access_file addresses paths relative to its clone directory, not the original locator.
            {"access_file", [](const OperationParams& p) {
                std::string path = p.filePath;
                while (!path.empty() && path.front() == '/') path.erase(0, 1);
                return nlohmann::json{
                    {"filepath", repositoryLocalName(p.repository) + "/repository/" + path}};
            }},
        },
        [](const OperationParams& p) {
            return nlohmann::json{{"repository", p.repository}, {"file_path", p.filePath}};
        }};

    static const Route structureRoute{
        {"access_file", "get_repository_structure", "get-repository-structure", "repository_structure",
         "repository-structure", "repo_structure", "repo-structure", "list_files", "list-files", "tree"},
        {
            {"access_file", [](const OperationParams& p) {
                return nlohmann::json{{"filepath", repositoryLocalName(p.repository) + "/repository"}};
            }},
        },
        [](const OperationParams& p) {
            return nlohmann::json{{"repository", p.repository}};
        }};

    static const Route codeRoute{
        {"search_code", "search-code", "code_search", "code-search", "grep", "find_code", "find-code",
         "pattern_search", "pattern-search"},
        {},
        [](const OperationParams& p) {
            nlohmann::json args = {{"repository", p.repository}, {"pattern", p.pattern}};
            if (!p.fileType.empty()) args["file_type"] = p.fileType;
            return args;
        }};

    switch (op) {
        case LogicalOperation::IndexRepository: return indexRoute;
        case LogicalOperation::SearchRepository: return searchRoute;
        case LogicalOperation::FetchFile: return fetchRoute;
        case LogicalOperation::ListStructure: return structureRoute;
        case LogicalOperation::SearchCode: return codeRoute;
    }
    throw std::logic_error("unhandled logical operation");
}

const std::vector<std::string>& ToolRouting::candidates(LogicalOperation op) {
    return route(op).candidates;
}

nlohmann::json ToolRouting::buildArguments(LogicalOperation op, const std::string& toolName,
                                           const OperationParams& params) {
    const auto& r = route(op);
    auto it = r.builders.find(toolName);
    if (it != r.builders.end()) {
        return it->second(params);
    }
    return r.fallback(params);
}

bool ToolRouting::hasSpecialBuilder(LogicalOperation op, const std::string& toolName) {
    const auto& r = route(op);
    return r.builders.count(toolName) > 0;
}

std::string ToolRouting::repositoryLocalName(const std::string& location) {
    std::string s = location;
    while (!s.empty() && (s.back() == '/' || s.back() == ' ')) s.pop_back();
    const std::string gitSuffix = ".git";
    if (s.size() > gitSuffix.size() && s.compare(s.size() - gitSuffix.size(), gitSuffix.size(), gitSuffix) == 0) {
        s.erase(s.size() - gitSuffix.size());
    }
    auto slash = s.find_last_of("/:");
    if (slash != std::string::npos) {
        s = s.substr(slash + 1);
    }
    return s;
}
