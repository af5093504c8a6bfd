#pragma once
#include <string>
#include <vector>
#include "mcp/RepositoryResults.h"

struct RepositoryInfo {
    std::string owner;
    std::string repo;
    std::string fullName;
};

struct SearchQueryInfo {
    std::string intent = "general";  // function_search, class_search, import_search, config_search, test_search, general
    std::vector<std::string> fileTypes;
    std::vector<std::string> keywords;
    std::string originalQuery;
};

/**
 * @brief Text helpers shared by the chat layer and the CLI.
 */
class RepoFormat {
public:
    static constexpr size_t maxShownMatches = 5;
    static constexpr size_t maxSnippetChars = 200;
    static constexpr size_t maxTreeLines = 50;

    static std::string formatSearchResults(const std::vector<SearchMatch>& matches);
    static std::string formatFileTree(const DirectoryListing& listing);

    /** Accepts "owner/repo", "https://github.com/owner/repo(.git)" and "git@github.com:owner/repo.git". */
    static RepositoryInfo extractRepositoryInfo(const std::string& location);
    static bool isValidGithubRepo(const std::string& location);

    static SearchQueryInfo parseSearchQuery(const std::string& query);

    /** Extracts "-", "*" and numbered list items, at most maxItems. */
    static std::vector<std::string> parseListItems(const std::string& text, size_t maxItems);
};
