#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct SearchMatch {
    std::string filePath;
    double score = 0.0;
    std::string content;
};

struct FileContent {
    std::string path;
    std::string content;
};

struct DirectoryListing {
    std::string root;
    std::vector<std::string> entries;
    std::string rawText;  // server text when it could not be split into entries
};

struct IndexResult {
    std::string repository;
    std::string indexLocation;
    std::string message;
};

/**
 * @brief Turns tools/call results into typed values.
 *
 * Servers differ in how they shape payloads: structuredContent, a JSON
 * document inside a text content item, or plain text. The parsers accept
 * all three and the common key spellings.
 */
class ResultParser {
public:
    /** The most structured view of a result: structuredContent, parsed text JSON, or the text as a JSON string. */
    static nlohmann::json decodePayload(const nlohmann::json& result);

    static std::vector<SearchMatch> parseSearch(const nlohmann::json& result);
    static FileContent parseFile(const nlohmann::json& result, const std::string& requestedPath);
    static DirectoryListing parseListing(const nlohmann::json& result, const std::string& root);
    static IndexResult parseIndex(const nlohmann::json& result, const std::string& repository);
};
