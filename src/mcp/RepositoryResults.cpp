#include "mcp/RepositoryResults.h"
#include "mcp/ResponseClassifier.h"
#include <sstream>

namespace {
std::string firstString(const nlohmann::json& obj, std::initializer_list<const char*> keys) {
    if (!obj.is_object()) return "";
    for (const char* key : keys) {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_string()) return it->get<std::string>();
    }
    return "";
}

double firstNumber(const nlohmann::json& obj, std::initializer_list<const char*> keys) {
    if (!obj.is_object()) return 0.0;
    for (const char* key : keys) {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_number()) return it->get<double>();
    }
    return 0.0;
}

const nlohmann::json* firstArray(const nlohmann::json& obj, std::initializer_list<const char*> keys) {
    if (!obj.is_object()) return nullptr;
    for (const char* key : keys) {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_array()) return &(*it);
    }
    return nullptr;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}
} // namespace

nlohmann::json ResultParser::decodePayload(const nlohmann::json& result) {
    if (!result.is_object()) return result;
    if (result.contains("structuredContent") && !result["structuredContent"].is_null()) {
        return result["structuredContent"];
    }
    if (!result.contains("content")) {
        // Older servers return the payload object directly as the result.
        return result;
    }
    std::string text = extractContentText(result);
    if (text.empty()) return nullptr;
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (!parsed.is_discarded() && (parsed.is_object() || parsed.is_array())) return parsed;
    return text;
}

std::vector<SearchMatch> ResultParser::parseSearch(const nlohmann::json& result) {
    std::vector<SearchMatch> matches;
    nlohmann::json payload = decodePayload(result);

    const nlohmann::json* items = payload.is_array() ? &payload : firstArray(payload, {"results", "matches", "items"});
    if (items) {
        for (const auto& item : *items) {
            SearchMatch m;
            if (item.is_string()) {
                m.content = item.get<std::string>();
            } else if (item.is_object()) {
                m.filePath = firstString(item, {"file_path", "path", "file", "filepath"});
                m.score = firstNumber(item, {"score", "similarity", "relevance"});
                m.content = firstString(item, {"content", "snippet", "text", "chunk"});
            } else {
                continue;
            }
            matches.push_back(std::move(m));
        }
        return matches;
    }

    if (payload.is_string()) {
        std::string text = payload.get<std::string>();
        if (!text.empty()) {
            SearchMatch m;
            m.content = text;
            matches.push_back(std::move(m));
        }
    }
    return matches;
}

FileContent ResultParser::parseFile(const nlohmann::json& result, const std::string& requestedPath) {
    FileContent file;
    file.path = requestedPath;
    nlohmann::json payload = decodePayload(result);
    if (payload.is_object()) {
        std::string path = firstString(payload, {"path", "file_path", "filepath"});
        if (!path.empty()) file.path = path;
        file.content = firstString(payload, {"content", "text", "data"});
    } else if (payload.is_string()) {
        file.content = payload.get<std::string>();
    }
    return file;
}

DirectoryListing ResultParser::parseListing(const nlohmann::json& result, const std::string& root) {
    DirectoryListing listing;
    listing.root = root;
    nlohmann::json payload = decodePayload(result);

    const nlohmann::json* items = payload.is_array() ? &payload : firstArray(payload, {"files", "entries", "items", "tree"});
    if (items) {
        for (const auto& item : *items) {
            if (item.is_string()) {
                listing.entries.push_back(item.get<std::string>());
            } else if (item.is_object()) {
                std::string name = firstString(item, {"path", "name", "file_path"});
                if (name.empty()) continue;
                if (item.value("type", std::string()) == "directory" && name.back() != '/') name += "/";
                listing.entries.push_back(name);
            }
        }
        return listing;
    }

    if (payload.is_object()) {
        std::string text = firstString(payload, {"content", "text", "structure"});
        listing.rawText = text;
        listing.entries = splitLines(text);
    } else if (payload.is_string()) {
        listing.rawText = payload.get<std::string>();
        listing.entries = splitLines(listing.rawText);
    }
    return listing;
}

IndexResult ResultParser::parseIndex(const nlohmann::json& result, const std::string& repository) {
    IndexResult index;
    index.repository = repository;
    nlohmann::json payload = decodePayload(result);
    if (payload.is_object()) {
        index.indexLocation = firstString(payload, {"index_path", "index_location", "repository_name"});
        index.message = firstString(payload, {"message", "status"});
    } else if (payload.is_string()) {
        index.message = payload.get<std::string>();
    }
    return index;
}
