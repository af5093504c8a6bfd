#include "mcp/ResponseClassifier.h"
#include <algorithm>
#include <cctype>

namespace {
std::string toLower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool containsAny(const std::string& haystack, std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (haystack.find(n) != std::string::npos) return true;
    }
    return false;
}

std::string errorObjectMessage(const nlohmann::json& error) {
    if (error.is_string()) return error.get<std::string>();
    if (error.is_object()) {
        if (error.contains("message") && error["message"].is_string()) {
            return error["message"].get<std::string>();
        }
        return error.dump();
    }
    return "Unknown error";
}
} // namespace

std::string extractContentText(const nlohmann::json& result) {
    if (!result.is_object() || !result.contains("content") || !result["content"].is_array()) return "";
    std::string text;
    for (const auto& item : result["content"]) {
        if (item.is_object() && item.contains("text") && item["text"].is_string()) {
            if (!text.empty()) text += "\n";
            text += item["text"].get<std::string>();
        }
    }
    return text;
}

ResponseClass::ToolErrorKind classifyToolErrorText(const std::string& text) {
    using Kind = ResponseClass::ToolErrorKind;
    std::string lower = toLower(text);
    if (containsAny(lower, {"unknown tool", "tool not found", "no such tool"})) return Kind::UnknownTool;
    if (containsAny(lower, {"not indexed", "index not found", "no index"})) return Kind::NotIndexed;
    if (containsAny(lower, {"repository not found", "repo not found", "not found", "does not exist"})) {
        return Kind::RepositoryNotFound;
    }
    if (containsAny(lower, {"unauthorized", "authentication", "bad credentials", "forbidden", "token",
                            "credentials"})) {
        return Kind::Authentication;
    }
    if (containsAny(lower, {"validation error", "invalid argument", "invalid params", "missing required",
                            "field required", "unexpected keyword"})) {
        return Kind::InvalidArguments;
    }
    return Kind::Other;
}

std::string toolErrorHint(ResponseClass::ToolErrorKind kind) {
    using Kind = ResponseClass::ToolErrorKind;
    switch (kind) {
        case Kind::UnknownTool:
            return "The connected tool server does not recognize this tool; reconnecting refreshes the tool list.";
        case Kind::NotIndexed:
            return "The repository may not be indexed yet. Index it first.";
        case Kind::RepositoryNotFound:
            return "Check the repository name or path; it must be accessible to the tool server.";
        case Kind::Authentication:
            return "Check GITHUB_TOKEN and the AWS credentials passed to the tool server.";
        case Kind::InvalidArguments:
            return "The tool rejected its arguments; the server version may expect different parameter names.";
        default:
            return "";
    }
}

const char* toolErrorKindName(ResponseClass::ToolErrorKind kind) {
    using Kind = ResponseClass::ToolErrorKind;
    switch (kind) {
        case Kind::None: return "none";
        case Kind::UnknownTool: return "unknown tool";
        case Kind::RepositoryNotFound: return "repository not found";
        case Kind::NotIndexed: return "not indexed";
        case Kind::InvalidArguments: return "invalid arguments";
        case Kind::Authentication: return "authentication";
        case Kind::Other: return "other";
    }
    return "other";
}

ResponseClass classifyResponse(const nlohmann::json& response) {
    ResponseClass c;
    if (!response.is_object()) {
        c.tag = ResponseClass::Tag::Malformed;
        c.message = "Response is not a JSON object";
        return c;
    }

    if (response.contains("error") && !response["error"].is_null()) {
        const auto& error = response["error"];
        c.tag = ResponseClass::Tag::ProtocolError;
        c.message = errorObjectMessage(error);
        if (error.is_object() && error.contains("code") && error["code"].is_number_integer()) {
            c.code = error["code"].get<int>();
        }
        // Some servers answer an unknown tools/call name with a protocol error.
        if (classifyToolErrorText(c.message) == ResponseClass::ToolErrorKind::UnknownTool) {
            c.toolKind = ResponseClass::ToolErrorKind::UnknownTool;
        }
        return c;
    }

    if (!response.contains("result")) {
        c.tag = ResponseClass::Tag::Malformed;
        c.message = "Response carries neither result nor error";
        return c;
    }

    const auto& result = response["result"];
    if (result.is_object() && result.contains("isError") && result["isError"].is_boolean() &&
        result["isError"].get<bool>()) {
        c.tag = ResponseClass::Tag::ToolReported;
        c.message = extractContentText(result);
        if (c.message.empty()) c.message = "Tool reported an error without a message";
        c.toolKind = classifyToolErrorText(c.message);
        return c;
    }

    c.tag = ResponseClass::Tag::Ok;
    c.payload = result;
    return c;
}
