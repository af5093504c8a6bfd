#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "mcp/ToolServerError.h"

/**
 * @brief Classification of a JSON-RPC response to tools/call (or any request).
 *
 * This is the only place that inspects error shapes: a top-level "error"
 * member, the MCP "isError" + content convention, or neither. Substring
 * heuristics on error text live here and nowhere else.
 */
struct ResponseClass {
    enum class Tag {
        Ok,             // result usable, see payload
        ProtocolError,  // JSON-RPC error object
        ToolReported,   // tool ran and reported a failure
        Malformed       // not a JSON-RPC response at all
    };

    using ToolErrorKind = ::ToolErrorKind;

    Tag tag = Tag::Malformed;
    ToolErrorKind toolKind = ToolErrorKind::None;
    int code = 0;
    std::string message;
    nlohmann::json payload;

    bool ok() const { return tag == Tag::Ok; }
};

ResponseClass classifyResponse(const nlohmann::json& response);

/** Buckets free-form error text reported by a tool. */
ResponseClass::ToolErrorKind classifyToolErrorText(const std::string& text);

/** User-facing suggestion for a tool error kind (empty if none). */
std::string toolErrorHint(ResponseClass::ToolErrorKind kind);

const char* toolErrorKindName(ResponseClass::ToolErrorKind kind);

/** Concatenates the "text" items of an MCP content array. */
std::string extractContentText(const nlohmann::json& result);
