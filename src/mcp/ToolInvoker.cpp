#include "mcp/ToolInvoker.h"
#include "mcp/ToolServerError.h"
#include "mcp/ResponseClassifier.h"
#include "utils/Logger.h"

std::string ToolInvoker::resolve(const ToolCatalog& catalog, LogicalOperation op) {
    auto name = catalog.resolve(ToolRouting::candidates(op));
    if (name) return *name;

    std::string available;
    for (const auto& n : catalog.names()) {
        if (!available.empty()) available += ", ";
        available += n;
    }
    if (available.empty()) available = "none";
    throw ToolServerError(ErrorKind::NoSuchToolAvailable,
                          std::string("No tool available to ") + operationName(op) + ". Available tools: " + available,
                          "The connected tool server version may not support this operation.");
}

bool ToolInvoker::isEmptyResult(const nlohmann::json& result) {
    if (result.is_null()) return true;
    if (!result.is_object()) return false;
    if (result.contains("structuredContent") && !result["structuredContent"].is_null()) return false;
    if (result.contains("content")) {
        const auto& content = result["content"];
        if (!content.is_array() || content.empty()) return true;
        for (const auto& item : content) {
            if (!item.is_object()) continue;
            if (item.contains("text") && item["text"].is_string() && !item["text"].get<std::string>().empty()) {
                return false;
            }
            // Non-text items (images, resources) still count as a payload.
            if (item.contains("type") && item["type"].is_string() && item["type"].get<std::string>() != "text") {
                return false;
            }
        }
        return true;
    }
    return result.empty();
}

ToolInvoker::Invocation ToolInvoker::invoke(ILineTransport& transport, const ToolCatalog& catalog, LogicalOperation op,
                                            const OperationParams& params) {
    Invocation inv;
    inv.toolName = resolve(catalog, op);
    inv.arguments = ToolRouting::buildArguments(op, inv.toolName, params);

    Logger::getInstance().info("Calling " + inv.toolName + " for " + operationName(op));
    Logger::getInstance().debug("Arguments: " + inv.arguments.dump());

    auto res = transport.send(ILineTransport::makeRequest(
        transport.nextRequestId(), "tools/call", {{"name", inv.toolName}, {"arguments", inv.arguments}}));
    if (!res) {
        throw ToolServerError(ErrorKind::MalformedResponse, "tools/call produced no response");
    }

    ResponseClass cls = classifyResponse(*res);
    switch (cls.tag) {
        case ResponseClass::Tag::Ok:
            break;
        case ResponseClass::Tag::Malformed:
            throw ToolServerError(ErrorKind::MalformedResponse, inv.toolName + ": " + cls.message);
        case ResponseClass::Tag::ProtocolError:
        case ResponseClass::Tag::ToolReported: {
            std::string hint = toolErrorHint(cls.toolKind);
            Logger::getInstance().warn(inv.toolName + " failed (" + toolErrorKindName(cls.toolKind) + "): " +
                                       cls.message);
            throw ToolServerError(ErrorKind::ToolInvocationError, inv.toolName + " failed: " + cls.message, hint,
                                  cls.toolKind);
        }
    }

    if (isEmptyResult(cls.payload)) {
        throw ToolServerError(ErrorKind::EmptyResult, inv.toolName + " returned no content");
    }
    inv.result = std::move(cls.payload);
    return inv;
}
