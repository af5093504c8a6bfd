#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "mcp/LineTransport.h"
#include "mcp/ToolCatalog.h"
#include "mcp/ToolRouting.h"

/**
 * @brief Executes one logical operation as a tools/call on the current connection.
 */
class ToolInvoker {
public:
    struct Invocation {
        std::string toolName;
        nlohmann::json arguments;
        nlohmann::json result;  // the JSON-RPC "result" member
    };

    /** Throws ToolServerError(NoSuchToolAvailable) listing the advertised tools. */
    static std::string resolve(const ToolCatalog& catalog, LogicalOperation op);

    /**
     * @brief Resolve, build arguments, call, classify.
     *
     * Throws ToolInvocationError (with a hint) for protocol or tool-reported
     * errors, MalformedResponse for responses that are not JSON-RPC, and
     * EmptyResult when the call succeeded without a usable payload.
     */
    static Invocation invoke(ILineTransport& transport, const ToolCatalog& catalog, LogicalOperation op,
                             const OperationParams& params);

    /** True if the result carries nothing worth parsing. */
    static bool isEmptyResult(const nlohmann::json& result);
};
