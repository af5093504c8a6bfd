#pragma once
#include <stdexcept>
#include <string>

/**
 * @brief Failure kinds surfaced by the tool-server stack.
 *
 * Transport kinds (TransportClosed, Timeout, MalformedResponse) mean the
 * connection should be considered unhealthy. EmptyResult is not an error: the
 * call worked and found nothing.
 */
enum class ErrorKind {
    None,
    SpawnFailed,
    HandshakeFailed,
    TransportClosed,
    Timeout,
    MalformedResponse,
    NoSuchToolAvailable,
    ToolInvocationError,
    EmptyResult,
    InvalidArgument
};

/** What a failing tool said went wrong, bucketed from its error text. */
enum class ToolErrorKind {
    None,
    UnknownTool,
    RepositoryNotFound,
    NotIndexed,
    InvalidArguments,
    Authentication,
    Other
};

const char* errorKindName(ErrorKind kind);

inline bool isTransportFailure(ErrorKind kind) {
    return kind == ErrorKind::TransportClosed || kind == ErrorKind::Timeout ||
           kind == ErrorKind::MalformedResponse;
}

class ToolServerError : public std::runtime_error {
public:
    ToolServerError(ErrorKind kind, const std::string& message, const std::string& hint = "",
                    ToolErrorKind toolKind = ToolErrorKind::None)
        : std::runtime_error(message), errorKind(kind), errorHint(hint), toolErrorKind(toolKind) {}

    ErrorKind kind() const { return errorKind; }
    const std::string& hint() const { return errorHint; }
    ToolErrorKind toolKind() const { return toolErrorKind; }

private:
    ErrorKind errorKind;
    std::string errorHint;
    ToolErrorKind toolErrorKind;
};
