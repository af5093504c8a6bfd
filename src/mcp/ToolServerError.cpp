#include "mcp/ToolServerError.h"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::SpawnFailed: return "SpawnFailed";
        case ErrorKind::HandshakeFailed: return "HandshakeFailed";
        case ErrorKind::TransportClosed: return "TransportClosed";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::MalformedResponse: return "MalformedResponse";
        case ErrorKind::NoSuchToolAvailable: return "NoSuchToolAvailable";
        case ErrorKind::ToolInvocationError: return "ToolInvocationError";
        case ErrorKind::EmptyResult: return "EmptyResult";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}
