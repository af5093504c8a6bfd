#include "mcp/LineTransport.h"
#include "mcp/ToolServerError.h"
#include "utils/Logger.h"
#include <cerrno>
#include <cstring>

#include <unistd.h>
#include <poll.h>

nlohmann::json ILineTransport::makeRequest(int64_t id, const std::string& method, const nlohmann::json& params) {
    nlohmann::json request = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method}
    };
    if (!params.is_null()) {
        request["params"] = params;
    }
    return request;
}

nlohmann::json ILineTransport::makeNotification(const std::string& method, const nlohmann::json& params) {
    nlohmann::json notification = {
        {"jsonrpc", "2.0"},
        {"method", method}
    };
    if (!params.is_null()) {
        notification["params"] = params;
    }
    return notification;
}

std::string ILineTransport::frame(const nlohmann::json& message) {
    // dump() without indentation never emits a raw newline: string contents are escaped.
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

StdioLineTransport::StdioLineTransport(int writeFd, int readFd, int timeoutMs)
    : writeFd(writeFd), readFd(readFd), timeoutMs(timeoutMs) {}

std::optional<nlohmann::json> StdioLineTransport::send(const nlohmann::json& request) {
    if (!isOpen()) {
        throw ToolServerError(ErrorKind::TransportClosed, "Tool server streams are not open");
    }

    std::string line = frame(request);
    Logger::getInstance().debug("-> " + line);
    writeAll(line);

    if (!request.contains("id")) {
        return std::nullopt;
    }

    PendingRequest pending;
    pending.id = request["id"];
    pending.method = request.value("method", "");
    pending.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);

    while (true) {
        std::string responseLine = readLine(pending.deadline);
        while (!responseLine.empty() && (responseLine.back() == '\r' || responseLine.back() == ' ')) {
            responseLine.pop_back();
        }
        if (responseLine.empty()) continue;

        nlohmann::json message;
        try {
            message = nlohmann::json::parse(responseLine);
        } catch (const nlohmann::json::parse_error& e) {
            throw ToolServerError(ErrorKind::MalformedResponse,
                                  "Invalid response from tool server for '" + pending.method + "': " + e.what());
        }

        if (message.is_object() && message.contains("id") && message["id"] == pending.id) {
            Logger::getInstance().debug("<- " + responseLine);
            return message;
        }

        // Server notifications and responses to abandoned requests end up here.
        ++discarded;
        Logger::getInstance().debug("Discarding unmatched line while waiting for id " + pending.id.dump() +
                                    ": " + responseLine);
    }
}

void StdioLineTransport::probe(const nlohmann::json& request) {
    if (!isOpen()) {
        throw ToolServerError(ErrorKind::TransportClosed, "Tool server streams are not open");
    }
    writeAll(frame(request));
}

void StdioLineTransport::writeAll(const std::string& data) {
    const char* ptr = data.c_str();
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t n = write(writeFd, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw ToolServerError(ErrorKind::TransportClosed,
                                  std::string("Failed to send request to tool server: ") + std::strerror(errno));
        }
        if (n == 0) {
            throw ToolServerError(ErrorKind::TransportClosed, "Failed to send request to tool server");
        }
        ptr += n;
        remaining -= static_cast<size_t>(n);
    }
}

std::string StdioLineTransport::readLine(std::chrono::steady_clock::time_point deadline) {
    char temp[4096];
    while (true) {
        auto newline = buffer.find('\n');
        if (newline != std::string::npos) {
            std::string line = buffer.substr(0, newline);
            buffer.erase(0, newline + 1);
            return line;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            throw ToolServerError(ErrorKind::Timeout, "Timeout waiting for tool server response");
        }

        struct pollfd pfd;
        pfd.fd = readFd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int r = poll(&pfd, 1, static_cast<int>(remaining));
        if (r < 0) {
            if (errno == EINTR) continue;
            throw ToolServerError(ErrorKind::TransportClosed,
                                  std::string("poll() on tool server output failed: ") + std::strerror(errno));
        }
        if (r == 0) {
            throw ToolServerError(ErrorKind::Timeout, "Timeout waiting for tool server response");
        }

        ssize_t n = read(readFd, temp, sizeof(temp));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw ToolServerError(ErrorKind::TransportClosed,
                                  std::string("Error reading tool server output: ") + std::strerror(errno));
        }
        if (n == 0) {
            throw ToolServerError(ErrorKind::TransportClosed, "No response received from tool server (stream closed)");
        }
        buffer.append(temp, static_cast<size_t>(n));
    }
}
