#pragma once
#include <string>
#include <optional>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

/**
 * @brief Line-delimited JSON-RPC transport.
 *
 * One JSON object per line in both directions, one request in flight at a
 * time. Implementations throw ToolServerError with a transport kind
 * (TransportClosed, Timeout, MalformedResponse) on failure.
 */
class ILineTransport {
public:
    virtual ~ILineTransport() = default;

    /**
     * @brief Writes the request; if it carries an "id", waits for the line with the same id.
     * @return The paired response, or std::nullopt for notifications.
     */
    virtual std::optional<nlohmann::json> send(const nlohmann::json& request) = 0;

    /**
     * @brief Best-effort write that never waits for a reply.
     */
    virtual void probe(const nlohmann::json& request) = 0;

    virtual bool isOpen() const = 0;

    /** Ids are unique for the lifetime of one transport (one connection). */
    virtual int64_t nextRequestId() = 0;

    static nlohmann::json makeRequest(int64_t id, const std::string& method, const nlohmann::json& params);
    static nlohmann::json makeNotification(const std::string& method, const nlohmann::json& params);

    /** Single-line serialization followed by exactly one '\n'. */
    static std::string frame(const nlohmann::json& message);
};

class StdioLineTransport : public ILineTransport {
public:
    /** The descriptors are borrowed; the owner (ServerProcess) closes them. */
    StdioLineTransport(int writeFd, int readFd, int timeoutMs = 30000);

    std::optional<nlohmann::json> send(const nlohmann::json& request) override;
    void probe(const nlohmann::json& request) override;
    bool isOpen() const override { return writeFd >= 0 && readFd >= 0; }
    int64_t nextRequestId() override { return requestId.fetch_add(1); }

    size_t discardedLines() const { return discarded; }

private:
    struct PendingRequest {
        nlohmann::json id;
        std::string method;
        std::chrono::steady_clock::time_point deadline;
    };

    int writeFd;
    int readFd;
    int timeoutMs;
    std::atomic<int64_t> requestId{1};
    std::string buffer;
    size_t discarded = 0;

    void writeAll(const std::string& data);
    std::string readLine(std::chrono::steady_clock::time_point deadline);
};
