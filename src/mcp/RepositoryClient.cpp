#include "mcp/RepositoryClient.h"
#include "utils/Logger.h"
#include <future>

RepositoryClient::RepositoryClient(ToolServerConfig config)
    : supervisor(config),
      monitor(supervisor, config.sweepIntervalSec),
      callDeadline(std::chrono::seconds(config.callDeadlineSec)) {}

RepositoryClient::~RepositoryClient() {
    monitor.stop();
}

template <typename T>
Outcome<T> RepositoryClient::run(const std::string& what, std::function<T()> job) {
    std::future<T> future = worker.submit(std::move(job));
    if (future.wait_for(callDeadline) != std::future_status::ready) {
        Logger::getInstance().warn(what + " exceeded the call deadline of " + std::to_string(callDeadline.count()) +
                                   " ms");
        return Outcome<T>::failure(ErrorKind::Timeout,
                                   what + " did not finish within " + std::to_string(callDeadline.count()) + " ms",
                                   "The tool server may still be working (indexing large repositories takes a "
                                   "while). Try again later.");
    }

    try {
        return Outcome<T>::success(future.get());
    } catch (const ToolServerError& e) {
        if (e.kind() == ErrorKind::EmptyResult) {
            Logger::getInstance().info(what + ": " + e.what());
        } else {
            Logger::getInstance().error(what + " failed: " + e.what());
        }
        return Outcome<T>::failure(e.kind(), e.what(), e.hint(), e.toolKind());
    } catch (const nlohmann::json::exception& e) {
        Logger::getInstance().error(what + " produced unreadable data: " + e.what());
        return Outcome<T>::failure(ErrorKind::MalformedResponse, e.what());
    } catch (const std::exception& e) {
        Logger::getInstance().error(what + " failed unexpectedly: " + e.what());
        return Outcome<T>::failure(ErrorKind::ToolInvocationError, e.what());
    }
}

Outcome<bool> RepositoryClient::connect() {
    return run<bool>("connect", [this]() {
        supervisor.connect();
        return true;
    });
}

Outcome<bool> RepositoryClient::disconnect() {
    return run<bool>("disconnect", [this]() {
        supervisor.disconnect();
        return true;
    });
}

// Runs on the caller's thread, not the worker.
bool RepositoryClient::checkHealth() {
    return supervisor.checkHealth();
}

Outcome<IndexResult> RepositoryClient::indexRepository(const std::string& location) {
    if (location.empty()) {
        return Outcome<IndexResult>::failure(ErrorKind::InvalidArgument, "Repository location is empty");
    }
    return run<IndexResult>("index " + location, [this, location]() {
        OperationParams params;
        params.repository = location;
        auto inv = supervisor.invokeWithRetry(LogicalOperation::IndexRepository, params);
        IndexResult result = ResultParser::parseIndex(inv.result, location);
        if (result.indexLocation.empty()) {
            result.indexLocation = ToolRouting::repositoryLocalName(location);
        }
        supervisor.recordIndexed(location, result.indexLocation);
        Logger::getInstance().success("Indexed " + location + " at " + result.indexLocation);
        return result;
    });
}

Outcome<std::vector<SearchMatch>> RepositoryClient::search(const std::string& location, const std::string& query,
                                                            int limit) {
    using Result = std::vector<SearchMatch>;
    if (limit <= 0) {
        return Outcome<Result>::failure(ErrorKind::InvalidArgument,
                                        "Result limit must be positive (got " + std::to_string(limit) + ")");
    }
    if (location.empty() || query.empty()) {
        return Outcome<Result>::failure(ErrorKind::InvalidArgument, "Search needs a repository and a query");
    }
    return run<Result>("search " + location, [this, location, query, limit]() {
        OperationParams params;
        params.repository = location;
        params.query = query;
        params.limit = limit;
        params.indexLocation = supervisor.indexLocationFor(location).value_or("");
        auto inv = supervisor.invokeWithRetry(LogicalOperation::SearchRepository, params);
        Result matches = ResultParser::parseSearch(inv.result);
        if (matches.empty()) {
            throw ToolServerError(ErrorKind::EmptyResult, "No matches for '" + query + "'");
        }
        return matches;
    });
}

Outcome<FileContent> RepositoryClient::fetchFile(const std::string& location, const std::string& path) {
    if (location.empty() || path.empty()) {
        return Outcome<FileContent>::failure(ErrorKind::InvalidArgument, "Fetching a file needs a repository and a path");
    }
    return run<FileContent>("fetch " + path, [this, location, path]() {
        OperationParams params;
        params.repository = location;
        params.filePath = path;
        auto inv = supervisor.invokeWithRetry(LogicalOperation::FetchFile, params);
        return ResultParser::parseFile(inv.result, path);
    });
}

Outcome<DirectoryListing> RepositoryClient::listStructure(const std::string& location) {
    if (location.empty()) {
        return Outcome<DirectoryListing>::failure(ErrorKind::InvalidArgument, "Repository location is empty");
    }
    return run<DirectoryListing>("structure of " + location, [this, location]() {
        OperationParams params;
        params.repository = location;
        auto inv = supervisor.invokeWithRetry(LogicalOperation::ListStructure, params);
        return ResultParser::parseListing(inv.result, ToolRouting::repositoryLocalName(location));
    });
}

Outcome<std::vector<SearchMatch>> RepositoryClient::searchCode(const std::string& location,
                                                                const std::string& pattern,
                                                                const std::string& fileType) {
    using Result = std::vector<SearchMatch>;
    if (location.empty() || pattern.empty()) {
        return Outcome<Result>::failure(ErrorKind::InvalidArgument, "Code search needs a repository and a pattern");
    }
    return run<Result>("code search " + location, [this, location, pattern, fileType]() {
        OperationParams params;
        params.repository = location;
        params.pattern = pattern;
        params.fileType = fileType;
        auto inv = supervisor.invokeWithRetry(LogicalOperation::SearchCode, params);
        Result matches = ResultParser::parseSearch(inv.result);
        if (matches.empty()) {
            throw ToolServerError(ErrorKind::EmptyResult, "No code matches for '" + pattern + "'");
        }
        return matches;
    });
}
