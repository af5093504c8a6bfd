#include "core/LLMClient.h"
#include "utils/Logger.h"
#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <regex>
#include <thread>
#include <chrono>
#include <stdexcept>

namespace {
const char* kDefaultSystemRole =
    "You are an expert code analyst and software engineer. You help users understand code repositories "
    "by analyzing code structure, functionality, and providing insights.\n\n"
    "When provided with search results from a repository, analyze the code and provide helpful insights, "
    "explanations, and suggestions. Be concise but thorough in your responses.";

// Some compatible endpoints answer with content arrays but only accept strings in requests.
nlohmann::json normalizeMessages(const nlohmann::json& messages) {
    if (!messages.is_array()) return messages;
    nlohmann::json out = nlohmann::json::array();
    for (const auto& msg : messages) {
        if (!msg.is_object()) continue;
        nlohmann::json m = msg;
        if (m.contains("content")) {
            if (m["content"].is_null()) {
                m["content"] = "";
            } else if (m["content"].is_array()) {
                std::string flat;
                for (const auto& part : m["content"]) {
                    if (part.is_object() && part.contains("text") && part["text"].is_string())
                        flat += part["text"].get<std::string>();
                }
                m["content"] = flat;
            }
        }
        out.push_back(m);
    }
    return out;
}
} // namespace

LLMClient::LLMClient(const std::string& apiKey, const std::string& baseUrl, const std::string& model)
    : apiKey(apiKey), baseUrl(baseUrl), modelName(model) {
    parseBaseUrl(baseUrl);
}

void LLMClient::parseBaseUrl(const std::string& url) {
    std::regex urlRegex(R"((http|https)://([^/:]+)(?::(\d+))?(.*))");
    std::smatch match;
    if (std::regex_match(url, match, urlRegex)) {
        isSsl = (match[1] == "https");
        host = match[2];
        if (match[3].matched) {
            port = std::stoi(match[3]);
        } else {
            port = isSsl ? 443 : 80;
        }
        pathPrefix = match[4];
        while (!pathPrefix.empty() && pathPrefix.back() == '/') pathPrefix.pop_back();
    } else {
        isSsl = true;
        host = url;
        port = 443;
        pathPrefix = "";
    }
}

nlohmann::json LLMClient::buildMessages(const std::string& prompt, const std::string& context) const {
    nlohmann::json messages = nlohmann::json::array();
    messages.push_back({{"role", "system"}, {"content", systemRole.empty() ? kDefaultSystemRole : systemRole}});
    std::string content = prompt;
    if (!context.empty()) {
        content = "Context from repository search:\n" + context + "\n\nUser question: " + prompt;
    }
    messages.push_back({{"role", "user"}, {"content", content}});
    return messages;
}

std::string LLMClient::generate(const std::string& prompt, const std::string& context) {
    nlohmann::json res = chat(buildMessages(prompt, context));
    if (res.is_object() && res.contains("choices") && res["choices"].is_array() && !res["choices"].empty()) {
        const auto& msg = res["choices"][0].value("message", nlohmann::json::object());
        if (msg.contains("content") && msg["content"].is_string()) {
            return msg["content"].get<std::string>();
        }
    }
    throw std::runtime_error("LLM response carried no message content");
}

nlohmann::json LLMClient::chat(const nlohmann::json& messages) {
    httplib::Headers headers = {
        {"Authorization", "Bearer " + apiKey}
    };

    nlohmann::json body = {
        {"model", modelName},
        {"messages", normalizeMessages(messages)},
        {"max_tokens", maxTokens},
        {"temperature", temperature}
    };

    std::string endpoint = pathPrefix + "/chat/completions";
    std::string bodyStr = body.dump();

    httplib::Result res;
    std::string lastError;
    int retryCount = 0;
    const int maxRetries = 3;

    while (retryCount < maxRetries) {
        try {
            if (isSsl) {
                httplib::SSLClient cli(host, port);
                cli.set_follow_location(true);
                cli.set_connection_timeout(10);
                cli.set_read_timeout(60);
                res = cli.Post(endpoint, headers, bodyStr, "application/json");
            } else {
                httplib::Client cli(host, port);
                cli.set_follow_location(true);
                cli.set_connection_timeout(10);
                cli.set_read_timeout(60);
                res = cli.Post(endpoint, headers, bodyStr, "application/json");
            }

            if (res && res->status == 200) break;
            lastError = res ? "HTTP " + std::to_string(res->status) : httplib::to_string(res.error());
        } catch (const std::exception& e) {
            lastError = e.what();
        }

        retryCount++;
        if (retryCount < maxRetries) {
            Logger::getInstance().warn("LLM request failed (" + lastError + "). Retrying (" +
                                       std::to_string(retryCount) + "/" + std::to_string(maxRetries) + ")...");
            std::this_thread::sleep_for(std::chrono::seconds(2 * retryCount));
        }
    }

    if (!res || res->status != 200) {
        if (res && !res->body.empty()) Logger::getInstance().debug("LLM error body: " + res->body);
        throw std::runtime_error("LLM request failed after " + std::to_string(maxRetries) + " attempts: " + lastError);
    }

    try {
        return nlohmann::json::parse(res->body);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("LLM returned invalid JSON: ") + e.what());
    }
}
