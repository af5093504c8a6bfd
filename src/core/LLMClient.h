#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "core/AnswerGenerator.h"

/**
 * @brief OpenAI-compatible chat completions client.
 */
class LLMClient : public IAnswerGenerator {
public:
    LLMClient(const std::string& apiKey,
              const std::string& baseUrl = "https://api.openai.com/v1",
              const std::string& model = "gpt-4o-mini");

    std::string generate(const std::string& prompt, const std::string& context = "") override;

    /** Raw completion call; returns the parsed response body. Throws std::runtime_error after the last retry. */
    nlohmann::json chat(const nlohmann::json& messages);

    void setSystemRole(const std::string& role) { systemRole = role; }
    void setMaxTokens(int tokens) { maxTokens = tokens; }
    void setTemperature(double t) { temperature = t; }

    /** Builds the messages array sent for a prompt; exposed for tests. */
    nlohmann::json buildMessages(const std::string& prompt, const std::string& context) const;

private:
    std::string apiKey;
    std::string baseUrl;
    std::string modelName;
    std::string systemRole;
    int maxTokens = 4000;
    double temperature = 0.1;
    bool isSsl = true;
    std::string host;
    int port = 443;
    std::string pathPrefix;

    void parseBaseUrl(const std::string& url);
};
