#pragma once
#include <string>

/**
 * @brief Produces an answer for a prompt, optionally grounded in repository context.
 * Implementations throw std::runtime_error when no answer could be produced.
 */
class IAnswerGenerator {
public:
    virtual ~IAnswerGenerator() = default;
    virtual std::string generate(const std::string& prompt, const std::string& context = "") = 0;
};
