#pragma once
#include "http.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace paperscout {

struct LlmConfig;

struct AnswerResult {
    bool success = false;
    std::string text;
    std::string error;
};

// Turns retrieved context into a natural-language answer
class AnswerGenerator {
public:
    virtual ~AnswerGenerator() = default;
    virtual AnswerResult generate(const std::string& query, const std::string& context) = 0;
};

// OpenAI-compatible /chat/completions endpoint (a LiteLLM proxy by default)
class ChatCompletionsAnswerGenerator : public AnswerGenerator {
public:
    ChatCompletionsAnswerGenerator(const LlmConfig& config, HttpClient& http);

    AnswerResult generate(const std::string& query, const std::string& context) override;

    static std::string build_prompt(const std::string& query, const std::string& context);

private:
    std::string base_url_;
    std::string model_;
    std::string api_key_;
    uint32_t max_tokens_;
    double temperature_;
    long timeout_seconds_;
    HttpClient& http_;
};

} // namespace paperscout
