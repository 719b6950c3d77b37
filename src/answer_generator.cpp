#include "answer_generator.hpp"
#include "config.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

namespace paperscout {

using json = nlohmann::json;

ChatCompletionsAnswerGenerator::ChatCompletionsAnswerGenerator(const LlmConfig& config,
                                                               HttpClient& http)
    : base_url_(config.base_url)
    , model_(config.model)
    , api_key_(config.api_key)
    , max_tokens_(config.max_tokens)
    , temperature_(config.temperature)
    , timeout_seconds_(static_cast<long>(config.timeout_seconds))
    , http_(http)
{
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::string ChatCompletionsAnswerGenerator::build_prompt(const std::string& query,
                                                         const std::string& context) {
    return "Based on the context below, provide an answer for this: '" + query +
           "'\n\n<context>\n" + context + "\n</context>\n";
}

AnswerResult ChatCompletionsAnswerGenerator::generate(const std::string& query,
                                                      const std::string& context) {
    AnswerResult out;

    json request = {
        {"model", model_},
        {"messages", json::array({
            {{"role", "user"}, {"content", build_prompt(query, context)}}
        })},
        {"max_tokens", max_tokens_},
        {"temperature", temperature_}
    };

    std::vector<Header> headers = {{"Content-Type", "application/json"}};
    if (!api_key_.empty()) {
        headers.push_back({"Authorization", "Bearer " + api_key_});
    }

    auto response = http_.post(base_url_ + "/chat/completions",
                               request.dump(-1, ' ', false, json::error_handler_t::replace),
                               headers, timeout_seconds_);
    if (response.status_code == 0) {
        out.error = "LLM endpoint unreachable at " + base_url_;
        return out;
    }
    if (!response.ok()) {
        out.error = "LLM API error (HTTP " + std::to_string(response.status_code) + "): " +
                    response.body;
        return out;
    }

    auto resp = json::parse(response.body, nullptr, false);
    if (resp.is_discarded() || !resp.is_object()) {
        out.error = "LLM response is not JSON";
        return out;
    }
    if (resp.contains("choices") && resp["choices"].is_array() && !resp["choices"].empty()) {
        const auto& choice = resp["choices"][0];
        if (choice.contains("message") && choice["message"].is_object()) {
            const auto& message = choice["message"];
            if (message.contains("content") && message["content"].is_string()) {
                out.text = message["content"].get<std::string>();
                out.success = true;
                return out;
            }
        }
    }
    out.error = "LLM response has no message content";
    return out;
}

} // namespace paperscout
