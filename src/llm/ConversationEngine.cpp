/**
 * ConversationEngine.cpp - System prompt and context composition
 */

#include "volley/llm/ConversationEngine.hpp"
#include "volley/llm/LLMClient.hpp"

#include <iostream>
#include <sstream>

namespace volley::llm {

ConversationEngine::ConversationEngine(const GenerationConfig& config)
    : config_(config)
    , client_(std::make_unique<LLMClient>(config.base_url, config.api_key, config.timeout_ms)) {
    std::cout << "[ConversationEngine] Using " << config_.model << " at " << config_.base_url << std::endl;
}

ConversationEngine::~ConversationEngine() = default;

bool ConversationEngine::isReady() {
    return client_->isHealthy();
}

std::string ConversationEngine::buildUserPrompt(const std::string& text,
                                                const std::optional<std::string>& context) {
    if (!context || context->empty()) {
        return text;
    }
    std::stringstream prompt;
    prompt << "Contexte:\n" << *context << "\n\n";
    prompt << "Question: " << text;
    return prompt.str();
}

std::string ConversationEngine::generate(const std::string& text, const std::optional<std::string>& context) {
    ChatRequest request;
    request.model = config_.model;
    request.temperature = config_.temperature;
    request.max_tokens = config_.max_tokens;
    if (!config_.system_prompt.empty()) {
        request.messages.push_back({"system", config_.system_prompt});
    }
    request.messages.push_back({"user", buildUserPrompt(text, context)});

    auto response = client_->chat(request);
    return response.content;
}

} // namespace volley::llm
