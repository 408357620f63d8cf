/**
 * ConversationEngine.hpp - Grounded answer generation over LLMClient
 */

#pragma once

#include "volley/llm/Generator.hpp"

#include <memory>
#include <optional>
#include <string>

namespace volley::llm {

class LLMClient;

struct GenerationConfig {
    std::string base_url = "http://localhost:8080/v1";
    std::string api_key;
    std::string model = "llama-3.1-8b-instant";
    float temperature = 0.7f;
    int max_tokens = 150;
    std::string system_prompt =
        "Tu es l'assistant vocal de Harvard. Réponds en français, 1-2 phrases max. "
        "Utilise uniquement le contexte fourni. Si pas d'info, dis: Je n'ai pas cette information.";
    int timeout_ms = 30000;
};

class ConversationEngine : public Generator {
public:
    explicit ConversationEngine(const GenerationConfig& config);
    ~ConversationEngine() override;

    bool isReady();

    /**
     * One stateless exchange: system prompt plus a single user message.
     * Throws CollaboratorError on failure.
     */
    std::string generate(const std::string& text, const std::optional<std::string>& context) override;

    // "Contexte:\n<context>\n\nQuestion: <text>", or the text alone
    static std::string buildUserPrompt(const std::string& text, const std::optional<std::string>& context);

    const GenerationConfig& config() const { return config_; }

private:
    GenerationConfig config_;
    std::unique_ptr<LLMClient> client_;
};

} // namespace volley::llm
