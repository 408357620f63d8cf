/**
 * LLMClient.hpp - HTTP client for OpenAI-compatible chat and embedding endpoints
 *
 * Works against llama.cpp server, Groq, OpenRouter or any server exposing
 * /chat/completions and /embeddings under a common base URL.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace volley::llm {

struct ChatMessage {
    std::string role;  // "system", "user" or "assistant"
    std::string content;
};

struct ChatRequest {
    std::string model;
    std::vector<ChatMessage> messages;
    float temperature = 0.7f;
    int max_tokens = 150;
};

struct ChatResponse {
    std::string content;
    std::string finish_reason;
    int tokens_prompt = 0;
    int tokens_generated = 0;
};

class LLMClient {
public:
    /**
     * @param base_url e.g. "http://localhost:8080/v1" or "https://api.groq.com/openai/v1"
     * @param api_key sent as a bearer token when not empty
     */
    LLMClient(const std::string& base_url, const std::string& api_key, int timeout_ms = 30000);
    ~LLMClient();

    LLMClient(const LLMClient&) = delete;
    LLMClient& operator=(const LLMClient&) = delete;

    // GET <base>/models answers 200
    bool isHealthy();

    // Throws CollaboratorError on transport errors, non-2xx and malformed payloads
    ChatResponse chat(const ChatRequest& request);

    // Throws CollaboratorError; never returns an empty vector
    std::vector<float> embed(const std::string& text, const std::string& model);

    const std::string& baseUrl() const { return base_url_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::string base_url_;
};

} // namespace volley::llm
