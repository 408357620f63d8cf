/**
 * LLMClient.cpp - cpp-httplib client for /chat/completions and /embeddings
 */

#include "volley/llm/LLMClient.hpp"
#include "volley/Errors.hpp"
#include "net/HttpSupport.hpp"

#include <iostream>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace volley::llm {

struct LLMClient::Impl {
    std::unique_ptr<httplib::Client> client;
    net::Endpoint endpoint;
    std::string api_key;

    Impl(const std::string& url, const std::string& key, int timeout_ms)
        : endpoint(net::parseEndpoint(url))
        , api_key(key) {
        client = net::makeClient(endpoint, timeout_ms);
    }

    json post(const std::string& route, const json& body) {
        auto res = client->Post(endpoint.base_path + route, net::bearer(api_key),
                                body.dump(), "application/json");
        if (!net::isSuccess(res)) {
            throw CollaboratorError("LLMClient", route + " " + net::describeFailure(res));
        }
        try {
            return json::parse(res->body);
        } catch (const json::exception& e) {
            throw CollaboratorError("LLMClient", route + " JSON parse error: " + e.what());
        }
    }
};

LLMClient::LLMClient(const std::string& base_url, const std::string& api_key, int timeout_ms)
    : impl_(std::make_unique<Impl>(base_url, api_key, timeout_ms))
    , base_url_(base_url) {
}

LLMClient::~LLMClient() = default;

bool LLMClient::isHealthy() {
    auto res = impl_->client->Get(impl_->endpoint.base_path + "/models", net::bearer(impl_->api_key));
    return res && res->status == 200;
}

ChatResponse LLMClient::chat(const ChatRequest& request) {
    json messages = json::array();
    for (const auto& msg : request.messages) {
        messages.push_back({{"role", msg.role}, {"content", msg.content}});
    }

    json req_json = {
        {"messages", messages},
        {"temperature", request.temperature},
        {"max_tokens", request.max_tokens},
        {"stream", false}
    };
    if (!request.model.empty()) {
        req_json["model"] = request.model;
    }

    json res_json = impl_->post("/chat/completions", req_json);

    ChatResponse response;
    try {
        const auto& choice = res_json.at("choices").at(0);
        const auto& content = choice.at("message").at("content");
        response.content = content.is_string() ? content.get<std::string>() : "";
        if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
            response.finish_reason = choice["finish_reason"].get<std::string>();
        }
        if (res_json.contains("usage") && res_json["usage"].is_object()) {
            response.tokens_prompt = res_json["usage"].value("prompt_tokens", 0);
            response.tokens_generated = res_json["usage"].value("completion_tokens", 0);
        }
    } catch (const json::exception& e) {
        throw CollaboratorError("LLMClient", std::string("Unexpected chat payload: ") + e.what());
    }

    std::cout << "[LLMClient] " << response.tokens_generated << " tokens generated"
              << (response.finish_reason.empty() ? "" : " (" + response.finish_reason + ")") << std::endl;
    return response;
}

std::vector<float> LLMClient::embed(const std::string& text, const std::string& model) {
    json req_json = {
        {"input", text}
    };
    if (!model.empty()) {
        req_json["model"] = model;
    }

    json res_json = impl_->post("/embeddings", req_json);

    std::vector<float> embedding;
    try {
        embedding = res_json.at("data").at(0).at("embedding").get<std::vector<float>>();
    } catch (const json::exception& e) {
        throw CollaboratorError("LLMClient", std::string("Unexpected embedding payload: ") + e.what());
    }
    if (embedding.empty()) {
        throw CollaboratorError("LLMClient", "Empty embedding");
    }
    return embedding;
}

} // namespace volley::llm
