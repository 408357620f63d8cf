/**
 * QdrantRetriever.cpp - Vector search over the Qdrant REST API
 *
 * POST /collections/{name}/points/search
 *   {"vector": [...], "limit": k, "score_threshold": t, "with_payload": true}
 * Each hit carries the chunk text in payload.text.
 */

#include "volley/rag/QdrantRetriever.hpp"
#include "volley/Errors.hpp"
#include "volley/llm/LLMClient.hpp"
#include "net/HttpSupport.hpp"

#include <iostream>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace volley::rag {

struct QdrantRetriever::Impl {
    std::unique_ptr<httplib::Client> qdrant;
    net::Endpoint endpoint;
    llm::LLMClient embedder;

    explicit Impl(const RetrievalConfig& config)
        : endpoint(net::parseEndpoint(config.qdrant_url))
        , embedder(config.embedding_url, config.api_key, config.timeout_ms) {
        qdrant = net::makeClient(endpoint, config.timeout_ms);
    }

    std::string collectionPath(const std::string& collection) const {
        return endpoint.base_path + "/collections/" + collection;
    }
};

QdrantRetriever::QdrantRetriever(const RetrievalConfig& config)
    : impl_(std::make_unique<Impl>(config))
    , config_(config) {
    std::cout << "[QdrantRetriever] Collection '" << config_.collection << "' at " << config_.qdrant_url << std::endl;
}

QdrantRetriever::~QdrantRetriever() = default;

bool QdrantRetriever::isReady() {
    auto res = impl_->qdrant->Get(impl_->collectionPath(config_.collection));
    if (!res || res->status != 200) {
        std::cerr << "[QdrantRetriever] Collection '" << config_.collection << "' unavailable: "
                  << net::describeFailure(res) << std::endl;
        return false;
    }
    return true;
}

std::vector<float> QdrantRetriever::embed(const std::string& text) {
    return impl_->embedder.embed(text, config_.embedding_model);
}

std::vector<Document> QdrantRetriever::retrieve(const std::string& text, int top_k, double score_threshold) {
    std::vector<float> vector = embed(text);

    json req_json = {
        {"vector", vector},
        {"limit", top_k},
        {"score_threshold", score_threshold},
        {"with_payload", true}
    };

    auto res = impl_->qdrant->Post(impl_->collectionPath(config_.collection) + "/points/search",
                                   req_json.dump(), "application/json");
    if (!net::isSuccess(res)) {
        throw CollaboratorError("QdrantRetriever", "search " + net::describeFailure(res));
    }

    std::vector<Document> documents;
    try {
        json res_json = json::parse(res->body);
        for (const auto& hit : res_json.at("result")) {
            Document doc;
            doc.score = hit.value("score", 0.0);
            if (hit.contains("payload") && hit["payload"].is_object()) {
                doc.text = hit["payload"].value("text", "");
            }
            documents.push_back(std::move(doc));
        }
    } catch (const json::exception& e) {
        throw CollaboratorError("QdrantRetriever", std::string("Unexpected search payload: ") + e.what());
    }

    std::cout << "[QdrantRetriever] " << documents.size() << " hits" << std::endl;
    return documents;
}

} // namespace volley::rag
