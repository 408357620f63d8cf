/**
 * QdrantRetriever.hpp - Embedding + Qdrant points search
 */

#pragma once

#include "volley/rag/Retriever.hpp"

#include <memory>
#include <string>
#include <vector>

namespace volley::llm {
class LLMClient;
}

namespace volley::rag {

struct RetrievalConfig {
    std::string qdrant_url = "http://localhost:6333";
    std::string collection = "harvard";
    std::string embedding_url = "https://openrouter.ai/api/v1";
    std::string embedding_model = "openai/text-embedding-3-large";
    std::string api_key;  // for the embedding endpoint
    int timeout_ms = 30000;
};

class QdrantRetriever : public Retriever {
public:
    explicit QdrantRetriever(const RetrievalConfig& config);
    ~QdrantRetriever() override;

    // Collection exists and answers
    bool isReady();

    std::vector<Document> retrieve(const std::string& text, int top_k, double score_threshold) override;

    // Query vector for text from the embedding endpoint
    std::vector<float> embed(const std::string& text);

    const RetrievalConfig& config() const { return config_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    RetrievalConfig config_;
};

} // namespace volley::rag
