/**
 * Retriever.hpp - Knowledge-base search collaborator interface
 */

#pragma once

#include <string>
#include <vector>

namespace volley::rag {

struct Document {
    std::string text;
    double score = 0.0;
};

class Retriever {
public:
    virtual ~Retriever() = default;

    // Ranked best first. Empty means no context. Throws CollaboratorError on failure.
    virtual std::vector<Document> retrieve(const std::string& text, int top_k, double score_threshold) = 0;
};

} // namespace volley::rag
