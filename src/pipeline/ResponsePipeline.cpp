/**
 * ResponsePipeline.cpp - Sequencing of the external collaborators for one turn
 *
 * The only place collaborator exceptions are caught; every failure turns into
 * a TurnOutcome the turn controller can act on.
 */

#include "volley/pipeline/ResponsePipeline.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>
#include <sstream>

namespace volley::pipeline {

namespace {

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string trimmed(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// Keeps active_calls_ balanced on every return path
struct CallScope {
    std::atomic<int>& counter;
    explicit CallScope(std::atomic<int>& c) : counter(c) { counter++; }
    ~CallScope() { counter--; }
};

} // anonymous namespace

const char* toString(TurnOutcome::Kind kind) {
    switch (kind) {
        case TurnOutcome::Kind::Reply: return "reply";
        case TurnOutcome::Kind::NoSpeech: return "no-speech";
        case TurnOutcome::Kind::Failed: return "failed";
    }
    return "unknown";
}

std::string formatContext(const std::vector<rag::Document>& documents, int top_k, double score_threshold) {
    std::vector<const rag::Document*> ranked;
    for (const auto& doc : documents) {
        if (doc.score >= score_threshold && !isBlank(doc.text)) {
            ranked.push_back(&doc);
        }
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const rag::Document* a, const rag::Document* b) { return a->score > b->score; });
    if (top_k >= 0 && ranked.size() > static_cast<size_t>(top_k)) {
        ranked.resize(static_cast<size_t>(top_k));
    }

    std::ostringstream context;
    for (size_t i = 0; i < ranked.size(); ++i) {
        if (i > 0) context << "\n\n";
        context << "[Document " << (i + 1) << "]: " << trimmed(ranked[i]->text);
    }
    return context.str();
}

ResponsePipeline::ResponsePipeline(const PipelineConfig& config,
                                   stt::Transcriber& transcriber,
                                   rag::Retriever& retriever,
                                   llm::Generator& generator)
    : config_(config)
    , transcriber_(transcriber)
    , retriever_(retriever)
    , generator_(generator)
    , small_talk_(config.small_talk)
{
}

TurnOutcome ResponsePipeline::runTurn(const std::vector<uint8_t>& segment) {
    CallScope scope(active_calls_);
    TurnOutcome outcome;

    if (segment.empty()) {
        outcome.kind = TurnOutcome::Kind::NoSpeech;
        return outcome;
    }

    try {
        std::cout << "[ResponsePipeline] Transcribing " << segment.size() << " bytes..." << std::endl;
        outcome.transcript = trimmed(transcriber_.transcribe(segment, config_.language));
    } catch (const std::exception& e) {
        std::cerr << "[ResponsePipeline] Transcription failed: " << e.what() << std::endl;
        outcome.kind = TurnOutcome::Kind::Failed;
        outcome.error = e.what();
        return outcome;
    }

    if (outcome.transcript.empty()) {
        std::cout << "[ResponsePipeline] No speech in segment" << std::endl;
        outcome.kind = TurnOutcome::Kind::NoSpeech;
        return outcome;
    }

    std::cout << "[ResponsePipeline] User: " << outcome.transcript << std::endl;
    return answer(std::move(outcome));
}

TurnOutcome ResponsePipeline::answerText(const std::string& text) {
    CallScope scope(active_calls_);
    TurnOutcome outcome;
    outcome.transcript = trimmed(text);
    if (outcome.transcript.empty()) {
        outcome.kind = TurnOutcome::Kind::NoSpeech;
        return outcome;
    }
    return answer(std::move(outcome));
}

TurnOutcome ResponsePipeline::answer(TurnOutcome outcome) {
    outcome.small_talk = small_talk_.classify(outcome.transcript);
    if (outcome.small_talk != SmallTalk::None) {
        outcome.reply = small_talk_.respond(outcome.small_talk);
        if (!outcome.reply.empty()) {
            std::cout << "[ResponsePipeline] Small talk (" << toString(outcome.small_talk) << ")" << std::endl;
            outcome.kind = TurnOutcome::Kind::Reply;
            return outcome;
        }
    }

    try {
        std::cout << "[ResponsePipeline] Searching knowledge base..." << std::endl;
        auto documents = retriever_.retrieve(outcome.transcript, config_.top_k, config_.score_threshold);

        std::string context = formatContext(documents, config_.top_k, config_.score_threshold);
        outcome.documents = documents.size();
        if (!context.empty()) {
            std::cout << "[ResponsePipeline] Found " << documents.size() << " documents" << std::endl;
        }

        std::cout << "[ResponsePipeline] Generating response..." << std::endl;
        std::optional<std::string> maybe_context;
        if (!context.empty()) maybe_context = context;
        outcome.reply = trimmed(generator_.generate(outcome.transcript, maybe_context));
    } catch (const std::exception& e) {
        std::cerr << "[ResponsePipeline] Answer failed: " << e.what() << std::endl;
        outcome.kind = TurnOutcome::Kind::Failed;
        outcome.error = e.what();
        return outcome;
    }

    if (outcome.reply.empty()) {
        std::cerr << "[ResponsePipeline] Generator returned an empty reply" << std::endl;
        outcome.kind = TurnOutcome::Kind::Failed;
        outcome.error = "empty reply";
        return outcome;
    }

    std::cout << "[ResponsePipeline] Reply: " << outcome.reply << std::endl;
    outcome.kind = TurnOutcome::Kind::Reply;
    return outcome;
}

} // namespace volley::pipeline
