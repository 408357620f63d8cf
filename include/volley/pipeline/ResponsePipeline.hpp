/**
 * ResponsePipeline.hpp - Transcribe -> small talk | retrieve -> generate
 */

#pragma once

#include "volley/llm/Generator.hpp"
#include "volley/pipeline/SmallTalkClassifier.hpp"
#include "volley/rag/Retriever.hpp"
#include "volley/stt/Transcriber.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace volley::pipeline {

struct PipelineConfig {
    std::string language = "fr";
    int top_k = 3;
    double score_threshold = 0.7;
    SmallTalkConfig small_talk;
};

struct TurnOutcome {
    enum class Kind {
        Reply,     // reply holds the text to speak
        NoSpeech,  // blank transcript, nothing to say
        Failed     // error holds the collaborator failure
    };

    Kind kind = Kind::NoSpeech;
    std::string transcript;
    std::string reply;
    std::string error;
    SmallTalk small_talk = SmallTalk::None;
    size_t documents = 0;

    bool ok() const { return kind == Kind::Reply; }
};

const char* toString(TurnOutcome::Kind kind);

/**
 * Number the qualifying documents ("[Document N]: text"), best first, joined
 * by blank lines. Documents under the threshold or past top_k are skipped.
 */
std::string formatContext(const std::vector<rag::Document>& documents, int top_k, double score_threshold);

class ResponsePipeline {
public:
    ResponsePipeline(const PipelineConfig& config,
                     stt::Transcriber& transcriber,
                     rag::Retriever& retriever,
                     llm::Generator& generator);

    /**
     * Run one turn on a sealed segment. Never throws: collaborator failures
     * come back as Kind::Failed.
     */
    TurnOutcome runTurn(const std::vector<uint8_t>& segment);

    // Steps after transcription, for typed input
    TurnOutcome answerText(const std::string& text);

    SmallTalkClassifier& smallTalk() { return small_talk_; }
    const PipelineConfig& config() const { return config_; }

    // Invocations currently inside runTurn/answerText
    int activeCalls() const { return active_calls_.load(); }

private:
    TurnOutcome answer(TurnOutcome outcome);

    PipelineConfig config_;
    stt::Transcriber& transcriber_;
    rag::Retriever& retriever_;
    llm::Generator& generator_;
    SmallTalkClassifier small_talk_;
    std::atomic<int> active_calls_{0};
};

} // namespace volley::pipeline
