/**
 * Orchestrator.hpp - Session bootstrap and frame-arrival loop
 *
 * Connects: FrameChannel -> TurnController -> ResponsePipeline -> AudioEgress -> AudioSink
 */

#pragma once

#include "volley/Config.hpp"
#include "volley/audio/AudioFrame.hpp"
#include "volley/audio/AudioSink.hpp"
#include "volley/audio/FrameChannel.hpp"
#include "volley/llm/Generator.hpp"
#include "volley/pipeline/ResponsePipeline.hpp"
#include "volley/rag/Retriever.hpp"
#include "volley/stt/Transcriber.hpp"
#include "volley/tts/Synthesizer.hpp"
#include "volley/turn/TurnController.hpp"

#include <memory>
#include <string>

namespace volley {

struct Collaborators {
    std::unique_ptr<stt::Transcriber> transcriber;
    std::unique_ptr<rag::Retriever> retriever;
    std::unique_ptr<llm::Generator> generator;
    std::unique_ptr<tts::Synthesizer> synthesizer;
};

/**
 * Build the HTTP (or whisper.cpp) adapters named by the config.
 * With check_health, unreachable services are reported as warnings.
 * Throws std::invalid_argument if the whisper engine is requested but not built in.
 */
Collaborators buildCollaborators(const Config& config, bool check_health = true);

// Result of a typed question
struct AskResult {
    pipeline::TurnOutcome outcome;
    std::string spoken;    // Reply or fallback that was synthesized
    audio::Waveform audio; // Empty when synthesis failed or there was nothing to say
};

class Orchestrator {
public:
    Orchestrator(const Config& config, Collaborators collaborators, audio::AudioSink& sink);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * Blocking frame loop: greet if configured, then feed every frame from
     * the channel to the turn controller until the channel closes or stop().
     */
    void run(audio::FrameChannel& frames);

    // run() on a background thread
    void start(audio::FrameChannel& frames);
    void stop();
    bool isRunning() const;

    // Answer typed text without the audio session (small talk / retrieval / generation / synthesis)
    AskResult ask(const std::string& text);

    turn::TurnState state() const;
    turn::TurnController& controller();
    pipeline::ResponsePipeline& responsePipeline();

    // Must be set before frames flow
    void setCallbacks(turn::TurnCallbacks callbacks);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace volley
