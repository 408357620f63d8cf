/**
 * Orchestrator.cpp - Session wiring and main frame loop
 *
 * Connects: FrameChannel -> TurnController -> ResponsePipeline -> AudioEgress -> AudioSink
 */

#include "volley/Orchestrator.hpp"
#include "volley/audio/AudioEgress.hpp"
#include "volley/audio/WavCodec.hpp"
#include "volley/llm/ConversationEngine.hpp"
#include "volley/rag/QdrantRetriever.hpp"
#include "volley/stt/HttpTranscriber.hpp"
#include "volley/tts/TTSEngine.hpp"

#ifdef VOLLEY_HAS_WHISPER
#include "volley/stt/WhisperTranscriber.hpp"
#endif

#include <atomic>
#include <chrono>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace volley {

Collaborators buildCollaborators(const Config& config, bool check_health) {
    std::cout << "[Orchestrator] Initializing components..." << std::endl;
    Collaborators c;

    // STT
    if (config.speech.stt_engine == "whisper") {
#ifdef VOLLEY_HAS_WHISPER
        auto whisper = std::make_unique<stt::WhisperTranscriber>(config.speech.whisper_model,
                                                                 config.speech.whisper_threads);
        if (check_health && !whisper->isReady()) {
            std::cerr << "[Orchestrator] Warning: whisper model not loaded" << std::endl;
        }
        c.transcriber = std::move(whisper);
#else
        throw std::invalid_argument("speech.stt_engine \"whisper\" requested but whisper.cpp support is not built in");
#endif
    } else {
        c.transcriber = std::make_unique<stt::HttpTranscriber>(config.speech.stt_url, config.speech.stt_timeout_ms);
    }

    // Retrieval
    auto retriever = std::make_unique<rag::QdrantRetriever>(config.retrieval);
    if (check_health && !retriever->isReady()) {
        std::cerr << "[Orchestrator] Warning: knowledge base unavailable, answers will have no context" << std::endl;
    }
    c.retriever = std::move(retriever);

    // LLM
    auto generator = std::make_unique<llm::ConversationEngine>(config.generation);
    if (check_health && !generator->isReady()) {
        std::cerr << "[Orchestrator] Warning: LLM endpoint not healthy at " << config.generation.base_url << std::endl;
    }
    c.generator = std::move(generator);

    // TTS
    auto synthesizer = std::make_unique<tts::TTSEngine>(config.speech.tts);
    if (check_health && !synthesizer->isHealthy()) {
        std::cerr << "[Orchestrator] Warning: TTS server not running at " << config.speech.tts.server_url << std::endl;
    }
    c.synthesizer = std::move(synthesizer);

    std::cout << "[Orchestrator] All components initialized!" << std::endl;
    return c;
}

struct Orchestrator::Impl {
    Config config;
    Collaborators collaborators;
    pipeline::ResponsePipeline responder;
    audio::AudioEgress egress;
    turn::TurnController controller;

    std::atomic<bool> running{false};
    std::thread worker_thread;

    Impl(const Config& cfg, Collaborators collabs, audio::AudioSink& sink)
        : config(cfg)
        , collaborators(std::move(collabs))
        , responder(config.pipelineConfig(), *collaborators.transcriber,
                   *collaborators.retriever, *collaborators.generator)
        , egress(sink, config.egressConfig())
        , controller(config.turnConfig(), responder, *collaborators.synthesizer, egress)
    {
    }

    void greet() {
        std::string greeting = responder.smallTalk().respond(pipeline::SmallTalk::Greeting);
        if (greeting.empty()) return;
        std::cout << "[Orchestrator] Greeting: " << greeting << std::endl;
        if (!controller.speak(greeting)) {
            std::cerr << "[Orchestrator] Greeting skipped (controller busy)" << std::endl;
        }
    }

    // Caller sets running
    void loop(audio::FrameChannel& frames) {
        std::cout << "[Orchestrator] Running... (say something)" << std::endl;

        if (config.session.greet_on_start) {
            greet();
        }

        uint64_t frames_seen = 0;
        while (running) {
            auto frame = frames.popFor(std::chrono::milliseconds(100));
            if (!frame) {
                if (frames.closed()) break;
                continue;
            }
            controller.onFrame(*frame);
            frames_seen++;
        }

        running = false;
        std::cout << "[Orchestrator] Session ended after " << frames_seen << " frames ("
                  << frames.dropped() << " dropped)" << std::endl;
    }

    AskResult ask(const std::string& text) {
        AskResult result;
        result.outcome = responder.answerText(text);

        switch (result.outcome.kind) {
            case pipeline::TurnOutcome::Kind::Reply:
                result.spoken = result.outcome.reply;
                break;
            case pipeline::TurnOutcome::Kind::Failed:
                result.spoken = config.session.fallback_utterance;
                break;
            case pipeline::TurnOutcome::Kind::NoSpeech:
                return result;
        }

        try {
            result.audio = audio::conform(collaborators.synthesizer->synthesize(result.spoken),
                                          config.session.output_sample_rate,
                                          config.session.output_channels);
        } catch (const std::exception& e) {
            std::cerr << "[Orchestrator] Synthesis failed: " << e.what() << std::endl;
        }
        return result;
    }
};

Orchestrator::Orchestrator(const Config& config, Collaborators collaborators, audio::AudioSink& sink) {
    if (!collaborators.transcriber || !collaborators.retriever ||
        !collaborators.generator || !collaborators.synthesizer) {
        throw std::invalid_argument("Orchestrator needs all four collaborators");
    }
    impl_ = std::make_unique<Impl>(config, std::move(collaborators), sink);
}

Orchestrator::~Orchestrator() {
    stop();
    impl_->controller.shutdown();
}

void Orchestrator::run(audio::FrameChannel& frames) {
    impl_->running = true;
    impl_->loop(frames);
}

void Orchestrator::start(audio::FrameChannel& frames) {
    impl_->running = true;
    impl_->worker_thread = std::thread([this, &frames]() { impl_->loop(frames); });
}

void Orchestrator::stop() {
    impl_->running = false;
    if (impl_->worker_thread.joinable()) {
        impl_->worker_thread.join();
    }
}

bool Orchestrator::isRunning() const {
    return impl_->running;
}

AskResult Orchestrator::ask(const std::string& text) {
    return impl_->ask(text);
}

turn::TurnState Orchestrator::state() const {
    return impl_->controller.state();
}

turn::TurnController& Orchestrator::controller() {
    return impl_->controller;
}

pipeline::ResponsePipeline& Orchestrator::responsePipeline() {
    return impl_->responder;
}

void Orchestrator::setCallbacks(turn::TurnCallbacks callbacks) {
    impl_->controller.setCallbacks(std::move(callbacks));
}

} // namespace volley
