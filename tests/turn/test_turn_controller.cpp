/**
 * test_turn_controller.cpp - Turn-taking, single-flight and barge-in tests
 */

#include "volley/audio/AudioEgress.hpp"
#include "volley/pipeline/ResponsePipeline.hpp"
#include "volley/turn/TurnController.hpp"
#include "support/Fakes.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace volley;
using namespace volley::testing;
using namespace std::chrono_literals;

namespace {

struct Harness {
    FakeTranscriber transcriber;
    FakeRetriever retriever;
    FakeGenerator generator;
    FakeSynthesizer synth;
    RecordingSink sink;

    // Written under the controller lock or on its worker; outlive the controller
    std::vector<turn::TurnState> states;
    std::vector<size_t> sealed_sizes;
    std::vector<uint64_t> barge_ins;
    std::vector<std::string> responses;
    std::vector<std::string> errors;

    pipeline::ResponsePipeline pipeline;
    audio::AudioEgress egress;
    turn::TurnController controller;

    explicit Harness(const turn::TurnConfig& config = turn::TurnConfig{})
        : pipeline(pipeline::PipelineConfig{}, transcriber, retriever, generator)
        , egress(sink, audio::EgressConfig{})
        , controller(config, pipeline, synth, egress)
    {
        turn::TurnCallbacks callbacks;
        callbacks.onStateChange = [this](turn::TurnState s) { states.push_back(s); };
        callbacks.onSegmentSealed = [this](uint64_t, size_t bytes) { sealed_sizes.push_back(bytes); };
        callbacks.onBargeIn = [this](uint64_t id) { barge_ins.push_back(id); };
        callbacks.onAssistantResponse = [this](const std::string& text) { responses.push_back(text); };
        callbacks.onError = [this](const std::string& error) { errors.push_back(error); };
        controller.setCallbacks(std::move(callbacks));
    }

    void feed(const audio::AudioFrame& frame, int count) {
        for (int i = 0; i < count; ++i) controller.onFrame(frame);
    }

    // 3 voiced frames then a full hangover of silence: one sealed segment
    void utterance() {
        feed(loud(), 3);
        feed(quiet(), 10);
    }
};

// Header plus 16-bit mono samples of N 30 ms frames at 16 kHz
constexpr size_t segmentBytes(size_t frames) { return 44 + frames * 480 * 2; }

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // anonymous namespace

void test_segment_holds_exactly_the_speech() {
    Harness h;
    h.transcriber.gate.close();

    h.feed(loud(), 3);
    assert(h.controller.state() == turn::TurnState::Listening);
    assert(h.controller.bufferedFrames() == 3);

    h.feed(quiet(), 12);
    assert(h.controller.state() == turn::TurnState::Processing);
    assert(h.controller.turnsStarted() == 1);
    assert(h.sealed_sizes.size() == 1);
    assert(h.sealed_sizes[0] == segmentBytes(3));

    assert(h.transcriber.gate.waitForWaiter(2000ms));
    assert(h.transcriber.segment_sizes[0] == segmentBytes(3));
    assert(h.transcriber.last_language == "fr");

    h.transcriber.gate.open();
    assert(h.controller.waitUntilIdle(5000ms));

    // 33 characters at 10 ms each, 24 kHz
    assert(h.sink.sampleCount() == 7920);
    assert(h.sink.frameCount() == 4);

    std::vector<turn::TurnState> expected = {
        turn::TurnState::Listening, turn::TurnState::Processing,
        turn::TurnState::Speaking, turn::TurnState::Idle};
    assert(h.states == expected);
    assert(h.responses.size() == 1);
    assert(h.generator.last_context.has_value());

    std::cout << "[PASS] test_segment_holds_exactly_the_speech" << std::endl;
}

void test_short_noise_is_not_a_turn() {
    Harness h;

    h.feed(loud(), 2);
    h.feed(quiet(), 20);
    h.feed(loud(), 1);
    h.feed(quiet(), 20);

    assert(h.controller.state() == turn::TurnState::Idle);
    assert(h.controller.turnsStarted() == 0);
    assert(h.controller.bufferedFrames() == 0);
    assert(h.states.empty());

    std::cout << "[PASS] test_short_noise_is_not_a_turn" << std::endl;
}

void test_brief_pause_stays_in_one_segment() {
    Harness h;
    h.transcriber.gate.close();

    h.feed(loud(), 5);
    h.feed(quiet(), 4);   // Shorter than the hangover
    h.feed(loud(), 2);
    h.feed(quiet(), 10);

    assert(h.controller.turnsStarted() == 1);
    assert(h.sealed_sizes.size() == 1);
    // Pause frames rejoin the segment once speech resumes
    assert(h.sealed_sizes[0] == segmentBytes(11));

    h.transcriber.gate.open();
    assert(h.controller.waitUntilIdle(5000ms));

    std::cout << "[PASS] test_brief_pause_stays_in_one_segment" << std::endl;
}

void test_long_utterance_is_truncated_at_the_front() {
    turn::TurnConfig config;
    config.max_segment_ms = 300;
    Harness h(config);
    h.transcriber.gate.close();

    h.feed(loud(), 25);
    h.feed(quiet(), 10);

    assert(h.sealed_sizes.size() == 1);
    assert(h.sealed_sizes[0] == segmentBytes(10));

    h.transcriber.gate.open();
    assert(h.controller.waitUntilIdle(5000ms));

    std::cout << "[PASS] test_long_utterance_is_truncated_at_the_front" << std::endl;
}

void test_single_flight_while_processing() {
    Harness h;
    h.transcriber.gate.close();

    h.utterance();
    assert(h.controller.state() == turn::TurnState::Processing);
    assert(h.transcriber.gate.waitForWaiter(2000ms));

    // The user keeps talking while the first turn is in the pipeline
    h.utterance();
    h.utterance();

    assert(h.controller.turnsStarted() == 1);
    assert(h.controller.bargeInPending());
    assert(h.transcriber.probe.calls() == 1);
    assert(h.controller.state() == turn::TurnState::Processing);
    assert(h.sealed_sizes.size() == 1);

    h.transcriber.gate.open();

    // Each reply is superseded by the next utterance; only the last one is played
    assert(h.controller.waitUntilIdle(5000ms));
    assert(h.controller.turnsStarted() == 3);
    assert(h.transcriber.probe.calls() == 3);
    assert((h.barge_ins == std::vector<uint64_t>{1, 2}));
    assert(h.sealed_sizes.size() == 3);
    for (size_t bytes : h.sealed_sizes) assert(bytes == segmentBytes(3));
    assert(h.responses.size() == 1);
    assert(h.sink.frameCount() > 0);
    assert(h.egress.activeJobs() == 0 && h.pipeline.activeCalls() == 0);

    assert(h.transcriber.probe.maxConcurrent() == 1);
    assert(h.generator.probe.maxConcurrent() == 1);
    assert(h.synth.probe.maxConcurrent() <= 1);

    std::cout << "[PASS] test_single_flight_while_processing" << std::endl;
}

void test_question_asked_while_processing_is_answered() {
    Harness h;
    h.transcriber.gate.close();

    h.utterance();
    assert(h.transcriber.gate.waitForWaiter(2000ms));

    // A stray click, then a full 600 ms question, all before the first reply
    h.feed(loud(), 1);
    h.feed(quiet(), 5);
    h.feed(loud(), 20);
    h.feed(quiet(), 10);
    assert(h.controller.turnsStarted() == 1);
    assert(h.controller.bargeInPending());
    assert(h.controller.bufferedFrames() == 0);

    h.transcriber.gate.open();
    assert(h.controller.waitUntilIdle(5000ms));

    assert(h.controller.turnsStarted() == 2);
    assert(h.sealed_sizes.size() == 2);
    assert(h.sealed_sizes[1] == segmentBytes(20));
    assert(h.transcriber.probe.calls() == 2);
    assert(h.transcriber.segment_sizes[1] == segmentBytes(20));
    assert((h.barge_ins == std::vector<uint64_t>{1}));
    assert(h.responses.size() == 1);
    assert(h.sink.frameCount() > 0);

    std::cout << "[PASS] test_question_asked_while_processing_is_answered" << std::endl;
}

void test_barge_in_during_speaking() {
    Harness h;
    h.synth.ms_per_char = 100;  // 3.3 s reply, 33 egress frames

    h.utterance();
    assert(h.controller.waitForState(turn::TurnState::Speaking, 3000ms));
    assert(eventually([&]() { return h.sink.frameCount() >= 2; }));

    h.feed(loud(), 2);
    assert(h.controller.state() == turn::TurnState::Speaking);
    h.feed(loud(), 1);

    // Interrupted synchronously on the onset frame; the onset frames open the new segment
    assert(h.controller.state() == turn::TurnState::Listening);
    assert(h.controller.bufferedFrames() == 3);
    assert(h.controller.vadSpeaking());
    assert(h.controller.currentTurnId() == 0);
    assert(h.barge_ins.size() == 1 && h.barge_ins[0] == 1);

    assert(eventually([&]() { return h.egress.activeJobs() == 0; }));
    size_t sent = h.sink.frameCount();
    assert(sent < 33);
    std::this_thread::sleep_for(250ms);
    assert(h.sink.frameCount() == sent);
    assert(h.responses.empty());

    // The rest of the interrupting utterance completes the next turn
    h.synth.ms_per_char = 10;
    h.feed(loud(), 3);
    h.feed(quiet(), 10);
    assert(h.controller.turnsStarted() == 2);
    assert(h.sealed_sizes.size() == 2);
    assert(h.sealed_sizes[1] == segmentBytes(6));
    assert(h.controller.waitUntilIdle(5000ms));
    assert(h.responses.size() == 1);
    assert(h.egress.activeJobs() == 0);

    std::cout << "[PASS] test_barge_in_during_speaking (" << sent << "/33 frames played)" << std::endl;
}

void test_short_barge_in_becomes_the_next_turn() {
    Harness h;
    h.synth.ms_per_char = 100;

    h.utterance();
    assert(h.controller.waitForState(turn::TurnState::Speaking, 3000ms));
    h.transcriber.gate.close();

    h.feed(loud(), 3);
    assert(h.controller.state() == turn::TurnState::Listening);

    h.feed(quiet(), 9);
    assert(h.controller.state() == turn::TurnState::Listening);
    h.feed(quiet(), 1);
    assert(h.controller.state() == turn::TurnState::Processing);
    assert(h.controller.turnsStarted() == 2);
    assert(h.sealed_sizes.size() == 2 && h.sealed_sizes[1] == segmentBytes(3));

    h.synth.ms_per_char = 10;
    h.transcriber.gate.open();
    assert(h.controller.waitUntilIdle(5000ms));

    std::cout << "[PASS] test_short_barge_in_becomes_the_next_turn" << std::endl;
}

void test_callbacks_replaced_during_a_turn() {
    std::mutex mutex;
    std::vector<std::string> replaced;

    Harness h;
    h.transcriber.gate.close();

    h.utterance();
    assert(h.transcriber.gate.waitForWaiter(2000ms));

    turn::TurnCallbacks callbacks;
    callbacks.onAssistantResponse = [&](const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex);
        replaced.push_back(text);
    };
    h.controller.setCallbacks(std::move(callbacks));

    // A running turn keeps the callbacks it started with
    h.transcriber.gate.open();
    assert(h.controller.waitUntilIdle(5000ms));
    assert(h.responses.size() == 1);
    {
        std::lock_guard<std::mutex> lock(mutex);
        assert(replaced.empty());
    }

    h.utterance();
    assert(h.controller.waitUntilIdle(5000ms));
    assert(h.responses.size() == 1);
    {
        std::lock_guard<std::mutex> lock(mutex);
        assert(replaced.size() == 1);
    }

    std::cout << "[PASS] test_callbacks_replaced_during_a_turn" << std::endl;
}

void test_empty_transcription_goes_idle_silently() {
    Harness h;
    h.transcriber.transcript = "   ";

    h.utterance();
    assert(h.controller.waitUntilIdle(3000ms));

    assert(h.sink.frameCount() == 0);
    assert(h.synth.texts().empty());
    assert(h.retriever.probe.calls() == 0);
    assert(h.generator.probe.calls() == 0);
    assert(h.states.back() == turn::TurnState::Idle);
    for (auto s : h.states) assert(s != turn::TurnState::Speaking);

    std::cout << "[PASS] test_empty_transcription_goes_idle_silently" << std::endl;
}

void test_pipeline_failure_speaks_fallback() {
    Harness h;
    h.generator.fail = true;

    h.utterance();
    assert(h.controller.waitUntilIdle(5000ms));

    auto texts = h.synth.texts();
    assert(texts.size() == 1);
    assert(texts[0] == turn::TurnConfig{}.fallback_utterance);
    assert(h.sink.frameCount() > 0);
    assert(h.errors.size() == 1);
    assert(h.states.back() == turn::TurnState::Idle);

    std::cout << "[PASS] test_pipeline_failure_speaks_fallback" << std::endl;
}

void test_transcription_failure_speaks_fallback() {
    Harness h;
    h.transcriber.fail = true;

    h.utterance();
    assert(h.controller.waitUntilIdle(5000ms));

    auto texts = h.synth.texts();
    assert(texts.size() == 1 && texts[0] == turn::TurnConfig{}.fallback_utterance);
    assert(h.retriever.probe.calls() == 0);

    std::cout << "[PASS] test_transcription_failure_speaks_fallback" << std::endl;
}

void test_synthesis_failure_falls_back() {
    Harness h;
    h.synth.fail_on = {h.generator.reply};

    h.utterance();
    assert(h.controller.waitUntilIdle(5000ms));

    auto texts = h.synth.texts();
    assert(texts.size() == 2);
    assert(texts[0] == h.generator.reply);
    assert(texts[1] == turn::TurnConfig{}.fallback_utterance);
    assert(h.sink.frameCount() > 0);
    assert(h.responses.size() == 1 && h.responses[0] == turn::TurnConfig{}.fallback_utterance);

    std::cout << "[PASS] test_synthesis_failure_falls_back" << std::endl;
}

void test_fallback_failure_ends_silently() {
    Harness h;
    h.synth.fail_all = true;

    h.utterance();
    assert(h.controller.waitUntilIdle(5000ms));

    assert(h.sink.frameCount() == 0);
    assert(h.responses.empty());
    assert(h.controller.state() == turn::TurnState::Idle);

    // Still usable afterwards
    h.synth.fail_all = false;
    h.utterance();
    assert(h.controller.waitUntilIdle(5000ms));
    assert(h.sink.frameCount() > 0);

    std::cout << "[PASS] test_fallback_failure_ends_silently" << std::endl;
}

void test_sentences_are_played_in_order() {
    Harness h;
    h.generator.reply = "Harvard a été fondée en 1636. Sa devise est Veritas!";

    h.utterance();
    assert(h.controller.waitUntilIdle(5000ms));

    auto texts = h.synth.texts();
    assert(texts.size() == 2);
    assert(texts[0] == "Harvard a été fondée en 1636.");
    assert(texts[1] == "Sa devise est Veritas!");

    // Sequence numbers run on across sentences
    auto frames = h.sink.frames();
    for (size_t i = 1; i < frames.size(); ++i) {
        assert(frames[i].sequence == frames[i - 1].sequence + 1);
    }

    std::cout << "[PASS] test_sentences_are_played_in_order" << std::endl;
}

void test_speak_greeting() {
    Harness h;

    assert(h.controller.speak("Bonjour! Comment puis-je vous aider?"));
    assert(!h.controller.speak("Encore?"));
    assert(h.controller.waitUntilIdle(5000ms));

    auto texts = h.synth.texts();
    assert(texts.size() == 2);  // Two sentences
    assert(h.transcriber.probe.calls() == 0);
    assert(h.sink.frameCount() > 0);
    assert(h.controller.turnsStarted() == 1);

    std::cout << "[PASS] test_speak_greeting" << std::endl;
}

void test_shutdown_cancels_playback() {
    auto h = std::make_unique<Harness>();
    h->synth.ms_per_char = 200;

    h->utterance();
    assert(h->controller.waitForState(turn::TurnState::Speaking, 3000ms));

    auto start = std::chrono::steady_clock::now();
    h->controller.shutdown();
    auto elapsed = std::chrono::steady_clock::now() - start;
    assert(elapsed < 2000ms);
    assert(h->egress.activeJobs() == 0);

    // Frames after shutdown are ignored
    h->feed(loud(), 5);
    assert(h->controller.turnsStarted() == 1);

    std::cout << "[PASS] test_shutdown_cancels_playback" << std::endl;
}

int main() {
    std::cout << "=== TurnController Tests ===" << std::endl;

    test_segment_holds_exactly_the_speech();
    test_short_noise_is_not_a_turn();
    test_brief_pause_stays_in_one_segment();
    test_long_utterance_is_truncated_at_the_front();
    test_single_flight_while_processing();
    test_question_asked_while_processing_is_answered();
    test_barge_in_during_speaking();
    test_short_barge_in_becomes_the_next_turn();
    test_callbacks_replaced_during_a_turn();
    test_empty_transcription_goes_idle_silently();
    test_pipeline_failure_speaks_fallback();
    test_transcription_failure_speaks_fallback();
    test_synthesis_failure_falls_back();
    test_fallback_failure_ends_silently();
    test_sentences_are_played_in_order();
    test_speak_greeting();
    test_shutdown_cancels_playback();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
