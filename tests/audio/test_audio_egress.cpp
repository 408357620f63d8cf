/**
 * test_audio_egress.cpp - Framing, real-time pacing and cancellation of playback
 */

#include "volley/audio/AudioEgress.hpp"
#include "support/Fakes.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

using namespace volley::audio;
using volley::testing::RecordingSink;

namespace {

Waveform tone(int sample_rate, size_t samples) {
    Waveform wave;
    wave.sample_rate = sample_rate;
    wave.channels = 1;
    wave.samples.assign(samples, 1234);
    return wave;
}

} // anonymous namespace

void test_job_framing() {
    EgressJob job(tone(24000, 5000), 2400, 7);
    assert(job.framesTotal() == 3);

    AudioFrame frame;
    assert(job.next(frame));
    assert(frame.samples.size() == 2400);
    assert(frame.sequence == 7);
    assert(job.next(frame));
    assert(job.next(frame));
    // Short final frame, never padded past the source
    assert(frame.samples.size() == 200);
    assert(frame.sequence == 9);
    assert(job.done());
    assert(!job.next(frame));
    assert(job.samplesEmitted() == 5000);

    std::cout << "[PASS] test_job_framing" << std::endl;
}

void test_plays_in_real_time() {
    RecordingSink sink;
    AudioEgress egress(sink, EgressConfig{});  // 24 kHz, 100 ms frames
    CancellationToken token;

    auto start = std::chrono::steady_clock::now();
    auto result = egress.play(tone(24000, 8400), token);
    auto elapsed = std::chrono::steady_clock::now() - start;

    assert(!result.cancelled);
    assert(result.frames_total == 4);
    assert(result.frames_sent == 4);
    assert(result.samples_sent == 8400);
    assert(sink.frameCount() == 4);
    assert(sink.sampleCount() == 8400);
    // 350 ms of audio is not dumped all at once
    assert(elapsed >= std::chrono::milliseconds(300));
    assert(egress.activeJobs() == 0);

    std::cout << "[PASS] test_plays_in_real_time" << std::endl;
}

void test_cancel_stops_mid_utterance() {
    RecordingSink sink;
    AudioEgress egress(sink, EgressConfig{});
    CancellationToken token;

    std::thread canceller([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        token.cancel();
    });

    auto start = std::chrono::steady_clock::now();
    auto result = egress.play(tone(24000, 24000), token);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    assert(result.cancelled);
    assert(result.frames_total == 10);
    assert(result.frames_sent >= 1 && result.frames_sent < 10);
    assert(sink.frameCount() == result.frames_sent);
    // The pacing wait wakes up on cancellation
    assert(elapsed < std::chrono::milliseconds(600));

    std::cout << "[PASS] test_cancel_stops_mid_utterance" << std::endl;
}

void test_precancelled_sends_nothing() {
    RecordingSink sink;
    AudioEgress egress(sink, EgressConfig{});
    CancellationToken token;
    token.cancel();

    auto result = egress.play(tone(24000, 4800), token);
    assert(result.cancelled);
    assert(result.frames_sent == 0);
    assert(sink.frameCount() == 0);

    // Empty audio is a no-op
    CancellationToken fresh;
    result = egress.play(Waveform{}, fresh);
    assert(!result.cancelled);
    assert(result.frames_total == 0);

    std::cout << "[PASS] test_precancelled_sends_nothing" << std::endl;
}

void test_output_format_conformed() {
    RecordingSink sink;
    EgressConfig config;
    config.sample_rate = 16000;
    config.channels = 2;
    config.frame_ms = 20;
    AudioEgress egress(sink, config);
    CancellationToken token;

    // 40 ms at 32 kHz mono becomes 40 ms at 16 kHz stereo
    auto result = egress.play(tone(32000, 1280), token);
    assert(result.frames_sent == 2);

    auto frames = sink.frames();
    for (const auto& f : frames) {
        assert(f.sample_rate == 16000);
        assert(f.channels == 2);
        assert(f.sampleCount() == 320);
    }

    std::cout << "[PASS] test_output_format_conformed" << std::endl;
}

void test_sequence_continues_across_utterances() {
    RecordingSink sink;
    EgressConfig config;
    config.frame_ms = 20;
    AudioEgress egress(sink, config);
    CancellationToken token;

    egress.play(tone(24000, 960), token);
    egress.play(tone(24000, 960), token);

    auto frames = sink.frames();
    assert(frames.size() == 4);
    for (size_t i = 0; i < frames.size(); ++i) {
        assert(frames[i].sequence == i);
    }

    std::cout << "[PASS] test_sequence_continues_across_utterances" << std::endl;
}

int main() {
    std::cout << "=== AudioEgress Tests ===" << std::endl;

    test_job_framing();
    test_plays_in_real_time();
    test_cancel_stops_mid_utterance();
    test_precancelled_sends_nothing();
    test_output_format_conformed();
    test_sequence_continues_across_utterances();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
