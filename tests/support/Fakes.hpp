/**
 * Fakes.hpp - In-process collaborators for the turn-taking tests
 *
 * Every fake counts its calls and the highest number of overlapping calls,
 * and can be told to fail or to block until released.
 */

#pragma once

#include "volley/Errors.hpp"
#include "volley/audio/AudioFrame.hpp"
#include "volley/audio/AudioSink.hpp"
#include "volley/llm/Generator.hpp"
#include "volley/rag/Retriever.hpp"
#include "volley/stt/Transcriber.hpp"
#include "volley/tts/Synthesizer.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace volley::testing {

// Tracks concurrent entries into a fake
class ConcurrencyProbe {
public:
    struct Scope {
        ConcurrencyProbe& probe;
        explicit Scope(ConcurrencyProbe& p) : probe(p) {
            int now = ++probe.current_;
            int seen = probe.max_.load();
            while (now > seen && !probe.max_.compare_exchange_weak(seen, now)) {}
            probe.calls_++;
        }
        ~Scope() { probe.current_--; }
    };

    int calls() const { return calls_.load(); }
    int maxConcurrent() const { return max_.load(); }

private:
    std::atomic<int> current_{0};
    std::atomic<int> max_{0};
    std::atomic<int> calls_{0};
};

// Blocks callers until open() is called; starts open
class Gate {
public:
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
    }

    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    void pass() {
        std::unique_lock<std::mutex> lock(mutex_);
        waiting_++;
        cv_.notify_all();
        cv_.wait(lock, [this]() { return open_; });
        waiting_--;
    }

    // True once a caller is parked at the gate
    bool waitForWaiter(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return waiting_ > 0; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = true;
    int waiting_ = 0;
};

class FakeTranscriber : public stt::Transcriber {
public:
    std::string transcript = "Quelle est la devise de Harvard ?";
    bool fail = false;
    Gate gate;
    ConcurrencyProbe probe;
    std::vector<size_t> segment_sizes;
    std::string last_language;

    std::string transcribe(const std::vector<uint8_t>& wav, const std::string& language_hint) override {
        ConcurrencyProbe::Scope scope(probe);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            segment_sizes.push_back(wav.size());
            last_language = language_hint;
        }
        gate.pass();
        if (fail) {
            throw CollaboratorError("FakeTranscriber", "service unavailable");
        }
        return transcript;
    }

    size_t segments() {
        std::lock_guard<std::mutex> lock(mutex_);
        return segment_sizes.size();
    }

private:
    std::mutex mutex_;
};

class FakeRetriever : public rag::Retriever {
public:
    std::vector<rag::Document> documents = {
        {"Harvard's motto is Veritas.", 0.91},
        {"Harvard was founded in 1636.", 0.74},
    };
    bool fail = false;
    ConcurrencyProbe probe;

    std::vector<rag::Document> retrieve(const std::string& /*text*/, int /*top_k*/, double /*score_threshold*/) override {
        ConcurrencyProbe::Scope scope(probe);
        if (fail) {
            throw CollaboratorError("FakeRetriever", "search failed");
        }
        return documents;
    }
};

class FakeGenerator : public llm::Generator {
public:
    std::string reply = "La devise de Harvard est Veritas.";
    bool fail = false;
    ConcurrencyProbe probe;
    std::optional<std::string> last_context;
    std::string last_text;

    std::string generate(const std::string& text, const std::optional<std::string>& context) override {
        ConcurrencyProbe::Scope scope(probe);
        last_text = text;
        last_context = context;
        if (fail) {
            throw CollaboratorError("FakeGenerator", "rate limited");
        }
        return reply;
    }
};

/**
 * Synthesizes a tone lasting `ms_per_char` per input character, so longer
 * text plays longer. Texts listed in fail_on throw.
 */
class FakeSynthesizer : public tts::Synthesizer {
public:
    int sample_rate = 24000;
    int ms_per_char = 10;
    bool fail_all = false;
    std::vector<std::string> fail_on;
    ConcurrencyProbe probe;

    audio::Waveform synthesize(const std::string& text) override {
        ConcurrencyProbe::Scope scope(probe);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            texts_.push_back(text);
        }
        if (fail_all || std::find(fail_on.begin(), fail_on.end(), text) != fail_on.end()) {
            throw CollaboratorError("FakeSynthesizer", "voice not loaded");
        }

        audio::Waveform wave;
        wave.sample_rate = sample_rate;
        wave.channels = 1;
        const size_t n = static_cast<size_t>(sample_rate) * text.size() * ms_per_char / 1000;
        wave.samples.resize(n);
        for (size_t i = 0; i < n; ++i) {
            wave.samples[i] = static_cast<int16_t>(8000.0 * std::sin(static_cast<double>(i) * 0.05));
        }
        return wave;
    }

    std::vector<std::string> texts() {
        std::lock_guard<std::mutex> lock(mutex_);
        return texts_;
    }

private:
    std::mutex mutex_;
    std::vector<std::string> texts_;
};

class RecordingSink : public audio::AudioSink {
public:
    void sendFrame(const audio::AudioFrame& frame) override {
        std::lock_guard<std::mutex> lock(mutex_);
        frames_.push_back(frame);
    }

    size_t frameCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_.size();
    }

    size_t sampleCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t total = 0;
        for (const auto& f : frames_) total += f.sampleCount();
        return total;
    }

    std::vector<audio::AudioFrame> frames() {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_;
    }

private:
    std::mutex mutex_;
    std::vector<audio::AudioFrame> frames_;
};

// Constant-amplitude frame; amplitude 0 is digital silence
inline audio::AudioFrame makeFrame(int16_t amplitude, int sample_rate = 16000, int frame_ms = 30,
                                   int channels = 1, uint64_t sequence = 0) {
    audio::AudioFrame frame;
    frame.sample_rate = sample_rate;
    frame.channels = channels;
    frame.sequence = sequence;
    frame.samples.assign(static_cast<size_t>(sample_rate) * frame_ms / 1000 * channels, amplitude);
    return frame;
}

// RMS about 0.3, well above the default threshold
inline audio::AudioFrame loud(uint64_t sequence = 0) { return makeFrame(10000, 16000, 30, 1, sequence); }
inline audio::AudioFrame quiet(uint64_t sequence = 0) { return makeFrame(0, 16000, 30, 1, sequence); }

} // namespace volley::testing
