/**
 * AudioFrame.hpp - PCM value types shared by the audio path
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace volley::audio {

enum class Classification {
    Speech,
    Silence
};

/**
 * One fixed-duration chunk of interleaved 16-bit PCM.
 * Produced by the transport, consumed once by the VAD.
 */
struct AudioFrame {
    std::vector<int16_t> samples;  // Interleaved when channels > 1
    int sample_rate = 16000;
    int channels = 1;
    uint64_t sequence = 0;

    // Samples per channel
    size_t sampleCount() const {
        return channels > 0 ? samples.size() / static_cast<size_t>(channels) : 0;
    }

    int durationMs() const {
        if (sample_rate <= 0) return 0;
        return static_cast<int>(sampleCount() * 1000 / static_cast<size_t>(sample_rate));
    }
};

/**
 * A complete synthesized (or decoded) utterance.
 */
struct Waveform {
    std::vector<int16_t> samples;  // Interleaved when channels > 1
    int sample_rate = 24000;
    int channels = 1;

    bool empty() const { return samples.empty(); }

    size_t sampleCount() const {
        return channels > 0 ? samples.size() / static_cast<size_t>(channels) : 0;
    }

    double durationSeconds() const {
        if (sample_rate <= 0) return 0.0;
        return static_cast<double>(sampleCount()) / sample_rate;
    }
};

} // namespace volley::audio
