/**
 * FrameAssembler.hpp - Cuts arbitrary sample blocks into fixed-duration frames
 */

#pragma once

#include "volley/audio/AudioFrame.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace volley::audio {

class FrameAssembler {
public:
    using FrameCallback = std::function<void(AudioFrame)>;

    FrameAssembler(int sample_rate, int channels, int frame_ms, FrameCallback callback);

    // Interleaved float samples in [-1, 1], count is the total sample count
    void push(const float* samples, size_t count);
    void push(const int16_t* samples, size_t count);

    // Drop a partially filled frame
    void reset();

    size_t frameSamples() const { return frame_samples_; }
    uint64_t framesEmitted() const { return sequence_; }

private:
    void emitIfFull();

    int sample_rate_;
    int channels_;
    size_t frame_samples_;  // Interleaved samples per frame
    FrameCallback callback_;
    std::vector<int16_t> pending_;
    uint64_t sequence_ = 0;
};

} // namespace volley::audio
