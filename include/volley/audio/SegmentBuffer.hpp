/**
 * SegmentBuffer.hpp - Bounded accumulation of one spoken segment
 */

#pragma once

#include "volley/audio/AudioFrame.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

namespace volley::audio {

/**
 * Holds at most max_duration_ms of audio. On overflow the oldest frames are
 * evicted, so very long monologues are truncated at the front.
 */
class SegmentBuffer {
public:
    SegmentBuffer(int sample_rate, int channels, int max_duration_ms);

    void addFrame(const AudioFrame& frame);

    /**
     * Concatenate the buffered frames into a mono 16-bit WAV payload at the
     * buffer's sample rate and empty the buffer.
     * @return empty when nothing was buffered
     */
    std::vector<uint8_t> sealAndGet();

    // Drop everything without sealing
    void clear();

    bool empty() const { return frames_.empty(); }
    size_t frameCount() const { return frames_.size(); }
    size_t totalSamples() const { return total_samples_; }
    int durationMs() const;

    // Frames evicted since the last seal or clear
    size_t evictedFrames() const { return evicted_frames_; }

    size_t maxSamples() const { return max_samples_; }

private:
    int sample_rate_;
    int channels_;
    size_t max_samples_;  // Per channel

    std::deque<AudioFrame> frames_;
    size_t total_samples_ = 0;
    size_t evicted_frames_ = 0;
};

} // namespace volley::audio
