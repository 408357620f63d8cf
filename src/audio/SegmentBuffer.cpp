/**
 * SegmentBuffer.cpp - FIFO-evicting segment store
 */

#include "volley/audio/SegmentBuffer.hpp"
#include "volley/audio/WavCodec.hpp"

#include <iostream>

namespace volley::audio {

SegmentBuffer::SegmentBuffer(int sample_rate, int channels, int max_duration_ms)
    : sample_rate_(sample_rate)
    , channels_(channels > 0 ? channels : 1)
    , max_samples_(static_cast<size_t>(sample_rate) * static_cast<size_t>(max_duration_ms) / 1000)
{
}

void SegmentBuffer::addFrame(const AudioFrame& frame) {
    frames_.push_back(frame);
    total_samples_ += frame.sampleCount();

    while (total_samples_ > max_samples_ && !frames_.empty()) {
        total_samples_ -= frames_.front().sampleCount();
        frames_.pop_front();
        evicted_frames_++;
    }
}

std::vector<uint8_t> SegmentBuffer::sealAndGet() {
    if (frames_.empty()) {
        evicted_frames_ = 0;
        return {};
    }

    std::vector<int16_t> pcm;
    pcm.reserve(total_samples_ * static_cast<size_t>(channels_));
    for (const auto& frame : frames_) {
        pcm.insert(pcm.end(), frame.samples.begin(), frame.samples.end());
    }

    if (evicted_frames_ > 0) {
        std::cout << "[SegmentBuffer] Segment truncated: dropped " << evicted_frames_
                  << " oldest frames" << std::endl;
    }

    clear();

    return encodeWav(downmixToMono(pcm, channels_), sample_rate_, 1);
}

void SegmentBuffer::clear() {
    frames_.clear();
    total_samples_ = 0;
    evicted_frames_ = 0;
}

int SegmentBuffer::durationMs() const {
    if (sample_rate_ <= 0) return 0;
    return static_cast<int>(total_samples_ * 1000 / static_cast<size_t>(sample_rate_));
}

} // namespace volley::audio
