/**
 * FrameAssembler.cpp - Fixed-size frame accumulation
 */

#include "volley/audio/FrameAssembler.hpp"
#include "volley/audio/WavCodec.hpp"

namespace volley::audio {

FrameAssembler::FrameAssembler(int sample_rate, int channels, int frame_ms, FrameCallback callback)
    : sample_rate_(sample_rate)
    , channels_(channels > 0 ? channels : 1)
    , frame_samples_(static_cast<size_t>(sample_rate) * static_cast<size_t>(frame_ms) / 1000 *
                     static_cast<size_t>(channels > 0 ? channels : 1))
    , callback_(std::move(callback))
{
    pending_.reserve(frame_samples_);
}

void FrameAssembler::push(const float* samples, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        pending_.push_back(floatToPcm16(samples[i]));
        emitIfFull();
    }
}

void FrameAssembler::push(const int16_t* samples, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        pending_.push_back(samples[i]);
        emitIfFull();
    }
}

void FrameAssembler::emitIfFull() {
    if (pending_.size() < frame_samples_) return;

    AudioFrame frame;
    frame.samples = std::move(pending_);
    frame.sample_rate = sample_rate_;
    frame.channels = channels_;
    frame.sequence = sequence_++;

    pending_ = std::vector<int16_t>();
    pending_.reserve(frame_samples_);

    if (callback_) {
        callback_(std::move(frame));
    }
}

void FrameAssembler::reset() {
    pending_.clear();
}

} // namespace volley::audio
