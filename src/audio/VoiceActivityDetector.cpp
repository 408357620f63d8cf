/**
 * VoiceActivityDetector.cpp - Short-term energy VAD
 *
 * A frame is voiced when its RMS exceeds the threshold. Speech starts after
 * speech_onset_frames voiced frames in a row and ends after the hangover
 * window of quiet frames, so brief dips do not chop an utterance.
 */

#include "volley/audio/VoiceActivityDetector.hpp"

#include <cmath>
#include <iostream>

namespace volley::audio {

int VADConfig::hangoverFrames() const {
    if (frame_ms <= 0) return 1;
    int frames = speech_pad_ms / frame_ms;
    return frames > 0 ? frames : 1;
}

VoiceActivityDetector::VoiceActivityDetector(const VADConfig& config)
    : config_(config)
    , hangover_frames_(config.hangoverFrames())
{
}

float VoiceActivityDetector::rms(const AudioFrame& frame) {
    if (frame.samples.empty()) return 0.0f;

    double sum_sq = 0.0;
    for (int16_t s : frame.samples) {
        double v = static_cast<double>(s) / 32768.0;
        sum_sq += v * v;
    }
    return static_cast<float>(std::sqrt(sum_sq / static_cast<double>(frame.samples.size())));
}

Classification VoiceActivityDetector::processFrame(const AudioFrame& frame) {
    last_energy_ = rms(frame);
    last_voiced_ = last_energy_ > config_.energy_threshold;

    if (last_voiced_) {
        speech_frames_++;
        silence_frames_ = 0;

        if (speech_frames_ >= config_.speech_onset_frames) {
            speaking_ = true;
        }
    } else {
        silence_frames_++;
        speech_frames_ = 0;

        if (silence_frames_ >= hangover_frames_) {
            speaking_ = false;
        }
    }

    if (config_.log_frames) {
        std::cout << "[VAD] seq=" << frame.sequence
                  << " rms=" << last_energy_
                  << (last_voiced_ ? " voiced" : " quiet")
                  << " speaking=" << speaking_ << std::endl;
    }

    return speaking_ ? Classification::Speech : Classification::Silence;
}

void VoiceActivityDetector::reset() {
    speech_frames_ = 0;
    silence_frames_ = 0;
    speaking_ = false;
    last_voiced_ = false;
    last_energy_ = 0.0f;
}

} // namespace volley::audio
