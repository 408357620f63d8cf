/**
 * VoiceActivityDetector.hpp - Energy VAD with onset/hangover hysteresis
 */

#pragma once

#include "volley/audio/AudioFrame.hpp"

namespace volley::audio {

struct VADConfig {
    float energy_threshold = 0.01f;  // RMS on samples normalized to [-1, 1]
    int frame_ms = 30;
    int speech_onset_frames = 3;
    int speech_pad_ms = 300;
    bool log_frames = false;

    // Consecutive quiet frames that end speech (never less than one)
    int hangoverFrames() const;
};

class VoiceActivityDetector {
public:
    explicit VoiceActivityDetector(const VADConfig& config = VADConfig{});

    /**
     * Score one frame and update the hysteresis counters.
     * @return the sticky speaking state after this frame, not a per-frame decision
     */
    Classification processFrame(const AudioFrame& frame);

    // Zero all counters and leave the speaking state
    void reset();

    bool isSpeaking() const { return speaking_; }

    // Raw energy decision for the most recent frame
    bool lastFrameVoiced() const { return last_voiced_; }
    float lastEnergy() const { return last_energy_; }

    int speechFrames() const { return speech_frames_; }
    int silenceFrames() const { return silence_frames_; }

    const VADConfig& config() const { return config_; }

    static float rms(const AudioFrame& frame);

private:
    VADConfig config_;
    int hangover_frames_;

    int speech_frames_ = 0;
    int silence_frames_ = 0;
    bool speaking_ = false;

    bool last_voiced_ = false;
    float last_energy_ = 0.0f;
};

} // namespace volley::audio
