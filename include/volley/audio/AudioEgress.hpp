/**
 * AudioEgress.hpp - Paced, cancellable playback of a synthesized waveform
 */

#pragma once

#include "volley/audio/AudioFrame.hpp"
#include "volley/audio/AudioSink.hpp"
#include "volley/audio/CancellationToken.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace volley::audio {

struct EgressConfig {
    int sample_rate = 24000;
    int channels = 1;
    int frame_ms = 100;
};

/**
 * Cursor over one utterance cut into fixed-size frames. The last frame may be
 * shorter; no frame ever extends past the source.
 */
class EgressJob {
public:
    EgressJob(Waveform wave, size_t frame_samples, uint64_t first_sequence = 0);

    bool done() const { return cursor_ >= wave_.sampleCount(); }
    bool next(AudioFrame& frame);

    size_t framesTotal() const;
    size_t framesEmitted() const { return emitted_; }
    size_t samplesEmitted() const { return cursor_; }

private:
    Waveform wave_;
    size_t frame_samples_;
    size_t cursor_ = 0;  // Per-channel sample position
    size_t emitted_ = 0;
    uint64_t sequence_;
};

struct EgressResult {
    size_t frames_sent = 0;
    size_t frames_total = 0;
    size_t samples_sent = 0;  // Per channel
    bool cancelled = false;
};

class AudioEgress {
public:
    AudioEgress(AudioSink& sink, const EgressConfig& config);

    /**
     * Emit the waveform in real time. The token is checked before every
     * frame and the pacing wait wakes up on cancellation.
     */
    EgressResult play(const Waveform& wave, const CancellationToken& cancel);

    const EgressConfig& config() const { return config_; }

    // Jobs currently inside play(); the turn controller keeps this at most one
    int activeJobs() const { return active_jobs_.load(); }

private:
    AudioSink& sink_;
    EgressConfig config_;
    size_t frame_samples_;
    std::atomic<int> active_jobs_{0};
    uint64_t next_sequence_ = 0;
};

} // namespace volley::audio
