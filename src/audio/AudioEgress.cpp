/**
 * AudioEgress.cpp - Frames a waveform and paces it to the outbound transport
 */

#include "volley/audio/AudioEgress.hpp"
#include "volley/audio/WavCodec.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

namespace volley::audio {

namespace {

// Balances active_jobs_ even when the sink throws
struct JobScope {
    std::atomic<int>& counter;
    explicit JobScope(std::atomic<int>& c) : counter(c) { counter++; }
    ~JobScope() { counter--; }
};

} // anonymous namespace

EgressJob::EgressJob(Waveform wave, size_t frame_samples, uint64_t first_sequence)
    : wave_(std::move(wave))
    , frame_samples_(frame_samples > 0 ? frame_samples : 1)
    , sequence_(first_sequence)
{
}

size_t EgressJob::framesTotal() const {
    return (wave_.sampleCount() + frame_samples_ - 1) / frame_samples_;
}

bool EgressJob::next(AudioFrame& frame) {
    const size_t total = wave_.sampleCount();
    if (cursor_ >= total) return false;

    const size_t count = std::min(frame_samples_, total - cursor_);
    const size_t ch = static_cast<size_t>(wave_.channels);
    auto begin = wave_.samples.begin() + static_cast<std::ptrdiff_t>(cursor_ * ch);

    frame.samples.assign(begin, begin + static_cast<std::ptrdiff_t>(count * ch));
    frame.sample_rate = wave_.sample_rate;
    frame.channels = wave_.channels;
    frame.sequence = sequence_++;

    cursor_ += count;
    emitted_++;
    return true;
}

AudioEgress::AudioEgress(AudioSink& sink, const EgressConfig& config)
    : sink_(sink)
    , config_(config)
    , frame_samples_(static_cast<size_t>(config.sample_rate) * static_cast<size_t>(config.frame_ms) / 1000)
{
}

EgressResult AudioEgress::play(const Waveform& wave, const CancellationToken& cancel) {
    EgressResult result;
    if (wave.empty()) return result;

    JobScope scope(active_jobs_);

    Waveform out = (wave.sample_rate == config_.sample_rate && wave.channels == config_.channels)
        ? wave
        : conform(wave, config_.sample_rate, config_.channels);

    EgressJob job(std::move(out), frame_samples_, next_sequence_);
    result.frames_total = job.framesTotal();

    auto deadline = std::chrono::steady_clock::now();
    AudioFrame frame;

    while (!job.done()) {
        if (cancel.isCancelled()) {
            result.cancelled = true;
            break;
        }

        job.next(frame);
        sink_.sendFrame(frame);

        // Pace against an absolute schedule so waits do not accumulate drift
        deadline += std::chrono::microseconds(
            static_cast<int64_t>(frame.sampleCount()) * 1000000 / config_.sample_rate);
        auto remaining = deadline - std::chrono::steady_clock::now();
        if (remaining > std::chrono::steady_clock::duration::zero() && cancel.waitFor(remaining)) {
            result.cancelled = true;
            break;
        }
    }

    result.frames_sent = job.framesEmitted();
    result.samples_sent = job.samplesEmitted();
    next_sequence_ += result.frames_sent;

    if (result.cancelled) {
        std::cout << "[AudioEgress] Cancelled after " << result.frames_sent << "/"
                  << result.frames_total << " frames" << std::endl;
    }

    return result;
}

} // namespace volley::audio
