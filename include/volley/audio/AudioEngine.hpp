/**
 * AudioEngine.hpp - PortAudio device transport
 *
 * Capture: microphone -> FrameAssembler -> FrameChannel
 * Playback: AudioSink frames -> RingBuffer<float> -> speaker
 */

#pragma once

#include "volley/audio/AudioSink.hpp"
#include "volley/audio/FrameChannel.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace volley::audio {

struct AudioConfig {
    int input_device = -1;   // -1 = default device
    int output_device = -1;
    int input_sample_rate = 16000;
    int input_channels = 1;
    int output_sample_rate = 24000;
    int output_channels = 1;
    int frames_per_buffer = 512;
    int frame_ms = 30;  // Duration of the frames handed to the channel
};

class AudioEngine : public AudioSink {
public:
    AudioEngine(const AudioConfig& config, FrameChannel& frames);
    ~AudioEngine() override;

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    bool initialize();
    bool start();
    void stop();
    bool isRunning() const;

    // Queue one outbound frame for the speaker; excess is dropped when the buffer is full
    void sendFrame(const AudioFrame& frame) override;

    // Drop everything queued for the speaker (barge-in)
    void clearPlayback();
    bool isPlaying() const;

    uint64_t framesCaptured() const;

    static std::vector<std::string> listInputDevices();
    static std::vector<std::string> listOutputDevices();

    std::string lastError() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
    AudioConfig config_;
};

} // namespace volley::audio
