/**
 * AudioEngine.cpp - PortAudio capture and playback
 *
 * The input callback converts device blocks into fixed frames and hands them
 * to the session loop through a bounded channel; it never waits on the turn
 * controller. The output callback drains a lock-free ring buffer.
 */

#include "volley/audio/AudioEngine.hpp"
#include "volley/audio/FrameAssembler.hpp"
#include "volley/audio/RingBuffer.hpp"

#include <portaudio.h>

#include <atomic>
#include <cstring>
#include <initializer_list>
#include <iostream>
#include <string>
#include <vector>

namespace volley::audio {

// Playback buffer size (samples), 10 seconds at the output rate is plenty with paced egress
constexpr int PLAYBACK_SECONDS = 10;

// Shared with the PortAudio callbacks, which cannot name the private AudioEngine::Impl
struct AudioEngineImpl {
    PaStream* inputStream = nullptr;
    PaStream* outputStream = nullptr;

    FrameChannel& frames;
    FrameAssembler assembler;
    RingBuffer<float> playbackBuffer;
    std::vector<float> scratch;

    std::atomic<bool> running{false};
    std::atomic<bool> initialized{false};
    std::atomic<uint64_t> captured{0};

    int input_channels;
    int output_channels;
    std::string lastError;

    AudioEngineImpl(const AudioConfig& config, FrameChannel& channel)
        : frames(channel)
        , assembler(config.input_sample_rate, config.input_channels, config.frame_ms,
                    [this](AudioFrame frame) {
                        captured++;
                        frames.push(std::move(frame));
                    })
        , playbackBuffer(static_cast<size_t>(config.output_sample_rate) * config.output_channels * PLAYBACK_SECONDS)
        , input_channels(config.input_channels)
        , output_channels(config.output_channels)
    {
    }

    void fail(const std::string& message) {
        lastError = message;
        std::cerr << "[AudioEngine] " << lastError << std::endl;
    }

    // One direction at the session's rate and channel count, float32 interleaved
    bool open(bool input, const AudioConfig& config, PaStreamCallback* callback, void* userData) {
        const int requested = input ? config.input_device : config.output_device;
        PaStreamParameters params;
        params.device = requested >= 0 ? requested
                                       : (input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice());
        if (params.device == paNoDevice) {
            fail(std::string("No ") + (input ? "input" : "output") + " device available");
            return false;
        }

        const PaDeviceInfo* info = Pa_GetDeviceInfo(params.device);
        if (!info) {
            fail("Invalid device index " + std::to_string(params.device));
            return false;
        }

        params.channelCount = input ? config.input_channels : config.output_channels;
        params.sampleFormat = paFloat32;
        params.suggestedLatency = input ? info->defaultLowInputLatency : info->defaultLowOutputLatency;
        params.hostApiSpecificStreamInfo = nullptr;

        PaStream** stream = input ? &inputStream : &outputStream;
        PaError err = Pa_OpenStream(stream,
                                    input ? &params : nullptr,
                                    input ? nullptr : &params,
                                    input ? config.input_sample_rate : config.output_sample_rate,
                                    static_cast<unsigned long>(config.frames_per_buffer),
                                    paClipOff,
                                    callback,
                                    userData);
        if (err != paNoError) {
            *stream = nullptr;
            fail(std::string("Pa_OpenStream (") + (input ? "input" : "output") + ") failed: " +
                 Pa_GetErrorText(err));
            return false;
        }

        std::cout << "[AudioEngine] " << (input ? "Input: " : "Output: ") << info->name << std::endl;
        return true;
    }

    void stopStreams() {
        for (PaStream* stream : {inputStream, outputStream}) {
            if (stream && Pa_IsStreamActive(stream) == 1) {
                Pa_StopStream(stream);
            }
        }
    }

    void closeStreams() {
        if (inputStream) {
            Pa_CloseStream(inputStream);
            inputStream = nullptr;
        }
        if (outputStream) {
            Pa_CloseStream(outputStream);
            outputStream = nullptr;
        }
    }
};

struct AudioEngine::Impl : public AudioEngineImpl {
    using AudioEngineImpl::AudioEngineImpl;
};

static int inputCallback(
    const void* input,
    void* output,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo* timeInfo,
    PaStreamCallbackFlags statusFlags,
    void* userData
);

static int outputCallback(
    const void* input,
    void* output,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo* timeInfo,
    PaStreamCallbackFlags statusFlags,
    void* userData
);

AudioEngine::AudioEngine(const AudioConfig& config, FrameChannel& frames)
    : pImpl_(std::make_unique<Impl>(config, frames))
    , config_(config)
{
}

AudioEngine::~AudioEngine() {
    stop();

    if (pImpl_->initialized) {
        Pa_Terminate();
    }
}

bool AudioEngine::initialize() {
    if (pImpl_->initialized) {
        return true;
    }

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        pImpl_->fail(std::string("Pa_Initialize failed: ") + Pa_GetErrorText(err));
        return false;
    }

    pImpl_->initialized = true;

    std::cout << "[AudioEngine] " << Pa_GetVersionText() << ", "
              << Pa_GetDeviceCount() << " devices" << std::endl;
    return true;
}

bool AudioEngine::start() {
    if (pImpl_->running) {
        return true;
    }

    if (!pImpl_->initialized && !initialize()) {
        return false;
    }

    auto* shared = static_cast<AudioEngineImpl*>(pImpl_.get());
    if (!pImpl_->open(true, config_, inputCallback, shared) ||
        !pImpl_->open(false, config_, outputCallback, shared)) {
        pImpl_->closeStreams();
        return false;
    }

    for (PaStream* stream : {pImpl_->inputStream, pImpl_->outputStream}) {
        PaError err = Pa_StartStream(stream);
        if (err != paNoError) {
            pImpl_->fail(std::string("Pa_StartStream failed: ") + Pa_GetErrorText(err));
            pImpl_->stopStreams();
            pImpl_->closeStreams();
            return false;
        }
    }

    pImpl_->running = true;
    std::cout << "[AudioEngine] Started (in " << config_.input_sample_rate << "Hz x" << config_.input_channels
              << ", out " << config_.output_sample_rate << "Hz x" << config_.output_channels
              << ", frame " << config_.frame_ms << "ms)" << std::endl;

    return true;
}

void AudioEngine::stop() {
    if (!pImpl_->running) {
        return;
    }

    pImpl_->running = false;
    pImpl_->stopStreams();
    pImpl_->closeStreams();
    pImpl_->assembler.reset();

    std::cout << "[AudioEngine] Stopped" << std::endl;
}

bool AudioEngine::isRunning() const {
    return pImpl_->running;
}

void AudioEngine::sendFrame(const AudioFrame& frame) {
    auto& scratch = pImpl_->scratch;
    scratch.resize(frame.samples.size());
    for (size_t i = 0; i < frame.samples.size(); ++i) {
        scratch[i] = static_cast<float>(frame.samples[i]) / 32768.0f;
    }
    size_t written = pImpl_->playbackBuffer.push(scratch.data(), scratch.size());
    if (written < scratch.size()) {
        std::cerr << "[AudioEngine] Playback buffer full, dropped "
                  << (scratch.size() - written) << " samples" << std::endl;
    }
}

void AudioEngine::clearPlayback() {
    // Called off the audio thread; the output callback performs the flush
    pImpl_->playbackBuffer.requestClear();
}

bool AudioEngine::isPlaying() const {
    return pImpl_->playbackBuffer.available() > 0;
}

uint64_t AudioEngine::framesCaptured() const {
    return pImpl_->captured.load();
}

namespace {

std::vector<std::string> listDevices(bool input) {
    std::vector<std::string> devices;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::cerr << "[AudioEngine] Pa_Initialize failed: " << Pa_GetErrorText(err) << std::endl;
        return devices;
    }

    int numDevices = Pa_GetDeviceCount();
    for (int i = 0; i < numDevices; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;
        int channels = input ? info->maxInputChannels : info->maxOutputChannels;
        if (channels > 0) {
            devices.push_back("[" + std::to_string(i) + "] " + info->name);
        }
    }

    Pa_Terminate();
    return devices;
}

} // anonymous namespace

std::vector<std::string> AudioEngine::listInputDevices() {
    return listDevices(true);
}

std::vector<std::string> AudioEngine::listOutputDevices() {
    return listDevices(false);
}

std::string AudioEngine::lastError() const {
    return pImpl_->lastError;
}

// ============================================================================
// PortAudio Callbacks
// ============================================================================

static int inputCallback(
    const void* input,
    void* /*output*/,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo* /*timeInfo*/,
    PaStreamCallbackFlags /*statusFlags*/,
    void* userData
) {
    auto* impl = static_cast<AudioEngineImpl*>(userData);
    const float* samples = static_cast<const float*>(input);

    if (samples && impl->running) {
        // frameCount is per channel; the assembler counts interleaved samples
        impl->assembler.push(samples, frameCount * static_cast<size_t>(impl->input_channels));
    }

    return paContinue;
}

static int outputCallback(
    const void* /*input*/,
    void* output,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo* /*timeInfo*/,
    PaStreamCallbackFlags /*statusFlags*/,
    void* userData
) {
    auto* impl = static_cast<AudioEngineImpl*>(userData);
    float* out = static_cast<float*>(output);
    const size_t wanted = frameCount * static_cast<size_t>(impl->output_channels);

    size_t read = impl->playbackBuffer.pop(out, wanted);

    if (read < wanted) {
        std::memset(out + read, 0, (wanted - read) * sizeof(float));
    }

    return paContinue;
}

} // namespace volley::audio
