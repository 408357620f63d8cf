/**
 * WavCodec.hpp - RIFF/WAVE container and PCM conversions
 */

#pragma once

#include "volley/audio/AudioFrame.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace volley::audio {

/**
 * Encode interleaved 16-bit PCM as a canonical 44-byte-header WAV file.
 */
std::vector<uint8_t> encodeWav(const std::vector<int16_t>& samples, int sample_rate, int channels);

inline std::vector<uint8_t> encodeWav(const Waveform& wave) {
    return encodeWav(wave.samples, wave.sample_rate, wave.channels);
}

/**
 * Decode a WAV payload. Accepts 16/24-bit PCM and 32-bit IEEE float,
 * skips unknown chunks. Returns nullopt on a malformed container.
 */
std::optional<Waveform> decodeWav(const std::vector<uint8_t>& bytes);
std::optional<Waveform> decodeWav(const std::string& bytes);

bool saveWav(const std::string& path, const Waveform& wave);

// Average interleaved channels into one
std::vector<int16_t> downmixToMono(const std::vector<int16_t>& interleaved, int channels);

// Linear interpolation, per channel
std::vector<int16_t> resample(const std::vector<int16_t>& interleaved, int channels,
                              int rate_in, int rate_out);

// Convert to the given rate/channel layout (mono in, N identical channels out)
Waveform conform(const Waveform& wave, int sample_rate, int channels);

int16_t floatToPcm16(float sample);
std::vector<float> pcm16ToFloat(const std::vector<int16_t>& samples);

} // namespace volley::audio
