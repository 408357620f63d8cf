/**
 * WavCodec.cpp - WAV encode/decode, resampling and channel layout helpers
 */

#include "volley/audio/WavCodec.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iostream>

namespace volley::audio {

namespace {

void putU16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
}

void putU32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
    }
}

void putTag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

uint16_t getU16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t getU32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

bool tagIs(const uint8_t* p, const char* tag) {
    return std::memcmp(p, tag, 4) == 0;
}

constexpr uint16_t FORMAT_PCM = 1;
constexpr uint16_t FORMAT_IEEE_FLOAT = 3;
constexpr uint16_t FORMAT_EXTENSIBLE = 0xFFFE;

} // anonymous namespace

std::vector<uint8_t> encodeWav(const std::vector<int16_t>& samples, int sample_rate, int channels) {
    const uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    const uint16_t block_align = static_cast<uint16_t>(channels * 2);

    std::vector<uint8_t> out;
    out.reserve(44 + data_size);

    putTag(out, "RIFF");
    putU32(out, 36 + data_size);
    putTag(out, "WAVE");

    putTag(out, "fmt ");
    putU32(out, 16);
    putU16(out, FORMAT_PCM);
    putU16(out, static_cast<uint16_t>(channels));
    putU32(out, static_cast<uint32_t>(sample_rate));
    putU32(out, static_cast<uint32_t>(sample_rate) * block_align);
    putU16(out, block_align);
    putU16(out, 16);

    putTag(out, "data");
    putU32(out, data_size);
    for (int16_t s : samples) {
        putU16(out, static_cast<uint16_t>(s));
    }

    return out;
}

std::optional<Waveform> decodeWav(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < 12 || !tagIs(&bytes[0], "RIFF") || !tagIs(&bytes[8], "WAVE")) {
        return std::nullopt;
    }

    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits = 0;
    bool have_fmt = false;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* chunk = &bytes[pos];
        uint32_t chunk_size = getU32(chunk + 4);
        size_t body = pos + 8;

        if (tagIs(chunk, "fmt ")) {
            if (chunk_size < 16 || body + 16 > bytes.size()) return std::nullopt;
            format = getU16(&bytes[body]);
            channels = getU16(&bytes[body + 2]);
            sample_rate = getU32(&bytes[body + 4]);
            bits = getU16(&bytes[body + 14]);
            if (format == FORMAT_EXTENSIBLE && chunk_size >= 26 && body + 26 <= bytes.size()) {
                // Sub-format GUID starts with the plain format tag
                format = getU16(&bytes[body + 24]);
            }
            have_fmt = true;
        } else if (tagIs(chunk, "data")) {
            if (!have_fmt || channels == 0 || sample_rate == 0) return std::nullopt;

            // Streaming writers leave the size at 0 or 0xFFFFFFFF; clamp to what we have
            size_t available = bytes.size() - body;
            size_t data_size = std::min<size_t>(chunk_size, available);
            if (chunk_size == 0) data_size = available;

            Waveform wave;
            wave.sample_rate = static_cast<int>(sample_rate);
            wave.channels = channels;
            const uint8_t* data = &bytes[body];

            if (format == FORMAT_PCM && bits == 16) {
                size_t n = data_size / 2;
                wave.samples.resize(n);
                for (size_t i = 0; i < n; ++i) {
                    wave.samples[i] = static_cast<int16_t>(getU16(data + i * 2));
                }
            } else if (format == FORMAT_PCM && bits == 24) {
                size_t n = data_size / 3;
                wave.samples.resize(n);
                for (size_t i = 0; i < n; ++i) {
                    const uint8_t* p = data + i * 3;
                    uint32_t u = (static_cast<uint32_t>(p[0]) << 8) |
                                 (static_cast<uint32_t>(p[1]) << 16) |
                                 (static_cast<uint32_t>(p[2]) << 24);
                    wave.samples[i] = static_cast<int16_t>(static_cast<int32_t>(u) >> 16);
                }
            } else if (format == FORMAT_IEEE_FLOAT && bits == 32) {
                size_t n = data_size / 4;
                wave.samples.resize(n);
                for (size_t i = 0; i < n; ++i) {
                    uint32_t raw = getU32(data + i * 4);
                    float f;
                    std::memcpy(&f, &raw, sizeof(f));
                    wave.samples[i] = floatToPcm16(f);
                }
            } else {
                std::cerr << "[WavCodec] Unsupported format " << format
                          << " with " << bits << " bits" << std::endl;
                return std::nullopt;
            }

            // Drop a trailing partial sample frame
            wave.samples.resize(wave.samples.size() - wave.samples.size() % wave.channels);
            return wave;
        }

        // Chunks are word aligned
        pos = body + chunk_size + (chunk_size & 1u);
    }

    return std::nullopt;
}

std::optional<Waveform> decodeWav(const std::string& bytes) {
    return decodeWav(std::vector<uint8_t>(bytes.begin(), bytes.end()));
}

bool saveWav(const std::string& path, const Waveform& wave) {
    std::ofstream out(path, std::ios::binary);
    if (!out.good()) {
        std::cerr << "[WavCodec] Cannot open " << path << " for writing" << std::endl;
        return false;
    }
    auto bytes = encodeWav(wave);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return out.good();
}

std::vector<int16_t> downmixToMono(const std::vector<int16_t>& interleaved, int channels) {
    if (channels <= 1) return interleaved;

    size_t frames = interleaved.size() / static_cast<size_t>(channels);
    std::vector<int16_t> mono(frames);
    for (size_t i = 0; i < frames; ++i) {
        int32_t sum = 0;
        for (int c = 0; c < channels; ++c) {
            sum += interleaved[i * channels + c];
        }
        mono[i] = static_cast<int16_t>(sum / channels);
    }
    return mono;
}

std::vector<int16_t> resample(const std::vector<int16_t>& interleaved, int channels,
                              int rate_in, int rate_out) {
    if (rate_in == rate_out || interleaved.empty() || rate_in <= 0 || rate_out <= 0) {
        return interleaved;
    }

    const size_t in_frames = interleaved.size() / static_cast<size_t>(channels);
    const double ratio = static_cast<double>(rate_out) / rate_in;
    const size_t out_frames = static_cast<size_t>(in_frames * ratio);

    std::vector<int16_t> out(out_frames * channels);
    for (size_t i = 0; i < out_frames; ++i) {
        double src_pos = i / ratio;
        size_t idx = static_cast<size_t>(src_pos);
        double frac = src_pos - idx;

        for (int c = 0; c < channels; ++c) {
            double a = interleaved[idx * channels + c];
            double b = (idx + 1 < in_frames) ? interleaved[(idx + 1) * channels + c] : a;
            out[i * channels + c] = static_cast<int16_t>(std::lround(a * (1.0 - frac) + b * frac));
        }
    }
    return out;
}

Waveform conform(const Waveform& wave, int sample_rate, int channels) {
    Waveform out;
    out.sample_rate = sample_rate;
    out.channels = channels;

    std::vector<int16_t> mono = downmixToMono(wave.samples, wave.channels);
    mono = resample(mono, 1, wave.sample_rate, sample_rate);

    if (channels <= 1) {
        out.channels = 1;
        out.samples = std::move(mono);
        return out;
    }

    out.samples.reserve(mono.size() * channels);
    for (int16_t s : mono) {
        out.samples.insert(out.samples.end(), static_cast<size_t>(channels), s);
    }
    return out;
}

int16_t floatToPcm16(float sample) {
    if (std::isnan(sample)) return 0;
    float clamped = std::clamp(sample, -1.0f, 1.0f);
    return static_cast<int16_t>(clamped * 32767.0f);
}

std::vector<float> pcm16ToFloat(const std::vector<int16_t>& samples) {
    std::vector<float> out(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        out[i] = static_cast<float>(samples[i]) / 32768.0f;
    }
    return out;
}

} // namespace volley::audio
