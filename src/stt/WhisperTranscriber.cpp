/**
 * WhisperTranscriber.cpp - Speech-to-Text using whisper.cpp
 *
 * Model is preloaded at startup and stays resident in RAM.
 */

#include "volley/stt/WhisperTranscriber.hpp"
#include "volley/Errors.hpp"
#include "volley/audio/WavCodec.hpp"

#include <iostream>
#include <string>
#include <vector>

#include "whisper.h"

namespace volley::stt {

namespace {
constexpr int WHISPER_RATE = 16000;
}

struct WhisperTranscriber::Impl {
    std::string model_path;
    int n_threads;
    whisper_context* ctx = nullptr;

    Impl(const std::string& path, int threads)
        : model_path(path), n_threads(threads) {
        struct whisper_context_params cparams = whisper_context_default_params();
        ctx = whisper_init_from_file_with_params(model_path.c_str(), cparams);

        if (!ctx) {
            std::cerr << "[WhisperTranscriber] Failed to load model: " << model_path << std::endl;
            return;
        }
        std::cout << "[WhisperTranscriber] Model loaded: " << model_path
                  << " (" << n_threads << " threads)" << std::endl;
    }

    ~Impl() {
        if (ctx) {
            whisper_free(ctx);
            ctx = nullptr;
        }
    }
};

WhisperTranscriber::WhisperTranscriber(const std::string& model_path, int n_threads)
    : impl_(std::make_unique<Impl>(model_path, n_threads)) {
}

WhisperTranscriber::~WhisperTranscriber() = default;

bool WhisperTranscriber::isReady() const {
    return impl_ && impl_->ctx != nullptr;
}

std::string WhisperTranscriber::transcribe(const std::vector<uint8_t>& wav, const std::string& language_hint) {
    if (!isReady()) {
        throw CollaboratorError("WhisperTranscriber", "Model not loaded: " + impl_->model_path);
    }

    auto wave = audio::decodeWav(wav);
    if (!wave) {
        throw CollaboratorError("WhisperTranscriber", "Invalid WAV segment");
    }
    auto mono = audio::conform(*wave, WHISPER_RATE, 1);
    std::vector<float> pcm = audio::pcm16ToFloat(mono.samples);
    if (pcm.empty()) {
        return "";
    }

    // Greedy decoding, no carried context between turns
    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.language = language_hint.empty() ? "auto" : language_hint.c_str();
    params.n_threads = impl_->n_threads;
    params.print_progress = false;
    params.print_timestamps = false;
    params.print_realtime = false;
    params.print_special = false;
    params.translate = false;
    params.single_segment = false;
    params.no_context = true;

    std::lock_guard<std::mutex> lock(mutex_);
    int result = whisper_full(impl_->ctx, params, pcm.data(), static_cast<int>(pcm.size()));
    if (result != 0) {
        throw CollaboratorError("WhisperTranscriber", "whisper_full failed: " + std::to_string(result));
    }

    std::string text;
    const int n_segments = whisper_full_n_segments(impl_->ctx);
    for (int i = 0; i < n_segments; ++i) {
        const char* segment_text = whisper_full_get_segment_text(impl_->ctx, i);
        if (segment_text) {
            text += segment_text;
        }
    }
    return text;
}

} // namespace volley::stt
