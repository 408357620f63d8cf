/**
 * WhisperTranscriber.hpp - In-process whisper.cpp transcription
 *
 * Only built when whisper.cpp is available (VOLLEY_HAS_WHISPER).
 */

#pragma once

#include "volley/stt/Transcriber.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace volley::stt {

class WhisperTranscriber : public Transcriber {
public:
    /**
     * @param model_path ggml model file, loaded once and kept resident
     * @param n_threads decoder threads
     */
    WhisperTranscriber(const std::string& model_path, int n_threads = 4);
    ~WhisperTranscriber() override;

    bool isReady() const;

    // Decodes the WAV, converts it to 16 kHz mono float and runs whisper_full
    std::string transcribe(const std::vector<uint8_t>& wav, const std::string& language_hint) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::mutex mutex_;  // whisper_context is not reentrant
};

} // namespace volley::stt
