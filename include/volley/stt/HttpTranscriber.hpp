/**
 * HttpTranscriber.hpp - Transcription through a whisper.cpp server
 */

#pragma once

#include "volley/stt/Transcriber.hpp"

#include <memory>
#include <string>

namespace volley::stt {

/**
 * Multipart POST of the WAV segment to <server>/inference, as served by
 * whisper.cpp's `whisper-server`. Reads {"text": ...} from the reply.
 */
class HttpTranscriber : public Transcriber {
public:
    explicit HttpTranscriber(const std::string& server_url, int timeout_ms = 30000);
    ~HttpTranscriber() override;

    std::string transcribe(const std::vector<uint8_t>& wav, const std::string& language_hint) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace volley::stt
