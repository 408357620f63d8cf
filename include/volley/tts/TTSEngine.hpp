/**
 * TTSEngine.hpp - Synthesis through a persistent HTTP TTS server
 */

#pragma once

#include "volley/tts/Synthesizer.hpp"

#include <memory>
#include <string>

namespace volley::tts {

struct TTSConfig {
    std::string server_url = "http://localhost:5050";
    std::string voice = "af_sarah";
    float speed = 1.0f;
    int timeout_ms = 30000;
};

/**
 * POST <server>/synthesize {"text", "voice", "speed"} -> WAV body.
 * The server keeps the model resident; this side only decodes the reply.
 */
class TTSEngine : public Synthesizer {
public:
    explicit TTSEngine(const TTSConfig& config);
    ~TTSEngine() override;

    // GET <server>/health answers 200
    bool isHealthy();

    // Throws CollaboratorError when the server fails or returns no audio
    audio::Waveform synthesize(const std::string& text) override;

    void setSpeed(float speed) { config_.speed = speed; }
    const TTSConfig& config() const { return config_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    TTSConfig config_;
};

} // namespace volley::tts
