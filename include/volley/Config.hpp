/**
 * Config.hpp - Session configuration (JSON file + environment overrides)
 */

#pragma once

#include "volley/audio/AudioEgress.hpp"
#include "volley/audio/VoiceActivityDetector.hpp"
#include "volley/llm/ConversationEngine.hpp"
#include "volley/pipeline/ResponsePipeline.hpp"
#include "volley/pipeline/SmallTalkClassifier.hpp"
#include "volley/rag/QdrantRetriever.hpp"
#include "volley/tts/TTSEngine.hpp"
#include "volley/turn/TurnController.hpp"

#include <string>

namespace volley {

struct SessionConfig {
    int input_sample_rate = 16000;
    int input_channels = 1;
    int output_sample_rate = 24000;
    int output_channels = 1;
    int max_segment_ms = 10000;
    int egress_frame_ms = 100;
    std::string language = "fr";
    bool greet_on_start = true;
    bool sentence_streaming = true;
    std::string fallback_utterance = "Désolé, une erreur s'est produite.";
};

struct SpeechConfig {
    std::string stt_engine = "http";  // "http" or "whisper"
    std::string stt_url = "http://localhost:8081";
    int stt_timeout_ms = 30000;
    std::string whisper_model = "models/whisper/ggml-small.bin";
    int whisper_threads = 4;
    tts::TTSConfig tts;
};

struct DeviceConfig {
    int input_device = -1;  // -1 = system default
    int output_device = -1;
    int frames_per_buffer = 512;
    int frame_queue = 64;  // Frames buffered between capture and the controller
};

struct Config {
    audio::VADConfig vad;
    SessionConfig session;
    pipeline::SmallTalkConfig small_talk;
    rag::RetrievalConfig retrieval;
    int top_k = 3;
    double score_threshold = 0.7;
    llm::GenerationConfig generation;
    SpeechConfig speech;
    DeviceConfig device;

    turn::TurnConfig turnConfig() const;
    pipeline::PipelineConfig pipelineConfig() const;
    audio::EgressConfig egressConfig() const;
};

/**
 * Parse a JSON document. Missing keys keep their defaults.
 * Throws std::invalid_argument on malformed JSON, wrong types or
 * out-of-range values.
 */
Config parseConfig(const std::string& json_text);

// Throws std::runtime_error when the file cannot be read
Config loadConfigFile(const std::string& path);

// VOLLEY_LLM_API_KEY, VOLLEY_EMBEDDING_API_KEY, VOLLEY_LLM_URL,
// VOLLEY_QDRANT_URL, VOLLEY_STT_URL, VOLLEY_TTS_URL
void applyEnvironment(Config& config);

// Throws std::invalid_argument naming the first offending key
void validateConfig(const Config& config);

} // namespace volley
