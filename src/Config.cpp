/**
 * Config.cpp - nlohmann/json mapping of the session configuration
 */

#include "volley/Config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace volley {

namespace {

// Assign `field` from `obj[key]` when present; type mismatches name the key
template <typename T>
void read(const json& obj, const char* section, const char* key, T& field) {
    if (!obj.contains(key)) return;
    try {
        field = obj.at(key).get<T>();
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string(section) + "." + key + ": " + e.what());
    }
}

const json& section(const json& root, const char* name) {
    static const json empty = json::object();
    if (!root.contains(name)) return empty;
    const json& obj = root.at(name);
    if (!obj.is_object()) {
        throw std::invalid_argument(std::string(name) + ": expected an object");
    }
    return obj;
}

void fromEnv(const char* name, std::string& field) {
    const char* value = std::getenv(name);
    if (value && *value) {
        field = value;
    }
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::invalid_argument(message);
    }
}

} // anonymous namespace

turn::TurnConfig Config::turnConfig() const {
    turn::TurnConfig tc;
    tc.vad = vad;
    tc.sample_rate = session.input_sample_rate;
    tc.channels = session.input_channels;
    tc.max_segment_ms = session.max_segment_ms;
    tc.sentence_streaming = session.sentence_streaming;
    tc.fallback_utterance = session.fallback_utterance;
    return tc;
}

pipeline::PipelineConfig Config::pipelineConfig() const {
    pipeline::PipelineConfig pc;
    pc.language = session.language;
    pc.top_k = top_k;
    pc.score_threshold = score_threshold;
    pc.small_talk = small_talk;
    return pc;
}

audio::EgressConfig Config::egressConfig() const {
    audio::EgressConfig ec;
    ec.sample_rate = session.output_sample_rate;
    ec.channels = session.output_channels;
    ec.frame_ms = session.egress_frame_ms;
    return ec;
}

Config parseConfig(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument(std::string("Malformed config: ") + e.what());
    }
    if (!root.is_object()) {
        throw std::invalid_argument("Config root must be an object");
    }

    Config config;

    const json& vad = section(root, "vad");
    read(vad, "vad", "energy_threshold", config.vad.energy_threshold);
    read(vad, "vad", "frame_ms", config.vad.frame_ms);
    read(vad, "vad", "speech_onset_frames", config.vad.speech_onset_frames);
    read(vad, "vad", "speech_pad_ms", config.vad.speech_pad_ms);
    read(vad, "vad", "log_frames", config.vad.log_frames);

    const json& session = section(root, "session");
    read(session, "session", "input_sample_rate", config.session.input_sample_rate);
    read(session, "session", "input_channels", config.session.input_channels);
    read(session, "session", "output_sample_rate", config.session.output_sample_rate);
    read(session, "session", "output_channels", config.session.output_channels);
    read(session, "session", "max_segment_ms", config.session.max_segment_ms);
    read(session, "session", "egress_frame_ms", config.session.egress_frame_ms);
    read(session, "session", "language", config.session.language);
    read(session, "session", "greet_on_start", config.session.greet_on_start);
    read(session, "session", "sentence_streaming", config.session.sentence_streaming);
    read(session, "session", "fallback_utterance", config.session.fallback_utterance);

    const json& small_talk = section(root, "small_talk");
    read(small_talk, "small_talk", "greeting_keywords", config.small_talk.greeting_keywords);
    read(small_talk, "small_talk", "thanks_keywords", config.small_talk.thanks_keywords);
    read(small_talk, "small_talk", "goodbye_keywords", config.small_talk.goodbye_keywords);
    read(small_talk, "small_talk", "greeting_responses", config.small_talk.greeting_responses);
    read(small_talk, "small_talk", "thanks_responses", config.small_talk.thanks_responses);
    read(small_talk, "small_talk", "goodbye_responses", config.small_talk.goodbye_responses);

    const json& retrieval = section(root, "retrieval");
    read(retrieval, "retrieval", "qdrant_url", config.retrieval.qdrant_url);
    read(retrieval, "retrieval", "collection", config.retrieval.collection);
    read(retrieval, "retrieval", "embedding_url", config.retrieval.embedding_url);
    read(retrieval, "retrieval", "embedding_model", config.retrieval.embedding_model);
    read(retrieval, "retrieval", "api_key", config.retrieval.api_key);
    read(retrieval, "retrieval", "timeout_ms", config.retrieval.timeout_ms);
    read(retrieval, "retrieval", "top_k", config.top_k);
    read(retrieval, "retrieval", "score_threshold", config.score_threshold);

    const json& generation = section(root, "generation");
    read(generation, "generation", "base_url", config.generation.base_url);
    read(generation, "generation", "api_key", config.generation.api_key);
    read(generation, "generation", "model", config.generation.model);
    read(generation, "generation", "temperature", config.generation.temperature);
    read(generation, "generation", "max_tokens", config.generation.max_tokens);
    read(generation, "generation", "system_prompt", config.generation.system_prompt);
    read(generation, "generation", "timeout_ms", config.generation.timeout_ms);

    const json& speech = section(root, "speech");
    read(speech, "speech", "stt_engine", config.speech.stt_engine);
    read(speech, "speech", "stt_url", config.speech.stt_url);
    read(speech, "speech", "stt_timeout_ms", config.speech.stt_timeout_ms);
    read(speech, "speech", "whisper_model", config.speech.whisper_model);
    read(speech, "speech", "whisper_threads", config.speech.whisper_threads);
    read(speech, "speech", "tts_url", config.speech.tts.server_url);
    read(speech, "speech", "voice", config.speech.tts.voice);
    read(speech, "speech", "speed", config.speech.tts.speed);
    read(speech, "speech", "tts_timeout_ms", config.speech.tts.timeout_ms);

    const json& device = section(root, "device");
    read(device, "device", "input_device", config.device.input_device);
    read(device, "device", "output_device", config.device.output_device);
    read(device, "device", "frames_per_buffer", config.device.frames_per_buffer);
    read(device, "device", "frame_queue", config.device.frame_queue);

    validateConfig(config);
    return config;
}

Config loadConfigFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.good()) {
        throw std::runtime_error("Cannot read config file: " + path);
    }
    std::stringstream contents;
    contents << file.rdbuf();

    std::cout << "[Config] Loaded " << path << std::endl;
    return parseConfig(contents.str());
}

void applyEnvironment(Config& config) {
    fromEnv("VOLLEY_LLM_API_KEY", config.generation.api_key);
    fromEnv("VOLLEY_EMBEDDING_API_KEY", config.retrieval.api_key);
    fromEnv("VOLLEY_LLM_URL", config.generation.base_url);
    fromEnv("VOLLEY_QDRANT_URL", config.retrieval.qdrant_url);
    fromEnv("VOLLEY_STT_URL", config.speech.stt_url);
    fromEnv("VOLLEY_TTS_URL", config.speech.tts.server_url);
}

void validateConfig(const Config& config) {
    require(config.vad.energy_threshold >= 0.0f, "vad.energy_threshold must be >= 0");
    require(config.vad.frame_ms > 0, "vad.frame_ms must be positive");
    require(config.vad.speech_onset_frames >= 1, "vad.speech_onset_frames must be >= 1");
    require(config.vad.speech_pad_ms >= 0, "vad.speech_pad_ms must be >= 0");

    require(config.session.input_sample_rate > 0, "session.input_sample_rate must be positive");
    require(config.session.input_channels > 0, "session.input_channels must be positive");
    require(config.session.output_sample_rate > 0, "session.output_sample_rate must be positive");
    require(config.session.output_channels > 0, "session.output_channels must be positive");
    require(config.session.egress_frame_ms > 0, "session.egress_frame_ms must be positive");
    require(config.session.max_segment_ms >= config.vad.frame_ms,
            "session.max_segment_ms must hold at least one frame");

    require(config.top_k >= 1, "retrieval.top_k must be >= 1");
    require(config.score_threshold >= 0.0 && config.score_threshold <= 1.0,
            "retrieval.score_threshold must be within [0, 1]");

    require(config.generation.max_tokens > 0, "generation.max_tokens must be positive");
    require(config.speech.stt_engine == "http" || config.speech.stt_engine == "whisper",
            "speech.stt_engine must be \"http\" or \"whisper\"");
    require(config.speech.tts.speed > 0.0f, "speech.speed must be positive");
    require(config.device.frame_queue > 0, "device.frame_queue must be positive");
}

} // namespace volley
