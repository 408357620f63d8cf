/**
 * TTSEngine.cpp - HTTP TTS server client
 *
 * Connects to a persistent synthesis server (Kokoro, XTTS) that keeps the
 * model and voice cached and answers with a complete WAV file.
 */

#include "volley/tts/TTSEngine.hpp"
#include "volley/Errors.hpp"
#include "volley/audio/WavCodec.hpp"
#include "net/HttpSupport.hpp"

#include <iostream>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace volley::tts {

namespace {

// Control characters only confuse the synthesizer's text normalizer
std::string cleanForSpeech(const std::string& text) {
    std::string cleaned;
    cleaned.reserve(text.size());
    for (char c : text) {
        if (c == '\n' || c == '\t') cleaned += ' ';
        else if (c == '\r') continue;
        else if (c >= 0 && c < 32) continue;
        else cleaned += c;
    }
    return cleaned;
}

} // anonymous namespace

struct TTSEngine::Impl {
    std::unique_ptr<httplib::Client> client;
    net::Endpoint endpoint;

    explicit Impl(const TTSConfig& config)
        : endpoint(net::parseEndpoint(config.server_url)) {
        client = net::makeClient(endpoint, config.timeout_ms);
    }
};

TTSEngine::TTSEngine(const TTSConfig& config)
    : impl_(std::make_unique<Impl>(config))
    , config_(config) {
    std::cout << "[TTSEngine] Server " << config_.server_url << ", voice " << config_.voice << std::endl;
}

TTSEngine::~TTSEngine() = default;

bool TTSEngine::isHealthy() {
    auto res = impl_->client->Get(impl_->endpoint.base_path + "/health");
    return res && res->status == 200;
}

audio::Waveform TTSEngine::synthesize(const std::string& text) {
    json req_json = {
        {"text", cleanForSpeech(text)},
        {"voice", config_.voice},
        {"speed", config_.speed}
    };

    std::string body;
    try {
        body = req_json.dump();
    } catch (const json::exception& e) {
        // Invalid UTF-8 in the reply text
        throw CollaboratorError("TTSEngine", std::string("Cannot encode request: ") + e.what());
    }

    auto res = impl_->client->Post(impl_->endpoint.base_path + "/synthesize", body, "application/json");
    if (!net::isSuccess(res)) {
        throw CollaboratorError("TTSEngine", "synthesize " + net::describeFailure(res));
    }

    auto wave = audio::decodeWav(res->body);
    if (!wave) {
        throw CollaboratorError("TTSEngine", "Invalid WAV in response (" + std::to_string(res->body.size()) + " bytes)");
    }
    if (wave->empty()) {
        throw CollaboratorError("TTSEngine", "Server returned no audio");
    }
    return *wave;
}

} // namespace volley::tts
