/**
 * Volley - Main Entry Point
 *
 * Voice assistant with barge-in: speaks answers grounded in a knowledge base
 * and stops talking as soon as the user does.
 */

#include "volley/Config.hpp"
#include "volley/Orchestrator.hpp"
#include "volley/audio/AudioEngine.hpp"
#include "volley/audio/FrameChannel.hpp"
#include "volley/audio/WavCodec.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_running{true};

void signalHandler(int /*signal*/) {
    g_running = false;
}

struct Options {
    std::string config_path;
    std::string ask;
    std::string out_path;
    bool list_devices = false;
    bool help = false;
};

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config volley.json] [--list-devices]\n"
              << "       " << argv0 << " --ask \"question\" [--out answer.wav]\n";
}

bool parseArgs(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto value = [&](std::string& field) {
            if (i + 1 >= argc) {
                std::cerr << "[Volley] Missing value for " << arg << std::endl;
                return false;
            }
            field = argv[++i];
            return true;
        };

        if (std::strcmp(arg, "--config") == 0) {
            if (!value(opts.config_path)) return false;
        } else if (std::strcmp(arg, "--ask") == 0) {
            if (!value(opts.ask)) return false;
        } else if (std::strcmp(arg, "--out") == 0) {
            if (!value(opts.out_path)) return false;
        } else if (std::strcmp(arg, "--list-devices") == 0) {
            opts.list_devices = true;
        } else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            opts.help = true;
        } else {
            std::cerr << "[Volley] Unknown argument: " << arg << std::endl;
            return false;
        }
    }
    return true;
}

// Text mode has no speaker
class DiscardSink : public volley::audio::AudioSink {
public:
    void sendFrame(const volley::audio::AudioFrame&) override {}
};

int runAsk(const volley::Config& config, volley::Collaborators collaborators, const Options& opts) {
    DiscardSink sink;
    volley::Orchestrator orchestrator(config, std::move(collaborators), sink);

    auto result = orchestrator.ask(opts.ask);
    if (result.outcome.kind == volley::pipeline::TurnOutcome::Kind::NoSpeech) {
        std::cerr << "[Volley] Nothing to answer" << std::endl;
        return 1;
    }

    std::cout << result.spoken << std::endl;

    if (!opts.out_path.empty()) {
        if (result.audio.empty()) {
            std::cerr << "[Volley] No audio to write" << std::endl;
            return 1;
        }
        if (!volley::audio::saveWav(opts.out_path, result.audio)) {
            std::cerr << "[Volley] Cannot write " << opts.out_path << std::endl;
            return 1;
        }
        std::cout << "[Volley] Wrote " << opts.out_path << " ("
                  << result.audio.durationSeconds() << "s)" << std::endl;
    }
    return result.outcome.ok() ? 0 : 1;
}

int runSession(const volley::Config& config, volley::Collaborators collaborators) {
    volley::audio::FrameChannel frames(static_cast<size_t>(config.device.frame_queue));

    volley::audio::AudioConfig audio_config;
    audio_config.input_device = config.device.input_device;
    audio_config.output_device = config.device.output_device;
    audio_config.input_sample_rate = config.session.input_sample_rate;
    audio_config.input_channels = config.session.input_channels;
    audio_config.output_sample_rate = config.session.output_sample_rate;
    audio_config.output_channels = config.session.output_channels;
    audio_config.frames_per_buffer = config.device.frames_per_buffer;
    audio_config.frame_ms = config.vad.frame_ms;

    volley::audio::AudioEngine engine(audio_config, frames);
    volley::Orchestrator orchestrator(config, std::move(collaborators), engine);

    volley::turn::TurnCallbacks callbacks;
    callbacks.onStateChange = [](volley::turn::TurnState state) {
        std::cout << "[Volley] " << volley::turn::toString(state) << std::endl;
    };
    callbacks.onBargeIn = [&engine](uint64_t /*turn_id*/) {
        engine.clearPlayback();
    };
    callbacks.onUserUtterance = [](const std::string& text) {
        std::cout << "[Volley] User: " << text << std::endl;
    };
    callbacks.onAssistantResponse = [](const std::string& text) {
        std::cout << "[Volley] Assistant: " << text << std::endl;
    };
    callbacks.onError = [](const std::string& error) {
        std::cerr << "[Volley] Error: " << error << std::endl;
    };
    orchestrator.setCallbacks(std::move(callbacks));

    if (!engine.start()) {
        std::cerr << "[Volley] Audio start failed: " << engine.lastError() << std::endl;
        return 1;
    }

    orchestrator.start(frames);

    while (g_running && orchestrator.isRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n[Volley] Shutting down..." << std::endl;
    engine.stop();
    frames.close();
    orchestrator.stop();
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    Options opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage(argv[0]);
        return 1;
    }
    if (opts.help) {
        printUsage(argv[0]);
        return 0;
    }

    std::cout << R"(
    ╔═══════════════════════════════════════════════╗
    ║               VOLLEY v0.1.0                   ║
    ║   Voice assistant with barge-in and RAG       ║
    ╚═══════════════════════════════════════════════╝
    )" << std::endl;

    if (opts.list_devices) {
        std::cout << "Input devices:" << std::endl;
        for (const auto& name : volley::audio::AudioEngine::listInputDevices()) {
            std::cout << "  " << name << std::endl;
        }
        std::cout << "Output devices:" << std::endl;
        for (const auto& name : volley::audio::AudioEngine::listOutputDevices()) {
            std::cout << "  " << name << std::endl;
        }
        return 0;
    }

    volley::Config config;
    volley::Collaborators collaborators;
    try {
        if (!opts.config_path.empty()) {
            config = volley::loadConfigFile(opts.config_path);
        }
        volley::applyEnvironment(config);
        volley::validateConfig(config);
        collaborators = volley::buildCollaborators(config);
    } catch (const std::exception& e) {
        std::cerr << "[Volley] " << e.what() << std::endl;
        return 1;
    }

    int status = opts.ask.empty()
        ? runSession(config, std::move(collaborators))
        : runAsk(config, std::move(collaborators), opts);

    std::cout << "[Volley] Goodbye!" << std::endl;
    return status;
}
