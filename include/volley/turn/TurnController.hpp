/**
 * TurnController.hpp - Single-flight turn-taking state machine
 *
 *   Idle -> Listening -> Processing -> Speaking -> Idle
 *                ^            |            |
 *                +-- barge-in +------------+
 */

#pragma once

#include "volley/audio/AudioEgress.hpp"
#include "volley/audio/AudioFrame.hpp"
#include "volley/audio/CancellationToken.hpp"
#include "volley/audio/VoiceActivityDetector.hpp"
#include "volley/pipeline/ResponsePipeline.hpp"
#include "volley/tts/Synthesizer.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace volley::turn {

enum class TurnState {
    Idle,
    Listening,
    Processing,
    Speaking
};

const char* toString(TurnState state);

struct TurnConfig {
    audio::VADConfig vad;
    int sample_rate = 16000;
    int channels = 1;
    int max_segment_ms = 10000;
    bool sentence_streaming = true;
    std::string fallback_utterance = "Désolé, une erreur s'est produite.";
};

/**
 * One interaction cycle. At most one non-terminal Turn exists per controller.
 */
struct Turn {
    uint64_t id = 0;
    std::vector<uint8_t> segment;  // Sealed input; empty for text-only turns
    std::string text;              // Spoken directly when there is no segment
    TurnState state = TurnState::Processing;
    bool interrupted = false;
    std::shared_ptr<audio::CancellationToken> cancel;
};

/**
 * Callbacks run on the thread that caused the event. onStateChange,
 * onSegmentSealed and onBargeIn run with the controller lock held and must
 * not call back into the controller.
 */
struct TurnCallbacks {
    std::function<void(TurnState)> onStateChange;
    std::function<void(uint64_t turn_id, size_t bytes)> onSegmentSealed;
    std::function<void(uint64_t turn_id)> onBargeIn;
    std::function<void(const std::string&)> onUserUtterance;
    std::function<void(const std::string&)> onAssistantResponse;
    std::function<void(const std::string&)> onError;
};

class TurnController {
public:
    TurnController(const TurnConfig& config,
                   pipeline::ResponsePipeline& pipeline,
                   tts::Synthesizer& synthesizer,
                   audio::AudioEgress& egress);
    ~TurnController();

    TurnController(const TurnController&) = delete;
    TurnController& operator=(const TurnController&) = delete;

    /**
     * Ingest one inbound frame. Never blocks on the pipeline or on egress;
     * safe to call from the transport's frame loop at frame rate.
     */
    void onFrame(const audio::AudioFrame& frame);

    /**
     * Speak a fixed text as its own turn (session greeting).
     * @return false unless the controller is Idle
     */
    bool speak(const std::string& text);

    TurnState state() const;
    bool waitForState(TurnState state, std::chrono::milliseconds timeout) const;

    // Idle with no queued work
    bool waitUntilIdle(std::chrono::milliseconds timeout) const;

    bool bargeInPending() const;
    uint64_t turnsStarted() const;
    uint64_t currentTurnId() const;  // 0 when no turn is active

    // Snapshot of the ingest side
    size_t bufferedFrames() const;
    bool vadSpeaking() const;

    void setCallbacks(TurnCallbacks callbacks);

    // Cancel the active turn and stop the worker. Called by the destructor.
    void shutdown();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace volley::turn
