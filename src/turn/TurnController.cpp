/**
 * TurnController.cpp - Turn-taking, segmentation and barge-in
 *
 * Frames are classified synchronously on the caller's thread. The long
 * running part of a turn (pipeline, synthesis, egress) runs on one worker
 * thread fed through a single-slot queue, so at most one pipeline call and
 * one egress job can be in flight.
 */

#include "volley/turn/TurnController.hpp"
#include "volley/audio/SegmentBuffer.hpp"

#include <condition_variable>
#include <deque>
#include <exception>
#include <iostream>
#include <mutex>
#include <thread>

namespace volley::turn {

const char* toString(TurnState state) {
    switch (state) {
        case TurnState::Idle: return "Idle";
        case TurnState::Listening: return "Listening";
        case TurnState::Processing: return "Processing";
        case TurnState::Speaking: return "Speaking";
    }
    return "Unknown";
}

namespace {

enum class SpeakResult {
    Completed,
    Interrupted,
    SynthesisFailed
};

} // anonymous namespace

struct TurnController::Impl {
    TurnConfig config;
    pipeline::ResponsePipeline& pipeline;
    tts::Synthesizer& synthesizer;
    audio::AudioEgress& egress;

    mutable std::mutex mutex;
    mutable std::condition_variable state_cv;
    std::condition_variable job_cv;

    // Ingest side, guarded by mutex
    audio::VoiceActivityDetector vad;
    audio::SegmentBuffer segment;
    std::deque<audio::AudioFrame> onset_frames;     // Voiced frames before the onset decision
    std::vector<audio::AudioFrame> trailing_frames; // Quiet frames inside the hangover window

    // Frames heard while Processing/Speaking, replayed into Listening on barge-in
    std::deque<audio::AudioFrame> held_frames;
    size_t held_complete = 0;  // Prefix of held_frames that ends with a finished utterance

    TurnState state = TurnState::Idle;
    std::shared_ptr<Turn> active_turn;  // The one non-terminal turn
    std::shared_ptr<Turn> queued_turn;  // Handed to the worker, not yet picked up
    bool barge_in_pending = false;
    bool stopping = false;
    uint64_t next_turn_id = 1;
    uint64_t turns_started = 0;

    TurnCallbacks callbacks;
    std::thread worker;

    Impl(const TurnConfig& cfg,
         pipeline::ResponsePipeline& p,
         tts::Synthesizer& s,
         audio::AudioEgress& e)
        : config(cfg)
        , pipeline(p)
        , synthesizer(s)
        , egress(e)
        , vad(cfg.vad)
        , segment(cfg.sample_rate, cfg.channels, cfg.max_segment_ms)
    {
    }

    // ------------------------------------------------------------------
    // State helpers (mutex held)
    // ------------------------------------------------------------------

    void setStateLocked(TurnState next) {
        if (state == next) return;
        std::cout << "[TurnController] " << toString(state) << " -> " << toString(next) << std::endl;
        state = next;
        if (active_turn) {
            active_turn->state = next;
        }
        state_cv.notify_all();
        if (callbacks.onStateChange) {
            callbacks.onStateChange(next);
        }
    }

    void clearIngestLocked() {
        segment.clear();
        onset_frames.clear();
        trailing_frames.clear();
    }

    void startTurnLocked(std::shared_ptr<Turn> turn) {
        turn->id = next_turn_id++;
        turn->cancel = std::make_shared<audio::CancellationToken>();
        turn->state = TurnState::Processing;

        active_turn = turn;
        queued_turn = std::move(turn);
        barge_in_pending = false;
        held_frames.clear();
        held_complete = 0;
        turns_started++;

        setStateLocked(TurnState::Processing);
        job_cv.notify_one();
    }

    // Barge-in: drop the reply and start listening to the new utterance
    void interruptLocked(const char* reason) {
        uint64_t id = 0;
        if (active_turn) {
            id = active_turn->id;
            active_turn->interrupted = true;
            active_turn->cancel->cancel();
            active_turn.reset();
        }
        std::cout << "[TurnController] Barge-in (" << reason << "), turn " << id << " cancelled" << std::endl;

        barge_in_pending = false;
        vad.reset();
        clearIngestLocked();
        setStateLocked(TurnState::Listening);

        if (callbacks.onBargeIn) {
            callbacks.onBargeIn(id);
        }

        replayHeldLocked();
    }

    // Feed the frames heard during the last turn back through VAD and segmentation
    void replayHeldLocked() {
        std::deque<audio::AudioFrame> frames;
        frames.swap(held_frames);
        held_complete = 0;
        for (const auto& frame : frames) {
            ingestLocked(frame);
        }
    }

    // Processing/Speaking: keep the frames of the utterance the user is starting
    void holdLocked(const audio::AudioFrame& frame, bool was_speaking, bool speaking, bool voiced) {
        if (speaking) {
            held_frames.push_back(frame);
        } else if (was_speaking) {
            // Hangover expired: the utterance is complete through this frame
            held_frames.push_back(frame);
            held_complete = held_frames.size();
        } else if (voiced) {
            held_frames.push_back(frame);
        } else {
            // Voiced frames that never reached an onset
            held_frames.resize(held_complete);
        }

        while (held_frames.size() > heldLimit()) {
            held_frames.pop_front();
            if (held_complete > 0) held_complete--;
        }
    }

    size_t heldLimit() const {
        const int frame_ms = config.vad.frame_ms > 0 ? config.vad.frame_ms : 1;
        return static_cast<size_t>(config.max_segment_ms / frame_ms + config.vad.hangoverFrames() +
                                   config.vad.speech_onset_frames);
    }

    void sealLocked() {
        const int duration_ms = segment.durationMs();
        const size_t frames = segment.frameCount();
        auto bytes = segment.sealAndGet();

        if (bytes.empty()) {
            setStateLocked(TurnState::Idle);
            return;
        }

        auto turn = std::make_shared<Turn>();
        turn->segment = std::move(bytes);
        const size_t size = turn->segment.size();
        startTurnLocked(turn);

        std::cout << "[TurnController] Turn " << turn->id << ": sealed " << frames
                  << " frames (" << duration_ms << " ms)" << std::endl;

        if (callbacks.onSegmentSealed) {
            callbacks.onSegmentSealed(turn->id, size);
        }
    }

    // Idle/Listening: route the frame into the segment being collected
    void collectLocked(const audio::AudioFrame& frame, bool was_speaking, bool speaking, bool voiced) {
        if (!was_speaking && speaking) {
            if (state == TurnState::Idle) {
                setStateLocked(TurnState::Listening);
            }
            for (const auto& held : onset_frames) {
                segment.addFrame(held);
            }
            onset_frames.clear();
            trailing_frames.clear();
            segment.addFrame(frame);
            return;
        }

        if (speaking) {
            if (voiced) {
                for (const auto& held : trailing_frames) {
                    segment.addFrame(held);
                }
                trailing_frames.clear();
                segment.addFrame(frame);
            } else {
                trailing_frames.push_back(frame);
            }
            return;
        }

        if (was_speaking) {
            // Hangover expired on this frame
            trailing_frames.clear();
            onset_frames.clear();
            sealLocked();
            return;
        }

        if (voiced) {
            onset_frames.push_back(frame);
            const size_t keep = config.vad.speech_onset_frames > 1
                ? static_cast<size_t>(config.vad.speech_onset_frames - 1) : 0;
            while (onset_frames.size() > keep) {
                onset_frames.pop_front();
            }
        } else {
            onset_frames.clear();
            // A barge-in that never turned into an utterance
            if (state == TurnState::Listening && segment.empty() &&
                vad.silenceFrames() >= config.vad.hangoverFrames()) {
                setStateLocked(TurnState::Idle);
            }
        }
    }

    void onFrame(const audio::AudioFrame& frame) {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopping) return;
        ingestLocked(frame);
    }

    void ingestLocked(const audio::AudioFrame& frame) {
        const bool was_speaking = vad.isSpeaking();
        const bool speaking = vad.processFrame(frame) == audio::Classification::Speech;
        const bool voiced = vad.lastFrameVoiced();

        switch (state) {
            case TurnState::Idle:
            case TurnState::Listening:
                collectLocked(frame, was_speaking, speaking, voiced);
                break;

            case TurnState::Processing:
                // Recorded only; acted on when the turn speaks or completes
                holdLocked(frame, was_speaking, speaking, voiced);
                if (speaking && !barge_in_pending) {
                    barge_in_pending = true;
                    std::cout << "[TurnController] Speech while processing turn "
                              << (active_turn ? active_turn->id : 0) << ", barge-in pending" << std::endl;
                }
                break;

            case TurnState::Speaking:
                holdLocked(frame, was_speaking, speaking, voiced);
                if (speaking) {
                    interruptLocked("speech during playback");
                }
                break;
        }
    }

    // ------------------------------------------------------------------
    // Worker side
    // ------------------------------------------------------------------

    // Processing -> Speaking right before the first frame goes out
    bool enterSpeaking(const std::shared_ptr<Turn>& turn) {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopping || active_turn != turn || turn->cancel->isCancelled()) {
            return false;
        }
        if (barge_in_pending) {
            interruptLocked("speech while processing");
            return false;
        }
        // Already Speaking when a fallback follows a partly played reply
        setStateLocked(TurnState::Speaking);
        return true;
    }

    SpeakResult speakText(const std::shared_ptr<Turn>& turn, const std::string& text,
                          const TurnCallbacks& cb) {
        std::vector<std::string> sentences;
        if (config.sentence_streaming) {
            sentences = tts::splitSentences(text);
        }
        if (sentences.empty()) {
            sentences.push_back(text);
        }

        bool played = false;
        for (const auto& sentence : sentences) {
            if (turn->cancel->isCancelled()) {
                return SpeakResult::Interrupted;
            }

            audio::Waveform wave;
            try {
                wave = synthesizer.synthesize(sentence);
            } catch (const std::exception& e) {
                std::cerr << "[TurnController] Synthesis failed: " << e.what() << std::endl;
                if (cb.onError) cb.onError(e.what());
                return SpeakResult::SynthesisFailed;
            }

            if (wave.empty()) {
                continue;
            }

            if (!played) {
                if (!enterSpeaking(turn)) {
                    return SpeakResult::Interrupted;
                }
                played = true;
            }

            auto result = egress.play(wave, *turn->cancel);
            if (result.cancelled) {
                return SpeakResult::Interrupted;
            }
        }

        return played ? SpeakResult::Completed : SpeakResult::SynthesisFailed;
    }

    void finishTurn(const std::shared_ptr<Turn>& turn) {
        std::lock_guard<std::mutex> lock(mutex);
        if (active_turn != turn) {
            // Superseded by a barge-in
            return;
        }

        if (barge_in_pending) {
            interruptLocked("speech while processing");
            return;
        }

        active_turn.reset();
        turn->state = TurnState::Idle;
        clearIngestLocked();
        setStateLocked(TurnState::Idle);
        vad.reset();

        // Voiced frames that have not reached an onset yet
        replayHeldLocked();
    }

    void runTurn(const std::shared_ptr<Turn>& turn) {
        std::string reply = turn->text;
        bool failed = false;

        // setCallbacks may replace the set while this turn runs
        TurnCallbacks cb;
        {
            std::lock_guard<std::mutex> lock(mutex);
            cb = callbacks;
        }

        if (!turn->segment.empty()) {
            pipeline::TurnOutcome outcome = pipeline.runTurn(turn->segment);

            // Segment is no longer needed once handed off
            std::vector<uint8_t>().swap(turn->segment);

            if (outcome.kind == pipeline::TurnOutcome::Kind::NoSpeech) {
                std::cout << "[TurnController] Turn " << turn->id << ": no speech" << std::endl;
                finishTurn(turn);
                return;
            }

            if (!outcome.transcript.empty() && cb.onUserUtterance) {
                cb.onUserUtterance(outcome.transcript);
            }

            if (outcome.ok()) {
                reply = outcome.reply;
            } else {
                std::cerr << "[TurnController] Turn " << turn->id << " failed: " << outcome.error << std::endl;
                if (cb.onError) cb.onError(outcome.error);
                reply = config.fallback_utterance;
                failed = true;
            }
        }

        SpeakResult result = speakText(turn, reply, cb);

        if (result == SpeakResult::SynthesisFailed && !failed && !config.fallback_utterance.empty()) {
            reply = config.fallback_utterance;
            result = speakText(turn, reply, cb);
        }

        if (result == SpeakResult::Completed && cb.onAssistantResponse) {
            cb.onAssistantResponse(reply);
        }

        finishTurn(turn);
    }

    void workerLoop() {
        while (true) {
            std::shared_ptr<Turn> turn;
            {
                std::unique_lock<std::mutex> lock(mutex);
                job_cv.wait(lock, [this]() { return queued_turn != nullptr || stopping; });
                if (stopping) break;
                turn = std::move(queued_turn);
                queued_turn.reset();
            }

            try {
                runTurn(turn);
            } catch (const std::exception& e) {
                std::cerr << "[TurnController] Turn " << turn->id << " aborted: " << e.what() << std::endl;
                finishTurn(turn);
            }
        }
    }
};

TurnController::TurnController(const TurnConfig& config,
                               pipeline::ResponsePipeline& pipeline,
                               tts::Synthesizer& synthesizer,
                               audio::AudioEgress& egress)
    : impl_(std::make_unique<Impl>(config, pipeline, synthesizer, egress))
{
    impl_->worker = std::thread([this]() { impl_->workerLoop(); });

    std::cout << "[TurnController] Ready (threshold=" << config.vad.energy_threshold
              << ", onset=" << config.vad.speech_onset_frames
              << " frames, hangover=" << config.vad.hangoverFrames()
              << " frames, max segment=" << config.max_segment_ms << " ms)" << std::endl;
}

TurnController::~TurnController() {
    shutdown();
}

void TurnController::onFrame(const audio::AudioFrame& frame) {
    impl_->onFrame(frame);
}

bool TurnController::speak(const std::string& text) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->stopping || impl_->state != TurnState::Idle || text.empty()) {
        return false;
    }
    auto turn = std::make_shared<Turn>();
    turn->text = text;
    impl_->startTurnLocked(turn);
    return true;
}

TurnState TurnController::state() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->state;
}

bool TurnController::waitForState(TurnState state, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    return impl_->state_cv.wait_for(lock, timeout, [this, state]() { return impl_->state == state; });
}

bool TurnController::waitUntilIdle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    return impl_->state_cv.wait_for(lock, timeout, [this]() {
        return impl_->state == TurnState::Idle && !impl_->queued_turn && !impl_->active_turn;
    });
}

bool TurnController::bargeInPending() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->barge_in_pending;
}

uint64_t TurnController::turnsStarted() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->turns_started;
}

uint64_t TurnController::currentTurnId() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->active_turn ? impl_->active_turn->id : 0;
}

size_t TurnController::bufferedFrames() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->segment.frameCount();
}

bool TurnController::vadSpeaking() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->vad.isSpeaking();
}

void TurnController::setCallbacks(TurnCallbacks callbacks) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->callbacks = std::move(callbacks);
}

void TurnController::shutdown() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->stopping) return;
        impl_->stopping = true;
        if (impl_->active_turn) {
            impl_->active_turn->cancel->cancel();
        }
        impl_->queued_turn.reset();
    }
    impl_->job_cv.notify_all();
    impl_->state_cv.notify_all();

    if (impl_->worker.joinable()) {
        impl_->worker.join();
    }
}

} // namespace volley::turn
