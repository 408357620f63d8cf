/**
 * FrameChannel.hpp - Bounded frame queue between a transport and the session loop
 */

#pragma once

#include "volley/audio/AudioFrame.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace volley::audio {

class FrameChannel {
public:
    explicit FrameChannel(size_t capacity = 256) : capacity_(capacity > 0 ? capacity : 1) {}

    /**
     * Never blocks the producer. When full, the oldest frame is dropped.
     * @return false if the channel is closed
     */
    bool push(AudioFrame frame) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            if (queue_.size() >= capacity_) {
                queue_.pop_front();
                dropped_++;
            }
            queue_.push_back(std::move(frame));
        }
        cv_.notify_one();
        return true;
    }

    // Blocks until a frame is available; nullopt once closed and drained
    std::optional<AudioFrame> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return !queue_.empty() || closed_; });
        return takeLocked();
    }

    template <typename Rep, typename Period>
    std::optional<AudioFrame> popFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || closed_; });
        return takeLocked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    std::optional<AudioFrame> takeLocked() {
        if (queue_.empty()) return std::nullopt;
        AudioFrame frame = std::move(queue_.front());
        queue_.pop_front();
        return frame;
    }

    size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<AudioFrame> queue_;
    bool closed_ = false;
    size_t dropped_ = 0;
};

} // namespace volley::audio
