/**
 * RingBuffer.hpp - Lock-free single-producer/single-consumer sample buffer
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <vector>

namespace volley::audio {

template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity)
        : buffer_(capacity + 1)
    {
    }

    // Producer side. Returns the number of samples written (excess is dropped)
    size_t push(const T* data, size_t count) {
        const size_t write = write_pos_.load(std::memory_order_relaxed);
        const size_t read = read_pos_.load(std::memory_order_acquire);
        const size_t free_space = capacity() - used(write, read);
        const size_t n = count < free_space ? count : free_space;

        for (size_t i = 0; i < n; ++i) {
            buffer_[(write + i) % buffer_.size()] = data[i];
        }
        write_pos_.store((write + n) % buffer_.size(), std::memory_order_release);
        return n;
    }

    // Consumer side. Returns the number of samples read
    size_t pop(T* out, size_t count) {
        if (clear_requested_.exchange(false, std::memory_order_acq_rel)) {
            read_pos_.store(clear_to_.load(std::memory_order_acquire), std::memory_order_release);
        }
        const size_t read = read_pos_.load(std::memory_order_relaxed);
        const size_t write = write_pos_.load(std::memory_order_acquire);
        const size_t avail = used(write, read);
        const size_t n = count < avail ? count : avail;

        for (size_t i = 0; i < n; ++i) {
            out[i] = buffer_[(read + i) % buffer_.size()];
        }
        read_pos_.store((read + n) % buffer_.size(), std::memory_order_release);
        return n;
    }

    size_t available() const {
        const size_t write = write_pos_.load(std::memory_order_acquire);
        if (clear_requested_.load(std::memory_order_acquire)) {
            return used(write, clear_to_.load(std::memory_order_acquire));
        }
        return used(write, read_pos_.load(std::memory_order_acquire));
    }

    size_t capacity() const { return buffer_.size() - 1; }

    // Consumer side only
    void clear() {
        clear_requested_.store(false, std::memory_order_relaxed);
        read_pos_.store(write_pos_.load(std::memory_order_acquire), std::memory_order_release);
    }

    /**
     * Any thread. Discards what is queued now; the consumer skips it on its
     * next pop(). Samples pushed after the request are kept.
     */
    void requestClear() {
        clear_to_.store(write_pos_.load(std::memory_order_acquire), std::memory_order_release);
        clear_requested_.store(true, std::memory_order_release);
    }

private:
    size_t used(size_t write, size_t read) const {
        return (write + buffer_.size() - read) % buffer_.size();
    }

    std::vector<T> buffer_;
    std::atomic<size_t> write_pos_{0};
    std::atomic<size_t> read_pos_{0};
    std::atomic<size_t> clear_to_{0};
    std::atomic<bool> clear_requested_{false};
};

} // namespace volley::audio
