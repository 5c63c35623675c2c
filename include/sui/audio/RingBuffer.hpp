/**
 * RingBuffer.hpp - Lock-free single-producer/single-consumer ring buffer
 *
 * Sits between the PortAudio callbacks and the rest of the process.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace sui::audio {

template <typename T>
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity)
        : buffer_(capacity + 1)
        , capacity_(capacity + 1) {}

    RingBuffer(const RingBuffer&) = delete;
    RingBuffer& operator=(const RingBuffer&) = delete;

    /**
     * Write up to count items. Returns the number actually written.
     */
    size_t push(const T* data, size_t count) {
        const size_t write = writePos_.load(std::memory_order_relaxed);
        const size_t read = readPos_.load(std::memory_order_acquire);
        const size_t free = (read + capacity_ - write - 1) % capacity_;
        const size_t n = std::min(count, free);

        for (size_t i = 0; i < n; ++i) {
            buffer_[(write + i) % capacity_] = data[i];
        }
        writePos_.store((write + n) % capacity_, std::memory_order_release);
        return n;
    }

    /**
     * Read up to count items. Returns the number actually read.
     */
    size_t pop(T* out, size_t count) {
        const size_t read = readPos_.load(std::memory_order_relaxed);
        const size_t write = writePos_.load(std::memory_order_acquire);
        const size_t used = (write + capacity_ - read) % capacity_;
        const size_t n = std::min(count, used);

        for (size_t i = 0; i < n; ++i) {
            out[i] = buffer_[(read + i) % capacity_];
        }
        readPos_.store((read + n) % capacity_, std::memory_order_release);
        return n;
    }

    size_t available() const {
        const size_t write = writePos_.load(std::memory_order_acquire);
        const size_t read = readPos_.load(std::memory_order_acquire);
        return (write + capacity_ - read) % capacity_;
    }

    size_t capacity() const { return capacity_ - 1; }

    /**
     * Drop everything readable. Consumer side only.
     */
    void clear() {
        readPos_.store(writePos_.load(std::memory_order_acquire), std::memory_order_release);
    }

private:
    std::vector<T> buffer_;
    const size_t capacity_;
    std::atomic<size_t> writePos_{0};
    std::atomic<size_t> readPos_{0};
};

extern template class RingBuffer<float>;
extern template class RingBuffer<int16_t>;

} // namespace sui::audio
