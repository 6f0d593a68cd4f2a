// SampleRing.hpp — single-producer / single-consumer float ring buffer
//
// The worker thread writes, the device callback reads. Capacity is fixed at
// construction so neither side ever allocates.
//
// MEMORY ORDERING:
//   The writer stores samples, then publishes mWrite with release. The
//   reader loads mWrite with acquire before touching those samples, and
//   publishes mRead with release once it is done with them. Each side loads
//   its own index relaxed.

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

class SampleRing {
public:

    explicit SampleRing(size_t capacity) : mBuffer(std::max<size_t>(capacity, 1), 0.0f) {}

    size_t capacity() const { return mBuffer.size(); }

    /// Frames available to the reader.
    size_t size() const {
        const uint64_t w = mWrite.load(std::memory_order_acquire);
        const uint64_t r = mRead.load(std::memory_order_acquire);
        return static_cast<size_t>(w - r);
    }

    /// Writer side. Returns how many samples fit.
    size_t write(const float* data, size_t count) {
        const uint64_t w = mWrite.load(std::memory_order_relaxed);
        const uint64_t r = mRead.load(std::memory_order_acquire);
        const size_t   space = capacity() - static_cast<size_t>(w - r);
        const size_t   n = std::min(count, space);

        for (size_t i = 0; i < n; ++i) {
            mBuffer[(w + i) % capacity()] = data[i];
        }
        mWrite.store(w + n, std::memory_order_release);
        return n;
    }

    /// Reader side. Returns how many samples were copied into `out`.
    size_t read(float* out, size_t count) {
        const uint64_t r = mRead.load(std::memory_order_relaxed);
        const uint64_t w = mWrite.load(std::memory_order_acquire);
        const size_t   n = std::min(count, static_cast<size_t>(w - r));

        for (size_t i = 0; i < n; ++i) {
            out[i] = mBuffer[(r + i) % capacity()];
        }
        mRead.store(r + n, std::memory_order_release);
        return n;
    }

private:
    std::vector<float>    mBuffer;
    std::atomic<uint64_t> mWrite{0};
    std::atomic<uint64_t> mRead{0};
};
