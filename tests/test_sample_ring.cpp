// SampleRing: partial writes when full, wrap-around, empty reads, and a
// producer / consumer pair on two threads.

#undef NDEBUG
#include <algorithm>
#include <cassert>
#include <cstdio>
#include <thread>
#include <vector>

#include "SampleRing.hpp"

namespace {

void testEmptyRead() {
    SampleRing ring(4);
    float out[4] = {9.0f, 9.0f, 9.0f, 9.0f};
    assert(ring.read(out, 4) == 0);
    assert(out[0] == 9.0f);
    assert(ring.size() == 0);

    SampleRing degenerate(0);
    assert(degenerate.capacity() == 1);
}

void testPartialWriteWhenFull() {
    SampleRing ring(4);
    const float in[6] = {1, 2, 3, 4, 5, 6};
    assert(ring.write(in, 6) == 4);
    assert(ring.size() == 4);
    assert(ring.write(in, 1) == 0);

    float out[6] = {};
    assert(ring.read(out, 6) == 4);
    assert(out[0] == 1.0f && out[3] == 4.0f);
    assert(ring.size() == 0);
}

void testWrapAround() {
    SampleRing ring(4);
    const float first[3] = {1, 2, 3};
    assert(ring.write(first, 3) == 3);

    float out[4] = {};
    assert(ring.read(out, 2) == 2);
    assert(out[0] == 1.0f && out[1] == 2.0f);

    // Three more: two land at the end, one wraps to the start.
    const float second[3] = {4, 5, 6};
    assert(ring.write(second, 3) == 3);
    assert(ring.size() == 4);

    assert(ring.read(out, 4) == 4);
    assert(out[0] == 3.0f && out[1] == 4.0f && out[2] == 5.0f && out[3] == 6.0f);
    assert(ring.read(out, 1) == 0);
}

void testTwoThreadsKeepOrder() {
    SampleRing ring(64);
    const size_t total = 20000;

    std::thread writer([&] {
        size_t next = 0;
        float chunk[37];
        while (next < total) {
            const size_t want = std::min<size_t>(37, total - next);
            for (size_t i = 0; i < want; ++i) chunk[i] = static_cast<float>(next + i);
            next += ring.write(chunk, want);
            std::this_thread::yield();
        }
    });

    std::vector<float> got;
    got.reserve(total);
    float buf[29];
    while (got.size() < total) {
        const size_t n = ring.read(buf, 29);
        got.insert(got.end(), buf, buf + n);
        if (n == 0) std::this_thread::yield();
    }
    writer.join();

    for (size_t i = 0; i < total; ++i) assert(got[i] == static_cast<float>(i));
}

}  // namespace

int main() {
    testEmptyRead();
    testPartialWriteWhenFull();
    testWrapAround();
    testTwoThreadsKeepOrder();
    std::printf("test_sample_ring: PASS\n");
    return 0;
}
