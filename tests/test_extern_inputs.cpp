// Extern-input queues: one value visible per step, backlog drains at one
// value per step, redefinition keeps the queue.

#undef NDEBUG
#include <cassert>
#include <cstdio>
#include <vector>

#include "ExternInputs.hpp"

int main() {
    ExternInputs ext;
    const ExternInputHandle track = ext.define("TrackAudio", ValueKind::Float);
    const ExternInputHandle midi  = ext.define("Midi", ValueKind::Midi);
    assert(track != midi);
    assert(ext.size() == 2);
    assert(ext.get("TrackAudio") == track);
    assert(!ext.get("Nope"));
    assert(*ext.name(track) == "TrackAudio");
    assert(ext.kind(midi) == ValueKind::Midi);

    // Empty queue reads nothing.
    assert(ext.read(track) == nullptr);

    assert(ext.extend(track, {Value::fromFloat(1.0f), Value::fromFloat(2.0f)}));
    assert(ext.push(track, Value::fromFloat(3.0f)));
    assert(ext.queueLength(track) == 3);

    // The front stays until step(), however often it is read.
    assert(ext.read(track)->asFloat() == 1.0f);
    assert(ext.read(track)->asFloat() == 1.0f);
    ext.step();
    assert(ext.read(track)->asFloat() == 2.0f);
    ext.step();
    assert(ext.read(track)->asFloat() == 3.0f);
    ext.step();
    assert(ext.read(track) == nullptr);
    ext.step();   // stepping an empty queue is harmless
    assert(ext.queueLength(track) == 0);

    // Redefining keeps the handle and the queued values.
    ext.push(track, Value::fromFloat(9.0f));
    const ExternInputHandle again = ext.define("TrackAudio", ValueKind::Midi);
    assert(again == track);
    assert(ext.kind(track) == ValueKind::Float);
    assert(ext.queueLength(track) == 1);

    // Invalid handles are rejected.
    ExternInputHandle bogus;
    assert(!ext.push(bogus, Value::fromFloat(0.0f)));
    assert(ext.read(bogus) == nullptr);
    assert(ext.name(bogus) == nullptr);

    // Definitions survive a copy, queued values do not.
    const ExternInputs defs = ext.definitionsOnly();
    assert(defs.size() == 2);
    assert(defs.get("TrackAudio") == track);
    assert(defs.queueLength(*defs.get("TrackAudio")) == 0);

    std::printf("test_extern_inputs: PASS\n");
    return 0;
}
