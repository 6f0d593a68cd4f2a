// Value accessors and ValueKind parsing.

#undef NDEBUG
#include <cassert>
#include <chrono>
#include <cstdio>
#include <string>
#include <vector>

#include "Value.hpp"

int main() {
    const Value none;
    assert(none.isNone());
    assert(!none.asFloat());
    assert(none.describe() == "None");

    const Value disc = Value::disconnected();
    assert(disc.isDisconnected());
    assert(disc.kind() == ValueKind::Disconnected);
    assert(disc != none);

    const Value f = Value::fromFloat(0.25f);
    assert(f.kind() == ValueKind::Float);
    assert(f.asFloat() && *f.asFloat() == 0.25f);
    // A float promotes to a one-element array.
    auto arr = f.asFloatArray();
    assert(arr && arr->size() == 1 && (*arr)[0] == 0.25f);

    const Value fa = Value::fromFloatArray({1.0f, 2.0f, 3.0f});
    assert(fa.kind() == ValueKind::FloatArray);
    assert(!fa.asFloat());
    assert(fa.asFloatArray()->size() == 3);
    assert(fa.describe() == "FloatArray[3]");

    MidiMessage msg;
    msg.type = MidiMessageType::NoteOn;
    msg.key = 60;
    msg.value = 100;
    const Value m = Value::fromMidi(2, msg);
    assert(m.kind() == ValueKind::Midi);
    assert(m.asMidi() && m.asMidi()->channel == 2 && m.asMidi()->message == msg);
    assert(!m.asFloat());

    const Value b = Value::fromBeat(std::chrono::milliseconds(500));
    assert(b.kind() == ValueKind::Beat);
    assert(b.asBeat() && *b.asBeat() == std::chrono::milliseconds(500));

    assert(Value::fromFloat(1.0f) == Value::fromFloat(1.0f));
    assert(Value::fromFloat(1.0f) != Value::fromFloat(2.0f));

    assert(parseValueKind("float") == ValueKind::Float);
    assert(parseValueKind("MIDI") == ValueKind::Midi);
    assert(parseValueKind("float_array") == ValueKind::FloatArray);
    assert(parseValueKind("Beat") == ValueKind::Beat);
    assert(!parseValueKind("string"));
    assert(std::string(valueKindName(ValueKind::FloatArray)) == "FloatArray");

    std::printf("test_value: PASS\n");
    return 0;
}
