// Value.hpp — the datum carried on every wire for one graph step
//
// A Value is a small tagged union. Exactly one Value travels along each
// connection per step; the runtime never inspects it, it only forwards
// whatever the producing node wrote. ValueKind is used at wiring time (by
// the editor / patch loader) to check that an output feeds a compatible
// input.
//
// None vs Disconnected:
//   None         — the producer exists but has nothing to say this step.
//   Disconnected — no wire is attached to the input at all. Nodes use this
//                  to fall back to their own default (see RealInput).

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// ─────────────────────────────────────────────────────────────────────────────
// ValueKind — discriminant of Value
// ─────────────────────────────────────────────────────────────────────────────
// Order matches the variant alternatives in Value::Storage.

enum class ValueKind {
    None,
    Disconnected,
    Midi,
    Float,
    FloatArray,
    Beat
};

const char* valueKindName(ValueKind kind);

/// Parse "float", "midi", "beat", ... (case-insensitive). Used by loaders.
std::optional<ValueKind> parseValueKind(const std::string& name);

// ─────────────────────────────────────────────────────────────────────────────
// MidiMessage — one channel-voice MIDI event
// ─────────────────────────────────────────────────────────────────────────────

enum class MidiMessageType : uint8_t {
    NoteOff,
    NoteOn,
    Aftertouch,
    Controller,
    ProgramChange,
    ChannelAftertouch,
    PitchBend
};

struct MidiMessage {
    MidiMessageType type = MidiMessageType::NoteOn;
    uint8_t  key   = 0;   // note / controller / program number
    uint8_t  value = 0;   // velocity / controller value / pressure
    uint16_t bend  = 0x2000; // PitchBend only, 14-bit, centre = 0x2000

    bool operator==(const MidiMessage& other) const {
        return type == other.type && key == other.key &&
               value == other.value && bend == other.bend;
    }
    bool operator!=(const MidiMessage& other) const { return !(*this == other); }
};

// ─────────────────────────────────────────────────────────────────────────────
// Value
// ─────────────────────────────────────────────────────────────────────────────

class Value {
public:
    using BeatDuration = std::chrono::nanoseconds;

    struct NoneTag {
        bool operator==(const NoneTag&) const { return true; }
    };
    struct DisconnectedTag {
        bool operator==(const DisconnectedTag&) const { return true; }
    };
    struct Midi {
        uint8_t     channel = 0;
        MidiMessage message;
        bool operator==(const Midi& o) const {
            return channel == o.channel && message == o.message;
        }
    };
    struct Beat {
        BeatDuration period{0};
        bool operator==(const Beat& o) const { return period == o.period; }
    };

    using Storage = std::variant<NoneTag, DisconnectedTag, Midi, float,
                                 std::vector<float>, Beat>;

    Value() = default;

    static Value none() { return Value(); }
    static Value disconnected() { return Value(Storage(DisconnectedTag{})); }
    static Value fromFloat(float f) { return Value(Storage(f)); }
    static Value fromFloatArray(std::vector<float> samples) {
        return Value(Storage(std::move(samples)));
    }
    static Value fromMidi(uint8_t channel, const MidiMessage& message) {
        return Value(Storage(Midi{channel, message}));
    }
    static Value fromBeat(BeatDuration period) { return Value(Storage(Beat{period})); }

    ValueKind kind() const { return static_cast<ValueKind>(mStorage.index()); }

    bool isNone() const { return kind() == ValueKind::None; }
    bool isDisconnected() const { return kind() == ValueKind::Disconnected; }

    std::optional<float> asFloat() const;

    /// Float promotes to a one-element array, FloatArray is copied.
    std::optional<std::vector<float>> asFloatArray() const;

    const Midi* asMidi() const { return std::get_if<Midi>(&mStorage); }

    std::optional<BeatDuration> asBeat() const;

    const Storage& storage() const { return mStorage; }

    bool operator==(const Value& other) const { return mStorage == other.mStorage; }
    bool operator!=(const Value& other) const { return !(*this == other); }

    /// Short human-readable form for logs ("Float(0.5)", "Disconnected").
    std::string describe() const;

private:
    explicit Value(Storage storage) : mStorage(std::move(storage)) {}

    Storage mStorage;
};
