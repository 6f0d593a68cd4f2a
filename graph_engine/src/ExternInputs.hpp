// ExternInputs.hpp — named, queue-backed channels from the host into the graph
//
// The host environment (plugin host audio/MIDI callback, file player)
// injects values into the graph through named FIFOs such as "TrackAudio"
// or "Midi". Nodes look a channel up by name once, keep the handle, and
// peek the front of its queue every step.
//
// VISIBILITY RULE:
//   step() pops the front of every queue once per runtime step, after all
//   nodes have been fed. A value at the front is therefore seen by every
//   reader for exactly one step, whether or not any reader consumed it.
//   A backlog is consumed at one value per step.
//
// THREADING:
//   Owned and mutated by the audio thread only. The host reaches it through
//   ExternDefine / ExternAppend commands (see Protocol.hpp).

#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "Value.hpp"

struct ExternInputHandle {
    size_t index = static_cast<size_t>(-1);

    bool operator==(const ExternInputHandle& o) const { return index == o.index; }
    bool operator!=(const ExternInputHandle& o) const { return index != o.index; }
};

class ExternInputs {
public:

    ExternInputs() = default;

    /// Create a queue named `name`. Redefining an existing name keeps its
    /// queue and returns the existing handle; a kind mismatch is logged.
    ExternInputHandle define(const std::string& name, ValueKind kind);

    std::optional<ExternInputHandle> get(const std::string& name) const;

    /// Front of the queue without popping. nullptr if the queue is empty or
    /// the handle is not valid for this registry.
    const Value* read(ExternInputHandle handle) const;

    /// Append to the back. Returns false for an invalid handle.
    bool push(ExternInputHandle handle, Value value);
    bool extend(ExternInputHandle handle, std::vector<Value> values);

    /// Pop the front of every queue. Called once per runtime step.
    void step();

    std::optional<ValueKind> kind(ExternInputHandle handle) const;

    /// Name the handle refers to in this registry, nullptr if invalid.
    const std::string* name(ExternInputHandle handle) const {
        return valid(handle) ? &mQueues[handle.index].name : nullptr;
    }

    size_t queueLength(ExternInputHandle handle) const;
    size_t size() const { return mQueues.size(); }
    std::vector<std::string> names() const;

    /// Same names and kinds, empty queues. Used when a runtime is cloned.
    ExternInputs definitionsOnly() const;

private:

    struct Queue {
        std::string       name;
        ValueKind         kind = ValueKind::Float;
        std::deque<Value> values;
    };

    bool valid(ExternInputHandle handle) const { return handle.index < mQueues.size(); }

    std::vector<Queue>                      mQueues;
    std::unordered_map<std::string, size_t> mByName;
};
