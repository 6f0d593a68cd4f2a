// Node.hpp — the interface every signal-processing node implements
//
// Nodes are supplied from outside the runtime (oscillators, filters,
// instruments, ...) and are consumed only through this interface. The
// runtime calls, once per step:
//
//   1. read(out)   on every node — copies the node's current outputs (the
//                  result of its previous feed) into the step snapshot.
//   2. feed(ext, data) on every node — advances the node by one sample.
//                  data.size() equals inputs().size() as it was the last
//                  time the runtime synchronised the node's wiring.
//
// CONTRACT FOR NODE AUTHORS:
// - feed() must not throw on Disconnected / None / wrong-kind inputs. Fall
//   back to an internal default instead (RealInput does this for floats).
// - read() must not change state. It may be called more than once per step.
// - When the input list changes (variable-arity nodes), return a
//   NodeEvent::recalcInputs(inputs()) from the feed() that changed it. The
//   runtime resynchronises the wiring before the next feed.
// - clone() must deep-copy the node's state. Shared handles (config,
//   input defaults) are shared with the clone, not duplicated.

#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "Value.hpp"

class ExternInputs;

// ─────────────────────────────────────────────────────────────────────────────
// InputDefault — shared, externally-mutable default for one input
// ─────────────────────────────────────────────────────────────────────────────
// Held by the node (audio thread) and by the control side (UI / patch
// loader) through a shared_ptr. Implementations use atomics internally.

class InputDefault {
public:
    virtual ~InputDefault() = default;

    virtual ValueKind valueKind() const = 0;

    /// Set the default from a scalar. Returns false if this kind of default
    /// has no scalar representation.
    virtual bool setFromFloat(float /*value*/) { return false; }
};

/// Float default: returns the wired value when it is a Float, otherwise the
/// stored default.
class RealInput : public InputDefault {
public:
    explicit RealInput(float value) : mValue(value) {}

    ValueKind valueKind() const override { return ValueKind::Float; }

    bool setFromFloat(float value) override {
        set(value);
        return true;
    }

    float get(const Value& received) const {
        if (auto f = received.asFloat()) return *f;
        return mValue.load(std::memory_order_relaxed);
    }

    float value() const { return mValue.load(std::memory_order_relaxed); }
    void set(float value) { mValue.store(value, std::memory_order_relaxed); }

private:
    std::atomic<float> mValue;
};

// ─────────────────────────────────────────────────────────────────────────────
// Input / Output port descriptions
// ─────────────────────────────────────────────────────────────────────────────

struct Input {
    std::string                   name;
    ValueKind                     kind = ValueKind::Float;
    std::shared_ptr<InputDefault> defaultValue;  // may be null

    Input() = default;
    Input(std::string name, ValueKind kind);

    /// Input whose kind comes from a shared default.
    static Input stateful(std::string name, std::shared_ptr<InputDefault> defaultValue);
};

struct Output {
    std::string name;
    ValueKind   kind = ValueKind::Float;

    Output() = default;
    Output(std::string name, ValueKind kind) : name(std::move(name)), kind(kind) {}
};

// ─────────────────────────────────────────────────────────────────────────────
// NodeEvent
// ─────────────────────────────────────────────────────────────────────────────

struct NodeEvent {
    enum class Type {
        RecalcInputs   // node's input list changed; `inputs` is the new list
    };

    Type               type = Type::RecalcInputs;
    std::vector<Input> inputs;

    static NodeEvent recalcInputs(std::vector<Input> inputs) {
        NodeEvent ev;
        ev.type = Type::RecalcInputs;
        ev.inputs = std::move(inputs);
        return ev;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NodeConfig — optional shared configuration object
// ─────────────────────────────────────────────────────────────────────────────
// Orthogonal to per-sample wiring (e.g. the number of inputs of a mixer).
// Shared between the node on the audio thread and the control thread; must
// be internally synchronised.

class NodeConfig {
public:
    virtual ~NodeConfig() = default;
};

// ─────────────────────────────────────────────────────────────────────────────
// Node
// ─────────────────────────────────────────────────────────────────────────────

class Node {
public:
    virtual ~Node() = default;

    /// Type name used by the registry and in logs.
    virtual const char* typeName() const = 0;

    virtual std::unique_ptr<Node> clone() const = 0;

    /// Advance by one sample. See the contract at the top of this file.
    virtual std::vector<NodeEvent> feed(const ExternInputs& /*externInputs*/,
                                        const std::vector<Value>& /*data*/) {
        return {};
    }

    /// Write current outputs. out.size() == outputs().size().
    virtual void read(std::vector<Value>& /*out*/) const {}

    virtual std::shared_ptr<NodeConfig> config() const { return nullptr; }

    virtual std::vector<Input> inputs() const { return {}; }

    /// Defaults to a single unnamed Float output.
    virtual std::vector<Output> outputs() const {
        return {Output("", ValueKind::Float)};
    }

    /// outputs().size() without building the descriptions. Called on the
    /// audio thread every step; override when outputs() allocates.
    virtual size_t outputCount() const { return outputs().size(); }

    /// Convenience for tests and single-output float nodes: read output 0
    /// as a float, 0.0f if it is not one.
    float readFloat() const;
};
