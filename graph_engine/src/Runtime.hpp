// Runtime.hpp — the graph store and the per-sample evaluation algorithm
//
// The Runtime owns every node (in a GraphArena, one Entry per node), a
// per-node output cache, and the ExternInputs registry. It is mutated and
// stepped by exactly one thread (the audio thread, see RuntimeWorker.hpp).
//
// STEP ALGORITHM (step()):
//
//   1. Snapshot pass — every live node's read() is copied into the output
//      cache. The cache now holds every output as of the END of the
//      previous step.
//   2. Feed pass     — for every live node, each input is resolved from the
//      cache (Disconnected if unwired) and the node is fed once.
//   3. Extern step   — the front of every extern-input queue is popped.
//   4. Resync        — RecalcInputs events are applied to the wiring
//      before anything else can feed the node again.
//
// Because every node reads from the snapshot, all inputs of a node see the
// same logical time regardless of arena order, and every feedback edge has
// exactly one step of latency.
//
// ERRORS:
//   insert() with an input vector whose length differs from the node's
//   declared inputs throws std::invalid_argument. Every other mutator
//   returns a RuntimeStatus and leaves the graph untouched on failure.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ExternInputs.hpp"
#include "GraphArena.hpp"
#include "Node.hpp"
#include "Value.hpp"

// ─────────────────────────────────────────────────────────────────────────────
// OutputPort — one output slot of one node
// ─────────────────────────────────────────────────────────────────────────────

struct OutputPort {
    NodeAddress node;
    size_t      port = 0;

    OutputPort() = default;
    OutputPort(NodeAddress node, size_t port) : node(node), port(port) {}

    bool operator==(const OutputPort& o) const { return node == o.node && port == o.port; }
    bool operator!=(const OutputPort& o) const { return !(*this == o); }
};

namespace std {
template <>
struct hash<OutputPort> {
    size_t operator()(const OutputPort& p) const noexcept {
        return std::hash<uint64_t>()(p.node.toBits()) ^ (std::hash<size_t>()(p.port) << 1);
    }
};
}  // namespace std

using InputWiring = std::vector<std::optional<OutputPort>>;

// ─────────────────────────────────────────────────────────────────────────────
// RuntimeStatus
// ─────────────────────────────────────────────────────────────────────────────

enum class RuntimeStatus {
    Ok,
    AddressNotFound,   // node address is stale or was never issued
    PortOutOfRange,    // input or output port index past the node's ports
    ArityMismatch,     // wiring vector length != node's input count
    UnknownExternInput // no extern input is defined under that name
};

const char* runtimeStatusName(RuntimeStatus status);

// ─────────────────────────────────────────────────────────────────────────────
// Runtime
// ─────────────────────────────────────────────────────────────────────────────

class Runtime {
public:

    using StepEvents = std::vector<std::pair<NodeAddress, std::vector<NodeEvent>>>;

    Runtime() = default;

    /// Deep copy: every node is cloned. Extern-input definitions are kept
    /// but their queued values are not.
    Runtime(const Runtime& other);
    Runtime& operator=(const Runtime& other);
    Runtime(Runtime&&) = default;
    Runtime& operator=(Runtime&&) = default;

    // ── Graph mutation ───────────────────────────────────────────────────

    /// Add a node. inputs.size() must equal node->inputs().size().
    NodeAddress insert(InputWiring inputs, std::unique_ptr<Node> node);

    /// Check what insert() would reject: arity, stale source addresses and
    /// source ports past the upstream node's outputs.
    RuntimeStatus validateInsert(const InputWiring& inputs, const Node& node) const;

    /// Remove a node and disconnect every input that referred to it.
    RuntimeStatus remove(NodeAddress address);

    RuntimeStatus setInput(NodeAddress dst, size_t port, std::optional<OutputPort> src);

    RuntimeStatus setAllInputs(NodeAddress dst, InputWiring inputs);

    /// Resynchronise a node's wiring with a new input list. Connections are
    /// carried over by input name; new names start disconnected.
    RuntimeStatus recalcInputs(NodeAddress address, const std::vector<Input>& inputs);

    // ── Evaluation ───────────────────────────────────────────────────────

    /// Evaluate one sample. Returns the nodes that emitted events.
    StepEvents step();

    /// Cached output value (as of the last snapshot pass). None if the port
    /// does not exist.
    Value peek(OutputPort port) const;

    // ── Queries ──────────────────────────────────────────────────────────

    bool contains(NodeAddress address) const { return mNodes.contains(address); }
    Node* node(NodeAddress address);
    const Node* node(NodeAddress address) const;
    const InputWiring* inputsOf(NodeAddress address) const;
    const std::vector<std::string>* inputNamesOf(NodeAddress address) const;
    std::vector<NodeAddress> addresses() const { return mNodes.addresses(); }
    size_t size() const { return mNodes.size(); }
    uint64_t stepCount() const { return mStepCount; }

    /// Continue counting from `steps` (a restored snapshot keeps the live
    /// step count).
    void setStepCount(uint64_t steps) { mStepCount = steps; }

    ExternInputs&       externInputs() { return mExternInputs; }
    const ExternInputs& externInputs() const { return mExternInputs; }
    void setExternInputs(ExternInputs inputs) { mExternInputs = std::move(inputs); }

private:

    struct Entry {
        InputWiring              inputs;
        std::vector<std::string> inputNames;   // names as last synchronised
        std::unique_ptr<Node>    node;

        Entry(InputWiring inputs, std::vector<std::string> names, std::unique_ptr<Node> node)
            : inputs(std::move(inputs)), inputNames(std::move(names)), node(std::move(node)) {}
        Entry(const Entry& other)
            : inputs(other.inputs), inputNames(other.inputNames),
              node(other.node ? other.node->clone() : nullptr) {}
        Entry(Entry&&) noexcept = default;
        Entry& operator=(const Entry& other) {
            if (this != &other) {
                inputs = other.inputs;
                inputNames = other.inputNames;
                node = other.node ? other.node->clone() : nullptr;
            }
            return *this;
        }
        Entry& operator=(Entry&&) noexcept = default;
    };

    bool cacheValid(NodeAddress address) const;
    Value resolve(const std::optional<OutputPort>& port) const;
    RuntimeStatus checkSource(const std::optional<OutputPort>& src) const;
    void clearStalePorts();

    GraphArena<Entry>               mNodes;
    std::vector<std::vector<Value>> mOutputCache;       // indexed by slot
    std::vector<uint32_t>           mCacheGeneration;   // generation the slot was filled for
    ExternInputs                    mExternInputs;
    std::vector<Value>              mFeedBuffer;        // reused every feed
    uint64_t                        mStepCount = 0;
};
