#include "Runtime.hpp"

#include <stdexcept>

const char* runtimeStatusName(RuntimeStatus status) {
    switch (status) {
        case RuntimeStatus::Ok:              return "Ok";
        case RuntimeStatus::AddressNotFound: return "AddressNotFound";
        case RuntimeStatus::PortOutOfRange:  return "PortOutOfRange";
        case RuntimeStatus::ArityMismatch:   return "ArityMismatch";
        case RuntimeStatus::UnknownExternInput: return "UnknownExternInput";
    }
    return "Unknown";
}

static std::vector<std::string> inputNames(const std::vector<Input>& inputs) {
    std::vector<std::string> names;
    names.reserve(inputs.size());
    for (const Input& in : inputs) names.push_back(in.name);
    return names;
}

// ─────────────────────────────────────────────────────────────────────────────
// Copy
// ─────────────────────────────────────────────────────────────────────────────

Runtime::Runtime(const Runtime& other)
    : mNodes(other.mNodes),
      mOutputCache(other.mOutputCache),
      mCacheGeneration(other.mCacheGeneration),
      mExternInputs(other.mExternInputs.definitionsOnly()),
      mStepCount(other.mStepCount) {}

Runtime& Runtime::operator=(const Runtime& other) {
    if (this != &other) {
        Runtime copy(other);
        *this = std::move(copy);
    }
    return *this;
}

// ─────────────────────────────────────────────────────────────────────────────
// Mutation
// ─────────────────────────────────────────────────────────────────────────────

NodeAddress Runtime::insert(InputWiring inputs, std::unique_ptr<Node> node) {
    if (!node) throw std::invalid_argument("Runtime::insert: null node");

    std::vector<Input> declared = node->inputs();
    if (inputs.size() != declared.size()) {
        throw std::invalid_argument(
            std::string("Runtime::insert: ") + node->typeName() + " declares " +
            std::to_string(declared.size()) + " inputs, got " +
            std::to_string(inputs.size()));
    }

    return mNodes.insert(Entry(std::move(inputs), inputNames(declared), std::move(node)));
}

RuntimeStatus Runtime::validateInsert(const InputWiring& inputs, const Node& node) const {
    if (inputs.size() != node.inputs().size()) return RuntimeStatus::ArityMismatch;
    for (const auto& src : inputs) {
        const RuntimeStatus s = checkSource(src);
        if (s != RuntimeStatus::Ok) return s;
    }
    return RuntimeStatus::Ok;
}

RuntimeStatus Runtime::remove(NodeAddress address) {
    if (!mNodes.remove(address)) return RuntimeStatus::AddressNotFound;

    if (address.slot < mOutputCache.size()) {
        mOutputCache[address.slot].clear();
        mCacheGeneration[address.slot] = 0;
    }

    mNodes.forEach([address](NodeAddress, Entry& entry) {
        for (auto& input : entry.inputs) {
            if (input && input->node == address) input.reset();
        }
    });
    return RuntimeStatus::Ok;
}

RuntimeStatus Runtime::checkSource(const std::optional<OutputPort>& src) const {
    if (!src) return RuntimeStatus::Ok;
    const Entry* entry = mNodes.get(src->node);
    if (!entry) return RuntimeStatus::AddressNotFound;
    if (src->port >= entry->node->outputCount()) return RuntimeStatus::PortOutOfRange;
    return RuntimeStatus::Ok;
}

RuntimeStatus Runtime::setInput(NodeAddress dst, size_t port, std::optional<OutputPort> src) {
    Entry* entry = mNodes.get(dst);
    if (!entry) return RuntimeStatus::AddressNotFound;
    if (port >= entry->inputs.size()) return RuntimeStatus::PortOutOfRange;
    const RuntimeStatus s = checkSource(src);
    if (s != RuntimeStatus::Ok) return s;

    entry->inputs[port] = src;
    return RuntimeStatus::Ok;
}

RuntimeStatus Runtime::setAllInputs(NodeAddress dst, InputWiring inputs) {
    Entry* entry = mNodes.get(dst);
    if (!entry) return RuntimeStatus::AddressNotFound;
    if (inputs.size() != entry->inputs.size()) return RuntimeStatus::ArityMismatch;
    for (const auto& src : inputs) {
        const RuntimeStatus s = checkSource(src);
        if (s != RuntimeStatus::Ok) return s;
    }

    entry->inputs = std::move(inputs);
    return RuntimeStatus::Ok;
}

RuntimeStatus Runtime::recalcInputs(NodeAddress address, const std::vector<Input>& inputs) {
    Entry* entry = mNodes.get(address);
    if (!entry) return RuntimeStatus::AddressNotFound;

    // Carry connections over by name. Each old slot is claimed at most once
    // so repeated names keep their relative order.
    std::vector<bool> claimed(entry->inputNames.size(), false);
    InputWiring wiring(inputs.size());

    for (size_t i = 0; i < inputs.size(); ++i) {
        for (size_t j = 0; j < entry->inputNames.size(); ++j) {
            if (!claimed[j] && entry->inputNames[j] == inputs[i].name) {
                claimed[j] = true;
                if (j < entry->inputs.size()) wiring[i] = entry->inputs[j];
                break;
            }
        }
    }

    entry->inputs = std::move(wiring);
    entry->inputNames = inputNames(inputs);
    return RuntimeStatus::Ok;
}

// ─────────────────────────────────────────────────────────────────────────────
// Evaluation
// ─────────────────────────────────────────────────────────────────────────────

bool Runtime::cacheValid(NodeAddress address) const {
    return address.slot < mOutputCache.size() &&
           mCacheGeneration[address.slot] == address.generation &&
           address.generation != 0;
}

Value Runtime::resolve(const std::optional<OutputPort>& port) const {
    if (!port) return Value::disconnected();
    if (!cacheValid(port->node)) return Value::none();
    const auto& outs = mOutputCache[port->node.slot];
    if (port->port >= outs.size()) return Value::none();
    return outs[port->port];
}

Runtime::StepEvents Runtime::step() {
    StepEvents events;

    if (mOutputCache.size() < mNodes.capacity()) {
        mOutputCache.resize(mNodes.capacity());
        mCacheGeneration.resize(mNodes.capacity(), 0);
    }

    // ── 1. Snapshot pass ─────────────────────────────────────────────────
    bool outputLayoutChanged = false;
    mNodes.forEach([&](NodeAddress address, Entry& entry) {
        auto& outs = mOutputCache[address.slot];
        const size_t count = entry.node->outputCount();

        if (mCacheGeneration[address.slot] != address.generation) {
            outs.assign(count, Value::none());
            mCacheGeneration[address.slot] = address.generation;
        } else if (outs.size() != count) {
            if (count < outs.size()) outputLayoutChanged = true;
            outs.assign(count, Value::none());
        }

        entry.node->read(outs);
    });

    // ── 2. Feed pass ─────────────────────────────────────────────────────
    mNodes.forEach([&](NodeAddress address, Entry& entry) {
        mFeedBuffer.clear();
        for (const auto& input : entry.inputs) {
            mFeedBuffer.push_back(resolve(input));
        }

        std::vector<NodeEvent> evs = entry.node->feed(mExternInputs, mFeedBuffer);
        if (!evs.empty()) events.emplace_back(address, std::move(evs));
    });

    // ── 3. Extern step ───────────────────────────────────────────────────
    mExternInputs.step();

    // ── 4. Resync wiring for nodes whose input list changed ──────────────
    for (const auto& [address, evs] : events) {
        for (const NodeEvent& ev : evs) {
            if (ev.type == NodeEvent::Type::RecalcInputs) {
                recalcInputs(address, ev.inputs);
            }
        }
    }

    if (outputLayoutChanged) clearStalePorts();

    ++mStepCount;
    return events;
}

void Runtime::clearStalePorts() {
    mNodes.forEach([this](NodeAddress, Entry& entry) {
        for (auto& input : entry.inputs) {
            if (!input) continue;
            const Entry* src = mNodes.get(input->node);
            if (!src || input->port >= mOutputCache[input->node.slot].size()) {
                input.reset();
            }
        }
    });
}

Value Runtime::peek(OutputPort port) const {
    if (!mNodes.contains(port.node)) return Value::none();
    return resolve(port);
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

Node* Runtime::node(NodeAddress address) {
    Entry* entry = mNodes.get(address);
    return entry ? entry->node.get() : nullptr;
}

const Node* Runtime::node(NodeAddress address) const {
    const Entry* entry = mNodes.get(address);
    return entry ? entry->node.get() : nullptr;
}

const InputWiring* Runtime::inputsOf(NodeAddress address) const {
    const Entry* entry = mNodes.get(address);
    return entry ? &entry->inputs : nullptr;
}

const std::vector<std::string>* Runtime::inputNamesOf(NodeAddress address) const {
    const Entry* entry = mNodes.get(address);
    return entry ? &entry->inputNames : nullptr;
}
