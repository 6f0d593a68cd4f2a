#include "NodeRegistry.hpp"

#include <algorithm>
#include <iostream>

#include "BasicNodes.hpp"

NodeRegistry NodeRegistry::withStockNodes() {
    NodeRegistry reg;

    reg.add("Constant", [](const NodeParams& p) {
        return std::make_unique<ConstantNode>(p.number("value", 0.0f));
    });
    reg.add("Gain", [](const NodeParams& p) {
        return std::make_unique<GainNode>(p.number("multiplier", 1.0f));
    });
    reg.add("Add", [](const NodeParams& p) {
        const float ins = std::max(0.0f, p.number("ins", 2.0f));
        return std::make_unique<AddNode>(static_cast<uint32_t>(ins));
    });
    reg.add("Delay", [](const NodeParams& p) {
        return std::make_unique<DelayNode>(p.sampleRate,
                                           p.number("time", 0.1f),
                                           p.number("feedback", 0.0f));
    });
    reg.add("Sine", [](const NodeParams& p) {
        return std::make_unique<SineOscillatorNode>(p.sampleRate, p.number("freq", 440.0f));
    });
    reg.add("ExternInputReader", [](const NodeParams& p) -> std::unique_ptr<Node> {
        const std::string kindName = p.string("kind", "float");
        auto kind = parseValueKind(kindName);
        if (!kind) {
            std::cerr << "[Registry] WARNING: unknown value kind '" << kindName
                      << "' for ExternInputReader, using float." << std::endl;
            kind = ValueKind::Float;
        }
        return std::make_unique<ExternInputReaderNode>(p.string("input", "TrackAudio"), *kind);
    });

    return reg;
}

void NodeRegistry::add(const std::string& typeName, Factory factory) {
    mFactories[typeName] = std::move(factory);
}

std::unique_ptr<Node> NodeRegistry::create(const std::string& typeName,
                                           const NodeParams& params) const {
    auto it = mFactories.find(typeName);
    if (it == mFactories.end()) {
        std::cerr << "[Registry] ERROR: unknown node type '" << typeName << "'." << std::endl;
        return nullptr;
    }
    return it->second(params);
}

std::vector<std::string> NodeRegistry::types() const {
    std::vector<std::string> names;
    names.reserve(mFactories.size());
    for (const auto& [name, factory] : mFactories) names.push_back(name);
    return names;
}
