// NodeRegistry.hpp — node factories by type name
//
// Patch files and the CLI create nodes by name ("Gain", "Sine", ...). The
// registry maps each name to a factory taking a NodeParams bag, so the
// loaders never need to know the concrete node classes.
//
// Unknown parameters are ignored by the factories; missing ones take the
// node's own default.

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "../Node.hpp"

// ─────────────────────────────────────────────────────────────────────────────
// NodeParams — construction parameters for one node
// ─────────────────────────────────────────────────────────────────────────────

struct NodeParams {
    int sampleRate = 44100;
    std::map<std::string, float>       numbers;
    std::map<std::string, std::string> strings;

    float number(const std::string& key, float defaultVal) const {
        auto it = numbers.find(key);
        return it != numbers.end() ? it->second : defaultVal;
    }

    std::string string(const std::string& key, const std::string& defaultVal) const {
        auto it = strings.find(key);
        return it != strings.end() ? it->second : defaultVal;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NodeRegistry
// ─────────────────────────────────────────────────────────────────────────────

class NodeRegistry {
public:
    using Factory = std::function<std::unique_ptr<Node>(const NodeParams&)>;

    /// Registry pre-populated with every stock node in BasicNodes.hpp.
    static NodeRegistry withStockNodes();

    /// Register (or replace) a factory.
    void add(const std::string& typeName, Factory factory);

    /// Create a node. Returns nullptr and logs if the type is unknown.
    std::unique_ptr<Node> create(const std::string& typeName, const NodeParams& params) const;

    bool contains(const std::string& typeName) const { return mFactories.count(typeName) > 0; }

    /// Registered type names, sorted.
    std::vector<std::string> types() const;

private:
    std::map<std::string, Factory> mFactories;
};
