// JSONLoader.hpp — graph patches from JSON
//
// A patch names nodes by caller-chosen keys and wires them by key, output
// port and input (by index or by name). Loading only builds the Patch value;
// nodes are created through the NodeRegistry when the patch is applied.
// Malformed input throws std::runtime_error naming the offending entry.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "Value.hpp"
#include "nodes/NodeRegistry.hpp"

// ─────────────────────────────────────────────────────────────────────────────
// Patch — a graph description loaded from JSON
// ─────────────────────────────────────────────────────────────────────────────
//
// {
//   "externInputs": [ { "name": "TrackAudio", "kind": "float" } ],
//   "nodes": [
//     { "key": "osc",  "type": "Sine", "params": { "freq": 220 } },
//     { "key": "amp",  "type": "Gain", "params": { "multiplier": 0.3 } }
//   ],
//   "connections": [
//     { "from": "osc", "fromPort": 0, "to": "amp", "toInput": "sig 0" }
//   ],
//   "play":   { "node": "amp", "port": 0 },
//   "record": [ { "node": "osc", "port": 0, "file": "osc.wav" } ]
// }
//
// "toPort" (index) may be given instead of "toInput" (name).

struct PatchExternInput {
    std::string name;
    ValueKind   kind = ValueKind::Float;
};

struct PatchNode {
    std::string key;
    std::string type;
    NodeParams  params;
};

struct PatchConnection {
    std::string           from;
    size_t                fromPort = 0;
    std::string           to;
    std::optional<size_t> toPort;    // set when given by index
    std::string           toInput;   // set when given by name
};

struct PatchTap {
    std::string node;
    size_t      port = 0;
    std::string file;   // empty = keep in memory only
};

struct Patch {
    std::vector<PatchExternInput>              externInputs;
    std::vector<PatchNode>                     nodes;
    std::vector<PatchConnection>               connections;
    std::optional<std::pair<std::string, size_t>> play;
    std::vector<PatchTap>                      record;
};

class JSONLoader {
public:
    /// Load a patch file. `sampleRate` is copied into every node's params.
    /// Throws std::runtime_error on unreadable or malformed input.
    static Patch loadPatch(const std::string& path, int sampleRate);

    /// Same, from JSON text.
    static Patch parsePatch(const std::string& text, int sampleRate);
};
