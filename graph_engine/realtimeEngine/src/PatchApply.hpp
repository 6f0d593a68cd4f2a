// PatchApply.hpp — load a Patch into a running engine through RuntimeRemote
//
// Shared by the realtime and offline entry points. Everything goes through
// the command channel, so a patch can be applied while audio runs.
//
//   1. ExternDefine every declared extern input.
//   2. Create every node through the NodeRegistry and insert it.
//   3. wait() for the addresses.
//   4. Connect, select the play port, start the taps.
//   5. sync() and fail if anything was rejected.
//
// writeRecordings() runs after the worker has joined and saves each tap
// that names a file to a mono WAV (non-float values are written as 0).

#pragma once

#include <algorithm>
#include <iostream>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "JSONLoader.hpp"
#include "RuntimeRemote.hpp"
#include "WavUtils.hpp"
#include "nodes/NodeRegistry.hpp"

/// Returns false (after logging) if any node cannot be created, inserted or
/// wired. The engine keeps running whatever was applied before the failure.
inline bool applyPatch(RuntimeRemote& remote, const Patch& patch, const NodeRegistry& registry) {

    for (const PatchExternInput& in : patch.externInputs) {
        remote.defineExternInput(in.name, in.kind);
    }

    // Input names per key, for connections given by name.
    std::map<std::string, std::vector<std::string>> inputNames;

    for (const PatchNode& pn : patch.nodes) {
        std::unique_ptr<Node> node = registry.create(pn.type, pn.params);
        if (!node) {
            std::cerr << "[Patch] ERROR: cannot create node '" << pn.key << "' of type '"
                      << pn.type << "'." << std::endl;
            return false;
        }
        std::vector<std::string>& names = inputNames[pn.key];
        for (const Input& in : node->inputs()) names.push_back(in.name);

        if (!remote.insert(pn.key, std::move(node))) return false;
    }

    if (!remote.wait()) {
        std::cerr << "[Patch] ERROR: runtime worker stopped while inserting nodes." << std::endl;
        return false;
    }

    for (const PatchNode& pn : patch.nodes) {
        if (!remote.addressOf(pn.key)) {
            std::cerr << "[Patch] ERROR: node '" << pn.key << "' was not inserted." << std::endl;
            return false;
        }
    }

    for (const PatchConnection& c : patch.connections) {
        size_t toPort = 0;
        if (c.toPort) {
            toPort = *c.toPort;
        } else {
            const std::vector<std::string>& names = inputNames[c.to];
            auto it = std::find(names.begin(), names.end(), c.toInput);
            if (it == names.end()) {
                std::cerr << "[Patch] ERROR: node '" << c.to << "' has no input named '"
                          << c.toInput << "'." << std::endl;
                return false;
            }
            toPort = static_cast<size_t>(it - names.begin());
        }
        if (!remote.connect(c.from, c.fromPort, c.to, toPort)) return false;
    }

    if (patch.play) remote.play(patch.play);

    for (const PatchTap& tap : patch.record) {
        if (!remote.record(tap.node, tap.port)) return false;
    }

    // Connections and taps are not acknowledged; sync() so any rejection
    // has arrived.
    if (!remote.sync()) {
        std::cerr << "[Patch] ERROR: runtime worker stopped while wiring." << std::endl;
        return false;
    }
    const std::vector<RejectedResp> rejected = remote.rejections();
    if (!rejected.empty()) {
        std::cerr << "[Patch] ERROR: " << rejected.size() << " patch command(s) rejected." << std::endl;
        return false;
    }
    std::cout << "[Patch] Applied " << patch.nodes.size() << " nodes, "
              << patch.connections.size() << " connections." << std::endl;
    return true;
}

/// Save every tap that names a file. Returns the number of files written.
inline int writeRecordings(RuntimeRemote& remote, const Patch& patch, int sampleRate) {
    int written = 0;

    for (auto& [port, values] : remote.recordings()) {
        auto key = remote.keyOf(port.node);
        if (!key) continue;

        for (const PatchTap& tap : patch.record) {
            if (tap.node != *key || tap.port != port.port || tap.file.empty()) continue;

            MonoWavData wav;
            wav.sampleRate = sampleRate;
            wav.samples.reserve(values.size());
            for (const Value& v : values) wav.samples.push_back(v.asFloat().value_or(0.0f));

            try {
                WavUtils::writeMonoWav(tap.file, wav);
                ++written;
            } catch (const std::exception& e) {
                std::cerr << "[Patch] ERROR: cannot write recording " << tap.file
                          << ": " << e.what() << std::endl;
            }
        }
    }
    return written;
}
