// Engine config and patch parsing.

#undef NDEBUG
#include <cassert>
#include <cstdio>
#include <stdexcept>
#include <string>

#include "ConfigLoader.hpp"
#include "JSONLoader.hpp"

namespace {

bool throwsRuntimeError(const std::string& patchText) {
    try {
        JSONLoader::parsePatch(patchText, 48000);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

void testEngineConfig() {
    EngineConfig config;
    ConfigLoader::parseEngineConfig(R"({
        "sampleRate": 48000,
        "bufferSize": 256,
        "fillTriggerSec": 0.05,
        "fillTargetSec": 0.2,
        "commandsPerIteration": 4
    })", config);
    assert(config.sampleRate == 48000);
    assert(config.bufferSize == 256);
    assert(config.fillTriggerSec == 0.05);
    assert(config.fillTargetSec == 0.2);
    assert(config.commandsPerIteration == 4);
    assert(config.prefillSec == 0.01);   // untouched
    assert(config.validate());

    // Out of range values are clamped, an inverted window is repaired.
    EngineConfig clamped;
    ConfigLoader::parseEngineConfig(R"({"bufferSize": 1, "fillTriggerSec": 0.5, "fillTargetSec": 0.1})", clamped);
    assert(clamped.bufferSize == 16);
    assert(clamped.fillTargetSec == clamped.fillTriggerSec);
    assert(clamped.validate());

    bool threw = false;
    try {
        ConfigLoader::parseEngineConfig("{ not json", config);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        ConfigLoader::loadEngineConfig("/nonexistent/engine.json", config);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

void testPatch() {
    const Patch patch = JSONLoader::parsePatch(R"({
        "externInputs": [ { "name": "TrackAudio", "kind": "float" } ],
        "nodes": [
            { "key": "track", "type": "ExternInputReader", "params": { "input": "TrackAudio" } },
            { "key": "osc",   "type": "Sine",  "params": { "freq": 220 } },
            { "key": "amp",   "type": "Gain",  "params": { "multiplier": 0.3 } },
            { "key": "mix",   "type": "Add" }
        ],
        "connections": [
            { "from": "osc", "to": "amp", "toInput": "sig 0" },
            { "from": "amp", "to": "mix", "toPort": 0 },
            { "from": "track", "fromPort": 0, "to": "mix", "toPort": 1 }
        ],
        "play":   { "node": "mix" },
        "record": [ { "node": "amp", "file": "amp.wav" }, { "node": "osc", "port": 0 } ]
    })", 48000);

    assert(patch.externInputs.size() == 1);
    assert(patch.externInputs[0].kind == ValueKind::Float);

    assert(patch.nodes.size() == 4);
    assert(patch.nodes[0].params.string("input", "") == "TrackAudio");
    assert(patch.nodes[1].params.number("freq", 0.0f) == 220.0f);
    assert(patch.nodes[1].params.sampleRate == 48000);
    assert(patch.nodes[3].params.numbers.empty());

    assert(patch.connections.size() == 3);
    assert(!patch.connections[0].toPort);
    assert(patch.connections[0].toInput == "sig 0");
    assert(patch.connections[2].toPort && *patch.connections[2].toPort == 1);

    assert(patch.play && patch.play->first == "mix" && patch.play->second == 0);
    assert(patch.record.size() == 2);
    assert(patch.record[0].file == "amp.wav");
    assert(patch.record[1].file.empty());
}

void testPatchErrors() {
    assert(throwsRuntimeError("[1, 2"));
    assert(throwsRuntimeError(R"({"nodes": [ {"key": "a", "type": "Gain"}, {"key": "a", "type": "Sine"} ]})"));
    assert(throwsRuntimeError(R"({"nodes": [ {"type": "Gain"} ]})"));
    assert(throwsRuntimeError(R"({"nodes": [ {"key": "a", "type": "Gain"} ],
                                  "connections": [ {"from": "a", "to": "b", "toPort": 0} ]})"));
    assert(throwsRuntimeError(R"({"nodes": [ {"key": "a", "type": "Gain"} ],
                                  "connections": [ {"from": "a", "to": "a"} ]})"));
    assert(throwsRuntimeError(R"({"nodes": [], "play": {"node": "x"}})"));
    assert(throwsRuntimeError(R"({"externInputs": [ {"name": "X", "kind": "string"} ]})"));

    // An empty object is a valid (empty) patch.
    assert(!throwsRuntimeError("{}"));
}

}  // namespace

int main() {
    testEngineConfig();
    testPatch();
    testPatchErrors();
    std::printf("test_json_loader: PASS\n");
    return 0;
}
