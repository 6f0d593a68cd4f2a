#include "JSONLoader.hpp"

#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// ============================================================================
// Patch
// ============================================================================

static NodeParams parseParams(const json& params, int sampleRate, const std::string& key) {
    NodeParams p;
    p.sampleRate = sampleRate;
    if (params.is_null()) return p;
    if (!params.is_object()) {
        throw std::runtime_error("Node '" + key + "': params must be an object");
    }

    for (auto it = params.begin(); it != params.end(); ++it) {
        if (it.value().is_number()) {
            p.numbers[it.key()] = it.value().get<float>();
        } else if (it.value().is_string()) {
            p.strings[it.key()] = it.value().get<std::string>();
        } else if (it.value().is_boolean()) {
            p.numbers[it.key()] = it.value().get<bool>() ? 1.0f : 0.0f;
        } else {
            std::cerr << "[Patch] WARNING: node '" << key << "' param '" << it.key()
                      << "' is not a number or string, ignored." << std::endl;
        }
    }
    return p;
}

static Patch buildPatch(const json& j, int sampleRate) {
    if (!j.is_object()) throw std::runtime_error("Patch must be a JSON object");

    Patch patch;

    if (j.contains("externInputs")) {
        for (const auto& e : j.at("externInputs")) {
            PatchExternInput in;
            in.name = e.at("name").get<std::string>();
            const std::string kindName = e.value("kind", "float");
            auto kind = parseValueKind(kindName);
            if (!kind) {
                throw std::runtime_error("Extern input '" + in.name + "': unknown kind '" + kindName + "'");
            }
            in.kind = *kind;
            patch.externInputs.push_back(in);
        }
    }

    std::set<std::string> keys;
    if (!j.contains("nodes") || !j["nodes"].is_array()) {
        std::cerr << "[Patch] WARNING: patch has no 'nodes' array." << std::endl;
    } else {
        for (const auto& n : j["nodes"]) {
            PatchNode node;
            node.key  = n.at("key").get<std::string>();
            node.type = n.at("type").get<std::string>();
            node.params = parseParams(n.contains("params") ? n["params"] : json(), sampleRate, node.key);
            if (!keys.insert(node.key).second) {
                throw std::runtime_error("Duplicate node key '" + node.key + "'");
            }
            patch.nodes.push_back(std::move(node));
        }
    }

    if (j.contains("connections")) {
        for (const auto& c : j.at("connections")) {
            PatchConnection conn;
            conn.from     = c.at("from").get<std::string>();
            conn.fromPort = c.value("fromPort", static_cast<size_t>(0));
            conn.to       = c.at("to").get<std::string>();
            if (c.contains("toPort")) conn.toPort = c["toPort"].get<size_t>();
            if (c.contains("toInput")) conn.toInput = c["toInput"].get<std::string>();
            if (!conn.toPort && conn.toInput.empty()) {
                throw std::runtime_error("Connection " + conn.from + " -> " + conn.to +
                                         " needs 'toPort' or 'toInput'");
            }
            if (!keys.count(conn.from) || !keys.count(conn.to)) {
                throw std::runtime_error("Connection " + conn.from + " -> " + conn.to +
                                         " refers to an unknown node");
            }
            patch.connections.push_back(std::move(conn));
        }
    }

    if (j.contains("play") && !j["play"].is_null()) {
        const auto& p = j["play"];
        const std::string node = p.at("node").get<std::string>();
        if (!keys.count(node)) throw std::runtime_error("play refers to unknown node '" + node + "'");
        patch.play = std::make_pair(node, p.value("port", static_cast<size_t>(0)));
    }

    if (j.contains("record")) {
        for (const auto& r : j.at("record")) {
            PatchTap tap;
            tap.node = r.at("node").get<std::string>();
            tap.port = r.value("port", static_cast<size_t>(0));
            tap.file = r.value("file", std::string());
            if (!keys.count(tap.node)) {
                throw std::runtime_error("record refers to unknown node '" + tap.node + "'");
            }
            patch.record.push_back(std::move(tap));
        }
    }

    return patch;
}

Patch JSONLoader::parsePatch(const std::string& text, int sampleRate) {
    try {
        return buildPatch(json::parse(text), sampleRate);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid patch: ") + e.what());
    }
}

Patch JSONLoader::loadPatch(const std::string& path, int sampleRate) {
    std::ifstream f(path);
    if (!f.good()) throw std::runtime_error("Cannot open patch JSON: " + path);

    std::stringstream ss;
    ss << f.rdbuf();
    Patch patch = parsePatch(ss.str(), sampleRate);
    std::cout << "[Patch] Loaded " << path << ": " << patch.nodes.size() << " nodes, "
              << patch.connections.size() << " connections." << std::endl;
    return patch;
}
