// ConfigLoader.hpp — EngineConfig from a JSON file
//
// {
//   "sampleRate": 48000, "bufferSize": 256,
//   "fillTriggerSec": 0.08, "fillTargetSec": 0.1, "prefillSec": 0.01,
//   "idleSleepMs": 10, "commandsPerIteration": 1
// }
//
// Missing keys keep the value already in the config. Out-of-range values
// are clamped with a [Config] warning. fillTargetSec is raised to
// fillTriggerSec if it ends up below it.

#pragma once

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "RealtimeTypes.hpp"

class ConfigLoader {
public:
    /// Throws std::runtime_error if the file cannot be read or parsed.
    static void loadEngineConfig(const std::string& path, EngineConfig& config) {
        std::ifstream f(path);
        if (!f.good()) throw std::runtime_error("Cannot open engine config JSON: " + path);

        std::stringstream ss;
        ss << f.rdbuf();
        parseEngineConfig(ss.str(), config);
        std::cout << "[Config] Loaded " << path << std::endl;
    }

    static void parseEngineConfig(const std::string& text, EngineConfig& config) {
        try {
            apply(nlohmann::json::parse(text), config);
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(std::string("Invalid engine config: ") + e.what());
        }
    }

private:
    static double clampWarn(const char* key, double v, double lo, double hi) {
        if (v < lo || v > hi) {
            const double c = std::min(std::max(v, lo), hi);
            std::cerr << "[Config] WARNING: " << key << "=" << v << " out of range ["
                      << lo << ", " << hi << "], using " << c << std::endl;
            return c;
        }
        return v;
    }

    static void apply(const nlohmann::json& j, EngineConfig& c) {
        if (!j.is_object()) throw std::runtime_error("Engine config must be a JSON object");

        if (j.contains("sampleRate"))
            c.sampleRate = static_cast<int>(clampWarn("sampleRate", j["sampleRate"].get<double>(), 8000, 384000));
        if (j.contains("bufferSize"))
            c.bufferSize = static_cast<int>(clampWarn("bufferSize", j["bufferSize"].get<double>(), 16, 8192));
        if (j.contains("fillTriggerSec"))
            c.fillTriggerSec = clampWarn("fillTriggerSec", j["fillTriggerSec"].get<double>(), 0.001, 2.0);
        if (j.contains("fillTargetSec"))
            c.fillTargetSec = clampWarn("fillTargetSec", j["fillTargetSec"].get<double>(), 0.001, 2.0);
        if (j.contains("prefillSec"))
            c.prefillSec = clampWarn("prefillSec", j["prefillSec"].get<double>(), 0.0, 2.0);
        if (j.contains("idleSleepMs"))
            c.idleSleepMs = static_cast<int>(clampWarn("idleSleepMs", j["idleSleepMs"].get<double>(), 0, 1000));
        if (j.contains("commandsPerIteration"))
            c.commandsPerIteration = static_cast<int>(
                clampWarn("commandsPerIteration", j["commandsPerIteration"].get<double>(), 1, 4096));

        if (c.fillTargetSec < c.fillTriggerSec) {
            std::cerr << "[Config] WARNING: fillTargetSec < fillTriggerSec, raising target to "
                      << c.fillTriggerSec << std::endl;
            c.fillTargetSec = c.fillTriggerSec;
        }
    }
};
