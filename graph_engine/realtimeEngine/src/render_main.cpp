// render_main.cpp — pulseGraph offline renderer entry point
//
// Runs the same worker/remote pair as the real-time engine, but the sink is
// a WAV file consumed at --speed × real time instead of an audio device.
// Commands (the patch, the track player's extern input) still cross the
// channel while the worker renders, so the output matches what the device
// would have played, including the fill-burst latency at the start.
//
//   1. Parse arguments, load engine config and patch
//   2. Open the output WAV (WavFileAudioOut)
//   3. Start the worker, the optional track player, apply the patch
//   4. Wait until --duration seconds of audio are written
//   5. Join the worker, write tap recordings
//
// Usage:
//   ./pulseGraph_render \
//       --patch ../patches/sine_gain.json \
//       --out render.wav \
//       [--duration 5] \
//       [--speed 8] \
//       [--config engine.json] \
//       [--track input.wav]

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "ConfigLoader.hpp"
#include "JSONLoader.hpp"
#include "PatchApply.hpp"
#include "RealtimeTypes.hpp"
#include "RuntimeRemote.hpp"
#include "TrackPlayer.hpp"
#include "WavFileAudioOut.hpp"
#include "nodes/NodeRegistry.hpp"

static EngineConfig* g_config = nullptr;

void signalHandler(int signum) {
    std::cout << "\n[Main] Interrupt received (signal " << signum << "). Stopping render..." << std::endl;
    if (g_config) {
        g_config->shouldExit.store(true);
    }
}

static std::string getArgString(int argc, char* argv[], const std::string& flag) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string(argv[i]) == flag) {
            return std::string(argv[i + 1]);
        }
    }
    return "";
}

static int getArgInt(int argc, char* argv[], const std::string& flag, int defaultVal) {
    std::string val = getArgString(argc, argv, flag);
    if (!val.empty()) {
        try { return std::stoi(val); }
        catch (const std::exception&) { return defaultVal; }
    }
    return defaultVal;
}

static double getArgDouble(int argc, char* argv[], const std::string& flag, double defaultVal) {
    std::string val = getArgString(argc, argv, flag);
    if (!val.empty()) {
        try { return std::stod(val); }
        catch (const std::exception&) { return defaultVal; }
    }
    return defaultVal;
}

static bool hasArg(int argc, char* argv[], const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

static void printUsage(const char* progName) {
    std::cout << "\npulseGraph Offline Renderer\n"
              << "───────────────────────────────────────────────────────────────────\n"
              << "Usage: " << progName << " [options]\n\n"
              << "Required:\n"
              << "  --patch <path>        Patch JSON file\n"
              << "  --out <path>          Output mono WAV file\n\n"
              << "Optional:\n"
              << "  --duration <sec>      Length of the render (default: 5)\n"
              << "  --speed <factor>      Render speed relative to real time (default: 8)\n"
              << "  --config <path>       Engine config JSON file\n"
              << "  --samplerate <int>    Sample rate in Hz (default: 44100)\n"
              << "  --buffersize <int>    Frames per chunk (default: 512)\n"
              << "  --track <path>        Mono WAV streamed into the \"TrackAudio\" extern input\n"
              << "  --help                Show this message\n"
              << std::endl;
}

int main(int argc, char* argv[]) {

    if (hasArg(argc, argv, "--help") || hasArg(argc, argv, "-h")) {
        printUsage(argv[0]);
        return 0;
    }

    // ── Parse arguments ──────────────────────────────────────────────────

    EngineConfig config;
    EngineState  state;

    const std::string configPath = getArgString(argc, argv, "--config");
    if (!configPath.empty()) {
        try {
            ConfigLoader::loadEngineConfig(configPath, config);
        } catch (const std::exception& e) {
            std::cerr << "[Main] FATAL: Failed to load engine config: " << e.what() << std::endl;
            return 1;
        }
    }
    config.sampleRate = getArgInt(argc, argv, "--samplerate", config.sampleRate);
    config.bufferSize = getArgInt(argc, argv, "--buffersize", config.bufferSize);

    const std::string patchPath   = getArgString(argc, argv, "--patch");
    const std::string outPath     = getArgString(argc, argv, "--out");
    const std::string trackPath   = getArgString(argc, argv, "--track");
    const double      durationSec = getArgDouble(argc, argv, "--duration", 5.0);
    const double      speed       = getArgDouble(argc, argv, "--speed", 8.0);

    if (patchPath.empty() || outPath.empty()) {
        std::cerr << "[Main] ERROR: --patch and --out are required." << std::endl;
        printUsage(argv[0]);
        return 1;
    }
    if (durationSec <= 0.0) {
        std::cerr << "[Main] ERROR: --duration must be positive." << std::endl;
        return 1;
    }
    if (!config.validate()) {
        std::cerr << "[Main] FATAL: Invalid engine configuration." << std::endl;
        return 1;
    }

    g_config = &config;
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    Patch patch;
    try {
        patch = JSONLoader::loadPatch(patchPath, config.sampleRate);
    } catch (const std::exception& e) {
        std::cerr << "[Main] FATAL: Failed to load patch: " << e.what() << std::endl;
        return 1;
    }
    const NodeRegistry registry = NodeRegistry::withStockNodes();

    // ── Sink and worker ──────────────────────────────────────────────────

    const uint64_t totalFrames = static_cast<uint64_t>(durationSec * config.sampleRate);
    WavFileAudioOut fileOut(outPath, config.sampleRate, speed, totalFrames);
    if (!fileOut.open()) {
        std::cerr << "[Main] FATAL: Cannot open output file." << std::endl;
        return 1;
    }

    RuntimeRemote remote(fileOut, config, state);
    if (!remote.start()) {
        std::cerr << "[Main] FATAL: Runtime worker failed to start." << std::endl;
        return 1;
    }

    std::unique_ptr<TrackPlayer> track;
    if (!trackPath.empty()) {
        track = std::make_unique<TrackPlayer>(remote.requestChannel());
        if (!track->open(trackPath, config.sampleRate) || !track->start(speed, false)) {
            std::cerr << "[Main] FATAL: Track player failed to start." << std::endl;
            track.reset();
            remote.shutdown();
            remote.join();
            return 1;
        }
    }

    if (!applyPatch(remote, patch, registry)) {
        std::cerr << "[Main] FATAL: Patch could not be applied." << std::endl;
        if (track) track->shutdown();
        remote.shutdown();
        remote.join();
        return 1;
    }

    // ── Wait for the render ──────────────────────────────────────────────
    // The worker stops by itself once the sink has taken totalFrames.

    std::cout << "[Main] Rendering " << durationSec << " s at x" << speed << "..." << std::endl;

    while (!config.shouldExit.load() && remote.isRunning()) {
        remote.wait();

        // One graph step per rendered frame.
        const double done = static_cast<double>(remote.lastStep())
                          / static_cast<double>(totalFrames);
        std::cout << "\r  Progress: " << std::fixed;
        std::cout.precision(1);
        std::cout << (std::min(done, 1.0) * 100.0) << "%     " << std::flush;

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    std::cout << std::endl;

    if (track) track->shutdown();
    remote.shutdown();
    remote.join();

    const int files = writeRecordings(remote, patch, config.sampleRate);
    fileOut.close();

    std::cout << "[Main] Render complete: " << fileOut.framesWritten() << " frames";
    if (files > 0) std::cout << ", " << files << " recording(s)";
    std::cout << "." << std::endl;
    std::cout << "  Xruns:             " << state.xrunCount.load() << std::endl;
    std::cout << "  Commands rejected: " << state.commandsRejected.load() << std::endl;

    return 0;
}
