// main.cpp — pulseGraph real-time engine entry point
//
// This is the CLI entry point for the real-time engine. It:
//   1. Parses command-line arguments (patch, engine config, device options)
//   2. Creates the EngineConfig and EngineState
//   3. Loads the patch file (JSONLoader)
//   4. Opens the audio device (AlloAudioOut)
//   5. Prefills the sink and starts the worker thread (RuntimeRemote)
//   6. Optionally streams a WAV file into "TrackAudio" (TrackPlayer)
//   7. Applies the patch through the command channel
//   8. Runs a monitoring loop until interrupted (Ctrl+C, --duration or sink end)
//   9. Shuts down cleanly (track player → worker → recordings → device)
//
// Usage:
//   ./pulseGraph_realtime_engine \
//       --patch ../patches/sine_gain.json \
//       [--config ../patches/engine.json] \
//       [--samplerate 48000] \
//       [--buffersize 512] \
//       [--channels 2] \
//       [--gain 0.5] \
//       [--track input.wav [--loop]]

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "AlloAudioOut.hpp"
#include "ConfigLoader.hpp"    // ConfigLoader::loadEngineConfig()
#include "JSONLoader.hpp"      // Patch, JSONLoader::loadPatch()
#include "PatchApply.hpp"      // applyPatch(), writeRecordings()
#include "RealtimeTypes.hpp"
#include "RuntimeRemote.hpp"
#include "TrackPlayer.hpp"
#include "nodes/NodeRegistry.hpp"

// ─────────────────────────────────────────────────────────────────────────────
// Signal handling for clean shutdown on Ctrl+C
// ─────────────────────────────────────────────────────────────────────────────

static EngineConfig* g_config = nullptr;

void signalHandler(int signum) {
    std::cout << "\n[Main] Interrupt received (signal " << signum << "). Shutting down..." << std::endl;
    if (g_config) {
        g_config->shouldExit.store(true);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Argument parsing helpers
// ─────────────────────────────────────────────────────────────────────────────

/// Look up a string argument by name. Returns empty string if not found.
static std::string getArgString(int argc, char* argv[], const std::string& flag) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string(argv[i]) == flag) {
            return std::string(argv[i + 1]);
        }
    }
    return "";
}

/// Look up an integer argument by name. Returns defaultVal if not found.
static int getArgInt(int argc, char* argv[], const std::string& flag, int defaultVal) {
    std::string val = getArgString(argc, argv, flag);
    if (!val.empty()) {
        try { return std::stoi(val); }
        catch (const std::exception&) { return defaultVal; }
    }
    return defaultVal;
}

/// Look up a float argument by name. Returns defaultVal if not found.
static float getArgFloat(int argc, char* argv[], const std::string& flag, float defaultVal) {
    std::string val = getArgString(argc, argv, flag);
    if (!val.empty()) {
        try { return std::stof(val); }
        catch (const std::exception&) { return defaultVal; }
    }
    return defaultVal;
}

/// Check if a flag is present (no value).
static bool hasArg(int argc, char* argv[], const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

// ─────────────────────────────────────────────────────────────────────────────
// Usage / help
// ─────────────────────────────────────────────────────────────────────────────

static void printUsage(const char* progName) {
    std::cout << "\npulseGraph Real-Time Engine\n"
              << "───────────────────────────────────────────────────────────────────\n"
              << "Usage: " << progName << " [options]\n\n"
              << "Required:\n"
              << "  --patch <path>        Patch JSON file (nodes, connections, play port)\n\n"
              << "Optional:\n"
              << "  --config <path>       Engine config JSON file\n"
              << "  --samplerate <int>    Audio sample rate in Hz (default: 44100)\n"
              << "  --buffersize <int>    Frames per chunk fed to the device (default: 512)\n"
              << "  --fill_trigger <sec>  Start a fill burst below this much audio (default: 0.08)\n"
              << "  --fill_target <sec>   Fill until this much audio is queued (default: 0.10)\n"
              << "  --channels <int>      Device output channels, mono copied to each (default: 2)\n"
              << "  --gain <float>        Master gain 0.0–1.0 (default: 0.5)\n"
              << "  --track <path>        Mono WAV streamed into the \"TrackAudio\" extern input\n"
              << "  --loop                Loop the --track file\n"
              << "  --duration <sec>      Stop after this many seconds (default: run until Ctrl+C)\n"
              << "  --help                Show this message\n"
              << "\nConfig precedence: defaults < --config file < command-line flags.\n"
              << std::endl;
}

// ─────────────────────────────────────────────────────────────────────────────
// Main
// ─────────────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {

    // ── Help flag ────────────────────────────────────────────────────────
    if (hasArg(argc, argv, "--help") || hasArg(argc, argv, "-h")) {
        printUsage(argv[0]);
        return 0;
    }

    std::cout << "\n╔══════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║  pulseGraph Real-Time Engine                             ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════════╝\n" << std::endl;

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

    config.sampleRate     = getArgInt(argc, argv, "--samplerate", config.sampleRate);
    config.bufferSize     = getArgInt(argc, argv, "--buffersize", config.bufferSize);
    config.fillTriggerSec = getArgFloat(argc, argv, "--fill_trigger",
                                        static_cast<float>(config.fillTriggerSec));
    config.fillTargetSec  = getArgFloat(argc, argv, "--fill_target",
                                        static_cast<float>(config.fillTargetSec));

    const std::string patchPath = getArgString(argc, argv, "--patch");
    const std::string trackPath = getArgString(argc, argv, "--track");
    const bool  loopTrack   = hasArg(argc, argv, "--loop");
    const int   channels    = getArgInt(argc, argv, "--channels", 2);
    const float gain        = getArgFloat(argc, argv, "--gain", 0.5f);
    const float durationSec = getArgFloat(argc, argv, "--duration", 0.0f);

    // ── Validate required arguments ──────────────────────────────────────

    if (patchPath.empty()) {
        std::cerr << "[Main] ERROR: --patch is required." << std::endl;
        printUsage(argv[0]);
        return 1;
    }
    if (!config.validate()) {
        std::cerr << "[Main] FATAL: Invalid engine configuration." << std::endl;
        return 1;
    }

    std::cout << "[Main] Configuration:" << std::endl;
    std::cout << "  Patch:        " << patchPath << std::endl;
    std::cout << "  Sample rate:  " << config.sampleRate << " Hz" << std::endl;
    std::cout << "  Buffer size:  " << config.bufferSize << " frames" << std::endl;
    std::cout << "  Fill window:  " << config.fillTriggerSec << " s → "
              << config.fillTargetSec << " s" << std::endl;
    std::cout << "  Channels:     " << channels << std::endl;
    std::cout << "  Master gain:  " << gain << std::endl;
    if (!trackPath.empty()) {
        std::cout << "  Track:        " << trackPath << (loopTrack ? " (loop)" : "") << std::endl;
    }
    std::cout << std::endl;

    // ── Register signal handler for clean Ctrl+C shutdown ────────────────
    g_config = &config;
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    // ── Load patch ───────────────────────────────────────────────────────

    std::cout << "[Main] Loading patch: " << patchPath << std::endl;
    Patch patch;
    try {
        patch = JSONLoader::loadPatch(patchPath, config.sampleRate);
    } catch (const std::exception& e) {
        std::cerr << "[Main] FATAL: Failed to load patch: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "[Main] Patch loaded: " << patch.nodes.size() << " nodes, "
              << patch.connections.size() << " connections." << std::endl;

    const NodeRegistry registry = NodeRegistry::withStockNodes();

    // ── Open the audio device ────────────────────────────────────────────

    AlloAudioOut audioOut(config, channels);
    audioOut.setMasterGain(gain);
    if (!audioOut.init()) {
        std::cerr << "[Main] FATAL: Audio device initialization failed." << std::endl;
        return 1;
    }

    // ── Start the worker ─────────────────────────────────────────────────
    // The sink is prefilled and started before the worker thread exists,
    // so the first device callback already has audio to drain.

    RuntimeRemote remote(audioOut, config, state);
    if (!remote.start()) {
        std::cerr << "[Main] FATAL: Runtime worker failed to start." << std::endl;
        audioOut.shutdown();
        return 1;
    }

    // ── Track player (optional) ──────────────────────────────────────────

    std::unique_ptr<TrackPlayer> track;
    if (!trackPath.empty()) {
        track = std::make_unique<TrackPlayer>(remote.requestChannel());
        if (!track->open(trackPath, config.sampleRate) || !track->start(1.0, loopTrack)) {
            std::cerr << "[Main] FATAL: Track player failed to start." << std::endl;
            track.reset();
            remote.shutdown();
            remote.join();
            audioOut.shutdown();
            return 1;
        }
    }

    // ── Apply the patch ──────────────────────────────────────────────────

    if (!applyPatch(remote, patch, registry)) {
        std::cerr << "[Main] FATAL: Patch could not be applied." << std::endl;
        if (track) track->shutdown();
        remote.shutdown();
        remote.join();
        audioOut.shutdown();
        return 1;
    }

    // ── Monitoring loop ──────────────────────────────────────────────────
    // Run until Ctrl+C, --duration, or the worker stops on its own. Drain
    // responses so recordings and node events do not pile up in the channel.

    std::cout << "[Main] Graph running: " << patch.nodes.size()
              << " nodes. Press Ctrl+C to stop.\n" << std::endl;

    const auto t0 = std::chrono::steady_clock::now();

    while (!config.shouldExit.load() && remote.isRunning()) {

        remote.wait();
        const Runtime::StepEvents events = remote.events();
        if (!events.empty()) {
            std::cout << "\n[Main] " << events.size() << " node(s) raised events." << std::endl;
        }

        const double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - t0).count();
        if (durationSec > 0.0f && elapsed >= durationSec) {
            std::cout << "\n[Main] Duration reached." << std::endl;
            break;
        }

        float cpu = state.cpuLoad.load(std::memory_order_relaxed);

        std::cout << "\r  Time: " << std::fixed;
        std::cout.precision(1);
        std::cout << elapsed << "s"
                  << "  |  CPU: " << (cpu * 100.0f) << "%"
                  << "  |  Nodes: " << state.numNodes.load(std::memory_order_relaxed)
                  << "  |  Steps: " << state.stepCount.load(std::memory_order_relaxed)
                  << "  |  Xruns: " << state.xrunCount.load(std::memory_order_relaxed)
                  << "  |  Underruns: " << audioOut.underruns()
                  << "  |  Dropped: " << audioOut.droppedFrames()
                  << "     " << std::flush;

        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    std::cout << std::endl;

    // ── Clean shutdown ───────────────────────────────────────────────────
    // Order matters: stop the producer first, then the worker (it ships the
    // last tap buffers on its way out), then the device it was feeding.

    std::cout << "\n[Main] Shutting down..." << std::endl;
    if (track) track->shutdown();
    remote.shutdown();
    remote.join();

    const int files = writeRecordings(remote, patch, config.sampleRate);
    if (files > 0) {
        std::cout << "[Main] Wrote " << files << " recording(s)." << std::endl;
    }

    audioOut.shutdown();

    std::cout << "[Main] Final stats:" << std::endl;
    std::cout << "  Steps:             " << state.stepCount.load() << std::endl;
    std::cout << "  Frames emitted:    " << state.framesEmitted.load() << std::endl;
    std::cout << "  Commands applied:  " << state.commandsApplied.load() << std::endl;
    std::cout << "  Commands rejected: " << state.commandsRejected.load() << std::endl;
    std::cout << "  Xruns:             " << state.xrunCount.load() << std::endl;
    std::cout << "  Device underruns:  " << audioOut.underruns() << std::endl;
    std::cout << "  Dropped frames:    " << audioOut.droppedFrames() << std::endl;
    std::cout << "[Main] Goodbye." << std::endl;

    return 0;
}
