// RealtimeTypes.hpp — Shared data types for the real-time graph engine
//
// These structs are shared by the agents (RuntimeWorker, RuntimeRemote,
// audio sinks, TrackPlayer) and by the two entry points.
//
// ─────────────────────────────────────────────────────────────────────────────
// THREADING MODEL
// ─────────────────────────────────────────────────────────────────────────────
//
//  ┌────────────────┬──────────────────────────────────────────────────────┐
//  │ Thread         │ Role                                                 │
//  ├────────────────┼──────────────────────────────────────────────────────┤
//  │ CONTROL thread │ main(): setup, patch loading, monitoring loop,       │
//  │                │ clean shutdown. Owns RuntimeRemote. Only ever        │
//  │                │ REQUESTS graph mutations; never touches the Runtime. │
//  ├────────────────┼──────────────────────────────────────────────────────┤
//  │ WORKER thread  │ RuntimeWorker::run(). Owns the only mutable Runtime. │
//  │                │ Steps the graph in fill bursts, applies commands     │
//  │                │ between bursts, feeds the AudioOut sink.             │
//  ├────────────────┼──────────────────────────────────────────────────────┤
//  │ DEVICE thread  │ AlloLib AudioIO callback (AlloAudioOut only). Drains │
//  │                │ the SampleRing. MUST NOT allocate, lock, or do I/O.  │
//  ├────────────────┼──────────────────────────────────────────────────────┤
//  │ LOADER thread  │ TrackPlayer: reads a WAV file with libsndfile and    │
//  │                │ sends ExternAppend commands through RuntimeRemote.   │
//  └────────────────┴──────────────────────────────────────────────────────┘
//
// MEMORY ORDERING RULES:
//
//  ┌─────────────────────────────┬────────────────────────────────────────┐
//  │ Atomic                      │ Ordering used                          │
//  ├─────────────────────────────┼────────────────────────────────────────┤
//  │ EngineConfig::shouldExit    │ relaxed (polling-only, no dep. data)   │
//  ├─────────────────────────────┼────────────────────────────────────────┤
//  │ EngineState::*              │ relaxed (single writer: worker thread; │
//  │                             │ readers: control thread for display)   │
//  ├─────────────────────────────┼────────────────────────────────────────┤
//  │ SampleRing read/write index │ release on write, acquire on read.     │
//  │                             │ Sample data is visible before the      │
//  │                             │ index that publishes it.               │
//  └─────────────────────────────┴────────────────────────────────────────┘
//
// INVARIANTS THAT MUST NEVER BE VIOLATED:
//
//  1. Runtime::step() is called from the WORKER thread only. Everything that
//     crosses into or out of it goes through Channel<RtRequest> and
//     Channel<RtResponse> by value.
//
//  2. The AudioOut sink is created and started by the control thread before
//     the worker starts, and stopped only after the worker has joined.
//
//  3. Node configs and RealInput defaults are the only objects shared
//     between the control and worker threads; they are internally atomic.

#pragma once

#include <atomic>
#include <cstdint>
#include <iostream>
#include <string>

// ─────────────────────────────────────────────────────────────────────────────
// EngineConfig — configuration for the worker loop and the audio sink
// ─────────────────────────────────────────────────────────────────────────────
// Set once at startup, read-only while the worker runs (except shouldExit).

struct EngineConfig {
    // ── Audio settings ───────────────────────────────────────────────────
    int    sampleRate        = 44100;  // Hz
    int    bufferSize        = 512;    // frames per chunk handed to the sink

    // ── Pacing ───────────────────────────────────────────────────────────
    // The worker starts a fill burst when the sink holds less than
    // fillTriggerSec of audio, and keeps stepping until it holds at least
    // fillTargetSec. Between bursts it applies commands and sleeps.
    double fillTriggerSec       = 0.08;
    double fillTargetSec        = 0.10;
    double prefillSec           = 0.01;  // silence queued before sink start
    int    idleSleepMs          = 10;
    int    commandsPerIteration = 1;

    // ── Control ──────────────────────────────────────────────────────────
    std::atomic<bool> shouldExit{false};

    EngineConfig() = default;
    EngineConfig(const EngineConfig& other) { *this = other; }
    EngineConfig& operator=(const EngineConfig& other) {
        sampleRate           = other.sampleRate;
        bufferSize           = other.bufferSize;
        fillTriggerSec       = other.fillTriggerSec;
        fillTargetSec        = other.fillTargetSec;
        prefillSec           = other.prefillSec;
        idleSleepMs          = other.idleSleepMs;
        commandsPerIteration = other.commandsPerIteration;
        shouldExit.store(other.shouldExit.load(std::memory_order_relaxed),
                         std::memory_order_relaxed);
        return *this;
    }

    size_t fillTriggerFrames() const { return static_cast<size_t>(fillTriggerSec * sampleRate); }
    size_t fillTargetFrames()  const { return static_cast<size_t>(fillTargetSec * sampleRate); }
    size_t prefillFrames()     const { return static_cast<size_t>(prefillSec * sampleRate); }

    /// Check invariants. Logs every violation and returns false if any.
    bool validate() const {
        bool ok = true;
        if (sampleRate <= 0) {
            std::cerr << "[Config] ERROR: sampleRate must be positive (got "
                      << sampleRate << ")." << std::endl;
            ok = false;
        }
        if (bufferSize <= 0) {
            std::cerr << "[Config] ERROR: bufferSize must be positive (got "
                      << bufferSize << ")." << std::endl;
            ok = false;
        }
        if (fillTriggerSec <= 0.0) {
            std::cerr << "[Config] ERROR: fillTriggerSec must be positive." << std::endl;
            ok = false;
        }
        if (fillTargetSec < fillTriggerSec) {
            std::cerr << "[Config] ERROR: fillTargetSec (" << fillTargetSec
                      << ") must be >= fillTriggerSec (" << fillTriggerSec << ")." << std::endl;
            ok = false;
        }
        if (prefillSec < 0.0) {
            std::cerr << "[Config] ERROR: prefillSec must not be negative." << std::endl;
            ok = false;
        }
        if (idleSleepMs < 0) {
            std::cerr << "[Config] ERROR: idleSleepMs must not be negative." << std::endl;
            ok = false;
        }
        if (commandsPerIteration < 1) {
            std::cerr << "[Config] ERROR: commandsPerIteration must be >= 1." << std::endl;
            ok = false;
        }
        return ok;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// EngineState — monitoring counters (written by the worker only)
// ─────────────────────────────────────────────────────────────────────────────

struct EngineState {
    std::atomic<uint64_t> stepCount{0};        // graph steps since start
    std::atomic<uint64_t> framesEmitted{0};    // samples handed to the sink
    std::atomic<uint64_t> commandsApplied{0};
    std::atomic<uint64_t> commandsRejected{0};
    std::atomic<uint64_t> xrunCount{0};        // sink found empty at burst start
    std::atomic<float>    cpuLoad{0.0f};       // burst compute time / audio time
    std::atomic<int>      numNodes{0};
    std::atomic<bool>     running{false};
};
