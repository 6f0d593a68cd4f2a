// RuntimeWorker.hpp — the audio-production loop that owns the Runtime
//
// Runs on the WORKER thread (see RealtimeTypes.hpp). Holds the only mutable
// Runtime, steps it in fill bursts paced by the AudioOut sink, and applies
// commands from the control thread strictly between bursts.
//
// ONE ITERATION (iterate()):
//
//   1. Fill    — if the sink holds less than fillTriggerFrames, step the
//                graph bufferSize samples at a time and feed each chunk
//                until the sink holds at least fillTargetFrames. No command
//                is looked at during a burst. After the burst: NodeEvents
//                for nodes that raised events, Samples for every non-empty
//                tap. Otherwise sleep idleSleepMs.
//   2. Apply   — take commands (non-blocking) until commandsPerIteration
//                graph commands have been applied or the channel is empty.
//                ExternAppendCmd does not count towards the limit: a host
//                stream sends one per chunk and must keep up with the burst
//                size whatever the render speed. Failures go back as
//                RejectedResp.
//   3. Step    — send StepResp{stepCount, commandsTaken}. A control thread
//                blocked in wait() compares commandsTaken with the send
//                sequence of its last command.
//
// Each sample handed to the sink is Runtime::peek(play) after step(): the
// snapshot that step took, i.e. one step behind the node's latest feed.
// 0.0 when nothing is selected or the value is not a float. Taps capture
// the same values.
//
// The loop ends on ShutdownCmd, on a closed request channel, when the sink
// refuses a chunk, or when EngineConfig::shouldExit is set. finish() then
// ships the remaining tap buffers, sends a last StepResp and closes both
// channels.

#pragma once

#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "AudioOut.hpp"
#include "Channel.hpp"
#include "Protocol.hpp"
#include "RealtimeTypes.hpp"
#include "Runtime.hpp"

class RuntimeWorker {
public:

    RuntimeWorker(Runtime runtime,
                  AudioOut& out,
                  Channel<RtRequest>& requests,
                  Channel<RtResponse>& responses,
                  const EngineConfig& config,
                  EngineState& state)
        : mRuntime(std::move(runtime)),
          mOut(out),
          mRequests(requests),
          mResponses(responses),
          mConfig(config),
          mState(state),
          mChunk(static_cast<size_t>(std::max(1, config.bufferSize)), 0.0f) {}

    // ── Lifecycle ────────────────────────────────────────────────────────

    /// Queue prefillSec of silence, then start the sink. Called once on the
    /// control thread before the worker thread is spawned.
    bool prefill() {
        std::fill(mChunk.begin(), mChunk.end(), 0.0f);
        const size_t target = mConfig.prefillFrames();
        while (mOut.queueLen() < target) {
            if (!mOut.feed(mChunk)) {
                std::cerr << "[Worker] ERROR: Sink refused prefill." << std::endl;
                return false;
            }
        }
        if (!mOut.start()) {
            std::cerr << "[Worker] ERROR: Sink failed to start." << std::endl;
            return false;
        }
        mSinkStarted = true;
        return true;
    }

    /// Loop until shutdown. Always ends with finish().
    void run() {
        std::cout << "[Worker] Runtime thread started." << std::endl;
        mState.running.store(true, std::memory_order_relaxed);

        while (iterate()) {}

        finish();
        std::cout << "[Worker] Runtime thread stopped after "
                  << mRuntime.stepCount() << " steps." << std::endl;
    }

    /// One loop iteration. Returns false when the loop must end.
    bool iterate() {
        if (mConfig.shouldExit.load(std::memory_order_relaxed)) return false;

        // ── 1. Fill ──────────────────────────────────────────────────────
        if (mOut.queueLen() < mConfig.fillTriggerFrames()) {
            if (!fillBurst()) {
                std::cerr << "[Worker] Sink closed, stopping." << std::endl;
                return false;
            }
        } else if (mConfig.idleSleepMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(mConfig.idleSleepMs));
        }

        // ── 2. Apply ─────────────────────────────────────────────────────
        int graphCommands = 0;
        while (graphCommands < mConfig.commandsPerIteration) {
            RtRequest req;
            const RecvStatus status = mRequests.tryRecv(req);
            if (status == RecvStatus::Empty) break;
            if (status == RecvStatus::Disconnected) {
                std::cout << "[Worker] Command channel closed." << std::endl;
                return false;
            }
            ++mCommandsTaken;
            if (!std::holds_alternative<ExternAppendCmd>(req)) ++graphCommands;
            if (!apply(req)) return false;
        }

        // ── 3. Step marker ───────────────────────────────────────────────
        mResponses.send(StepResp{mRuntime.stepCount(), mCommandsTaken});
        return true;
    }

    /// Ship pending taps, send the final Step marker, close both channels
    /// so producers (TrackPlayer) and the remote see the worker is gone.
    void finish() {
        shipTaps();
        mResponses.send(StepResp{mRuntime.stepCount(), mCommandsTaken});
        mResponses.close();
        mRequests.close();
        mState.running.store(false, std::memory_order_relaxed);
    }

    // ── Inspection (tests, worker thread only) ───────────────────────────

    const Runtime& runtime() const { return mRuntime; }
    const std::optional<OutputPort>& playPort() const { return mPlay; }
    bool isRecording(const OutputPort& port) const { return mTaps.count(port) > 0; }
    uint64_t commandsTaken() const { return mCommandsTaken; }

private:

    // ── Fill burst ───────────────────────────────────────────────────────

    bool fillBurst() {
        if (mSinkStarted && mOut.queueLen() == 0) {
            mState.xrunCount.fetch_add(1, std::memory_order_relaxed);
        }

        const auto t0 = std::chrono::steady_clock::now();
        size_t produced = 0;
        bool   sinkOk = true;

        while (mOut.queueLen() < mConfig.fillTargetFrames()) {
            for (float& s : mChunk) {
                Runtime::StepEvents evs = mRuntime.step();
                if (!evs.empty()) {
                    for (auto& ev : evs) mPendingEvents.push_back(std::move(ev));
                }

                s = 0.0f;
                if (mPlay) {
                    s = mRuntime.peek(*mPlay).asFloat().value_or(0.0f);
                }
                for (auto& [port, buffer] : mTaps) {
                    buffer.push_back(mRuntime.peek(port));
                }
            }

            produced += mChunk.size();
            if (!mOut.feed(mChunk)) {
                sinkOk = false;
                break;
            }
        }

        const double computeSec = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - t0).count();
        const double audioSec = static_cast<double>(produced) / mConfig.sampleRate;
        if (audioSec > 0.0) {
            mState.cpuLoad.store(static_cast<float>(computeSec / audioSec),
                                 std::memory_order_relaxed);
        }
        mState.stepCount.store(mRuntime.stepCount(), std::memory_order_relaxed);
        mState.framesEmitted.fetch_add(produced, std::memory_order_relaxed);

        if (!mPendingEvents.empty()) {
            mResponses.send(NodeEventsResp{std::move(mPendingEvents)});
            mPendingEvents.clear();
        }
        shipTaps();
        return sinkOk;
    }

    void shipTaps() {
        for (auto& [port, buffer] : mTaps) {
            if (buffer.empty()) continue;
            mResponses.send(SamplesResp{port, std::move(buffer)});
            buffer.clear();
        }
    }

    // ── Commands ─────────────────────────────────────────────────────────

    void reject(const RtRequest& req, RuntimeStatus status,
                std::optional<NodeAddress> address,
                std::optional<RequestId> id = std::nullopt) {
        std::cerr << "[Worker] WARNING: " << requestName(req) << " rejected ("
                  << runtimeStatusName(status) << ")." << std::endl;
        mState.commandsRejected.fetch_add(1, std::memory_order_relaxed);
        mResponses.send(RejectedResp{requestName(req), status, address, id});
    }

    /// Drop taps and the play selection that refer to nodes no longer live.
    void dropDeadPorts() {
        for (auto it = mTaps.begin(); it != mTaps.end();) {
            if (!mRuntime.contains(it->first.node)) it = mTaps.erase(it);
            else ++it;
        }
        if (mPlay && !mRuntime.contains(mPlay->node)) mPlay.reset();
    }

    RuntimeStatus checkPort(const OutputPort& port) const {
        const Node* node = mRuntime.node(port.node);
        if (!node) return RuntimeStatus::AddressNotFound;
        if (port.port >= node->outputCount()) return RuntimeStatus::PortOutOfRange;
        return RuntimeStatus::Ok;
    }

    /// Apply one command. Returns false on ShutdownCmd.
    bool apply(RtRequest& req) {
        bool keepRunning = true;
        bool applied = true;

        std::visit([&](auto& cmd) {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, InsertCmd>) {
                const RuntimeStatus s = cmd.node
                    ? mRuntime.validateInsert(cmd.inputs, *cmd.node)
                    : RuntimeStatus::ArityMismatch;
                if (s != RuntimeStatus::Ok) {
                    reject(req, s, std::nullopt, cmd.id);
                    applied = false;
                    return;
                }
                const NodeAddress addr = mRuntime.insert(std::move(cmd.inputs), std::move(cmd.node));
                mResponses.send(InsertedResp{cmd.id, addr});

            } else if constexpr (std::is_same_v<T, RemoveCmd>) {
                const RuntimeStatus s = mRuntime.remove(cmd.address);
                if (s != RuntimeStatus::Ok) {
                    reject(req, s, cmd.address);
                    applied = false;
                    return;
                }
                dropDeadPorts();

            } else if constexpr (std::is_same_v<T, SetInputCmd>) {
                const RuntimeStatus s = mRuntime.setInput(cmd.dst, cmd.port, cmd.src);
                if (s != RuntimeStatus::Ok) {
                    reject(req, s, cmd.dst);
                    applied = false;
                }

            } else if constexpr (std::is_same_v<T, SetAllInputsCmd>) {
                const RuntimeStatus s = mRuntime.setAllInputs(cmd.dst, std::move(cmd.inputs));
                if (s != RuntimeStatus::Ok) {
                    reject(req, s, cmd.dst);
                    applied = false;
                }

            } else if constexpr (std::is_same_v<T, ExternDefineCmd>) {
                mRuntime.externInputs().define(cmd.name, cmd.kind);

            } else if constexpr (std::is_same_v<T, ExternAppendCmd>) {
                auto handle = mRuntime.externInputs().get(cmd.name);
                if (!handle) {
                    reject(req, RuntimeStatus::UnknownExternInput, std::nullopt);
                    applied = false;
                    return;
                }
                mRuntime.externInputs().extend(*handle, std::move(cmd.values));

            } else if constexpr (std::is_same_v<T, PlayCmd>) {
                if (cmd.port) {
                    const RuntimeStatus s = checkPort(*cmd.port);
                    if (s != RuntimeStatus::Ok) {
                        reject(req, s, cmd.port->node);
                        applied = false;
                        return;
                    }
                }
                mPlay = cmd.port;

            } else if constexpr (std::is_same_v<T, RecordCmd>) {
                const RuntimeStatus s = checkPort(cmd.port);
                if (s != RuntimeStatus::Ok) {
                    reject(req, s, cmd.port.node);
                    applied = false;
                    return;
                }
                mTaps.emplace(cmd.port, std::vector<Value>());

            } else if constexpr (std::is_same_v<T, StopRecordingCmd>) {
                auto it = mTaps.find(cmd.port);
                if (it != mTaps.end()) {
                    if (!it->second.empty()) {
                        mResponses.send(SamplesResp{cmd.port, std::move(it->second)});
                    }
                    mTaps.erase(it);
                }

            } else if constexpr (std::is_same_v<T, ReplaceRuntimeCmd>) {
                if (!cmd.runtime) {
                    applied = false;
                    return;
                }
                // Keep the live queues; add any definitions only the
                // snapshot knows about.
                ExternInputs live = std::move(mRuntime.externInputs());
                const ExternInputs& snap = cmd.runtime->externInputs();
                for (const std::string& name : snap.names()) {
                    if (!live.get(name)) {
                        live.define(name, *snap.kind(*snap.get(name)));
                    }
                }
                const uint64_t steps = mRuntime.stepCount();
                mRuntime = std::move(*cmd.runtime);
                mRuntime.setExternInputs(std::move(live));
                mRuntime.setStepCount(steps);
                dropDeadPorts();
                std::cout << "[Worker] Runtime replaced (" << mRuntime.size()
                          << " nodes)." << std::endl;

            } else if constexpr (std::is_same_v<T, CloneRuntimeCmd>) {
                mResponses.send(RuntimeClonedResp{std::make_unique<Runtime>(mRuntime)});

            } else if constexpr (std::is_same_v<T, ShutdownCmd>) {
                std::cout << "[Worker] Shutdown requested." << std::endl;
                keepRunning = false;
            }
        }, req);

        if (applied) mState.commandsApplied.fetch_add(1, std::memory_order_relaxed);
        mState.numNodes.store(static_cast<int>(mRuntime.size()), std::memory_order_relaxed);
        return keepRunning;
    }

    Runtime                mRuntime;
    AudioOut&              mOut;
    Channel<RtRequest>&    mRequests;
    Channel<RtResponse>&   mResponses;
    const EngineConfig&    mConfig;
    EngineState&           mState;

    std::vector<float>                                 mChunk;
    std::optional<OutputPort>                          mPlay;
    std::unordered_map<OutputPort, std::vector<Value>> mTaps;
    Runtime::StepEvents                                mPendingEvents;
    bool                                               mSinkStarted = false;
    uint64_t                                           mCommandsTaken = 0;
};
