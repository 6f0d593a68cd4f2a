// RuntimeRemote.hpp — control-thread handle to a Runtime running elsewhere
//
// Starts the worker thread (RuntimeWorker) and exposes the graph as a set
// of asynchronous commands addressed by caller-chosen node keys. The worker
// assigns generational addresses; the remote keeps the key ↔ address map
// up to date from InsertedResp.
//
// RESPONSIBILITIES:
// 1. Prefill and start the sink, then spawn the worker thread.
// 2. Translate key-based calls into address-based commands.
// 3. Collect responses (process()): addresses, node events, recordings,
//    rejections, cloned snapshots.
// 4. wait(): after insert/remove, block until the worker has applied them.
//    Every send records its channel sequence number; a StepResp whose
//    commandsTaken passes it means the command has been applied.
// 5. Shutdown and join on destruction.
//
// THREADING:
//   Every method is for the CONTROL thread. The only exception is
//   requestChannel(): Channel::send is thread-safe, so a producer such as
//   TrackPlayer may send ExternAppendCmd from its own thread.

#pragma once

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "AudioOut.hpp"
#include "Channel.hpp"
#include "Protocol.hpp"
#include "RealtimeTypes.hpp"
#include "Runtime.hpp"
#include "RuntimeWorker.hpp"

class RuntimeRemote {
public:

    using NodeKey = std::string;
    using KeyMapping = std::vector<std::pair<NodeKey, uint64_t>>;   // key → NodeAddress::toBits

    struct SavedState {
        std::unique_ptr<Runtime> runtime;   // null if the worker is gone
        KeyMapping               mapping;
    };

    RuntimeRemote(AudioOut& out, const EngineConfig& config, EngineState& state)
        : mOut(out), mConfig(config), mState(state) {}

    ~RuntimeRemote() {
        shutdown();
        join();
    }

    RuntimeRemote(const RuntimeRemote&) = delete;
    RuntimeRemote& operator=(const RuntimeRemote&) = delete;

    // ── Lifecycle ────────────────────────────────────────────────────────

    /// Prefill the sink, start it and spawn the worker. `initial` becomes
    /// the worker's runtime.
    bool start(Runtime initial = Runtime()) {
        if (mWorker) {
            std::cerr << "[Remote] ERROR: Already started." << std::endl;
            return false;
        }
        std::cout << "[Remote] Runtime init." << std::endl;

        mWorker = std::make_unique<RuntimeWorker>(std::move(initial), mOut, mRequests,
                                                  mResponses, mConfig, mState);
        if (!mWorker->prefill()) {
            std::cerr << "[Remote] ERROR: Sink prefill failed." << std::endl;
            mWorker->finish();
            return false;
        }

        // Set here too so isRunning() holds as soon as start() returns.
        mState.running.store(true, std::memory_order_relaxed);
        mThread = std::thread([this] { mWorker->run(); });
        return true;
    }

    void shutdown() {
        if (mShutdownSent || !mWorker) return;
        post(ShutdownCmd{});
        mShutdownSent = true;
    }

    /// Join the worker thread (after shutdown() or sink failure), then
    /// collect everything it sent on the way out.
    void join() {
        if (mThread.joinable()) mThread.join();
        drain();
    }

    bool isRunning() const { return mState.running.load(std::memory_order_relaxed); }

    // ── Graph commands ───────────────────────────────────────────────────

    /// Insert a node under `key`, all inputs disconnected. The address is
    /// known after the next wait().
    bool insert(const NodeKey& key, std::unique_ptr<Node> node) {
        if (!node) return false;
        if (mByKey.count(key) || pendingKey(key)) {
            std::cerr << "[Remote] ERROR: Node key '" << key << "' already in use." << std::endl;
            return false;
        }
        const RequestId id = ++mNextRequestId;
        InputWiring inputs(node->inputs().size());
        mPendingInserts[id] = key;
        mMustWait = true;
        return post(InsertCmd{id, std::move(inputs), std::move(node)});
    }

    bool remove(const NodeKey& key) {
        auto addr = lookup(key, "remove");
        if (!addr) return false;
        unmap(key);
        mMustWait = true;
        return post(RemoveCmd{*addr});
    }

    bool connect(const NodeKey& src, size_t srcPort, const NodeKey& dst, size_t dstPort) {
        auto s = lookup(src, "connect");
        auto d = lookup(dst, "connect");
        if (!s || !d) return false;
        return post(SetInputCmd{*d, dstPort, OutputPort(*s, srcPort)});
    }

    bool disconnect(const NodeKey& dst, size_t port) {
        auto d = lookup(dst, "disconnect");
        if (!d) return false;
        return post(SetInputCmd{*d, port, std::nullopt});
    }

    bool setInputs(const NodeKey& dst, InputWiring inputs) {
        auto d = lookup(dst, "setInputs");
        if (!d) return false;
        return post(SetAllInputsCmd{*d, std::move(inputs)});
    }

    /// Select the port fed to the sink; nullopt (or an unknown key) plays silence.
    bool play(const std::optional<std::pair<NodeKey, size_t>>& port) {
        std::optional<OutputPort> out;
        if (port) {
            auto addr = addressOf(port->first);
            if (addr) out = OutputPort(*addr, port->second);
        }
        return post(PlayCmd{out});
    }

    bool record(const NodeKey& key, size_t port) {
        auto addr = lookup(key, "record");
        if (!addr) return false;
        return post(RecordCmd{OutputPort(*addr, port)});
    }

    bool stopRecording(const NodeKey& key, size_t port) {
        auto addr = lookup(key, "stopRecording");
        if (!addr) return false;
        return post(StopRecordingCmd{OutputPort(*addr, port)});
    }

    bool defineExternInput(const std::string& name, ValueKind kind) {
        return post(ExternDefineCmd{name, kind});
    }

    bool appendExternInput(const std::string& name, std::vector<Value> values) {
        return post(ExternAppendCmd{name, std::move(values)});
    }

    /// Swap the running graph for a snapshot from saveState(). The key map
    /// is replaced by `mapping`; entries that do not decode are dropped.
    bool replaceRuntime(std::unique_ptr<Runtime> runtime, const KeyMapping& mapping) {
        if (!runtime) return false;
        mByKey.clear();
        mByAddress.clear();
        for (const auto& [key, bits] : mapping) {
            auto addr = NodeAddress::fromBits(bits);
            if (!addr) {
                std::cerr << "[Remote] WARNING: Bad address bits for '" << key
                          << "', dropped." << std::endl;
                continue;
            }
            map(key, *addr);
        }
        mMustWait = true;
        return post(ReplaceRuntimeCmd{std::move(runtime)});
    }

    /// Deep copy of the running graph plus the key map, taken between two
    /// fill bursts. Blocks until the worker answers.
    SavedState saveState() {
        mCloned.reset();
        if (!post(CloneRuntimeCmd{})) return SavedState{};

        sync();

        SavedState saved;
        saved.runtime = std::move(mCloned);
        for (const auto& [key, addr] : mByKey) saved.mapping.emplace_back(key, addr.toBits());
        return saved;
    }

    // ── Responses ────────────────────────────────────────────────────────

    /// If a command that needs the worker's answer is outstanding, block
    /// until a Step marker shows every command sent so far was applied.
    /// Then drain whatever else is queued. Returns false once the worker
    /// has closed the response channel.
    bool wait() {
        bool open = true;
        if (mMustWait) {
            RtResponse resp;
            while (true) {
                const RecvStatus status = mResponses.recv(resp);
                if (status != RecvStatus::Ok) {
                    open = false;
                    break;
                }
                const StepResp* step = std::get_if<StepResp>(&resp);
                const bool done = step && step->commandsTaken >= mSentUpTo;
                process(std::move(resp));
                if (done) break;
            }
            mMustWait = false;
        }
        return drain() && open;
    }

    /// wait() even if nothing sent so far needs an answer. Rejections of
    /// connect/play/record calls have arrived once this returns.
    bool sync() {
        mMustWait = true;
        return wait();
    }

    void process(RtResponse resp) {
        std::visit([this](auto& r) {
            using T = std::decay_t<decltype(r)>;

            if constexpr (std::is_same_v<T, InsertedResp>) {
                auto it = mPendingInserts.find(r.id);
                if (it == mPendingInserts.end()) return;
                map(it->second, r.address);
                mPendingInserts.erase(it);

            } else if constexpr (std::is_same_v<T, NodeEventsResp>) {
                for (auto& ev : r.events) mNodeEvents.push_back(std::move(ev));

            } else if constexpr (std::is_same_v<T, RuntimeClonedResp>) {
                mCloned = std::move(r.runtime);

            } else if constexpr (std::is_same_v<T, SamplesResp>) {
                auto& buf = mRecordings[r.port];
                buf.insert(buf.end(), r.values.begin(), r.values.end());

            } else if constexpr (std::is_same_v<T, RejectedResp>) {
                std::cerr << "[Remote] WARNING: " << r.command << " rejected: "
                          << runtimeStatusName(r.status) << std::endl;
                if (r.id) mPendingInserts.erase(*r.id);
                if (r.address && r.status == RuntimeStatus::AddressNotFound) {
                    auto it = mByAddress.find(*r.address);
                    if (it != mByAddress.end()) unmap(it->second);
                }
                mRejections.push_back(std::move(r));

            } else if constexpr (std::is_same_v<T, StepResp>) {
                mLastStep = r.stepCount;
            }
        }, resp);
    }

    /// Node events received so far; clears the list.
    Runtime::StepEvents events() { return std::exchange(mNodeEvents, {}); }

    /// Non-empty tap buffers received so far; clears them.
    std::vector<std::pair<OutputPort, std::vector<Value>>> recordings() {
        std::vector<std::pair<OutputPort, std::vector<Value>>> out;
        for (auto& [port, buf] : mRecordings) {
            if (!buf.empty()) out.emplace_back(port, std::exchange(buf, {}));
        }
        return out;
    }

    std::vector<RejectedResp> rejections() { return std::exchange(mRejections, {}); }

    // ── Key mapping ──────────────────────────────────────────────────────

    std::optional<NodeAddress> addressOf(const NodeKey& key) const {
        auto it = mByKey.find(key);
        if (it == mByKey.end()) return std::nullopt;
        return it->second;
    }

    std::optional<NodeKey> keyOf(NodeAddress address) const {
        auto it = mByAddress.find(address);
        if (it == mByAddress.end()) return std::nullopt;
        return it->second;
    }

    uint64_t lastStep() const { return mLastStep; }

    Channel<RtRequest>& requestChannel() { return mRequests; }

private:

    bool post(RtRequest req) {
        uint64_t seq = 0;
        if (!mRequests.send(std::move(req), &seq)) return false;
        mSentUpTo = seq + 1;
        return true;
    }

    bool drain() {
        RtResponse resp;
        while (true) {
            const RecvStatus status = mResponses.tryRecv(resp);
            if (status == RecvStatus::Empty) return true;
            if (status == RecvStatus::Disconnected) return false;
            process(std::move(resp));
        }
    }

    std::optional<NodeAddress> lookup(const NodeKey& key, const char* op) const {
        auto addr = addressOf(key);
        if (!addr) {
            std::cerr << "[Remote] ERROR: " << op << ": unknown node key '" << key
                      << "'." << std::endl;
        }
        return addr;
    }

    bool pendingKey(const NodeKey& key) const {
        for (const auto& [id, k] : mPendingInserts) {
            if (k == key) return true;
        }
        return false;
    }

    void map(const NodeKey& key, NodeAddress address) {
        mByKey[key] = address;
        mByAddress[address] = key;
    }

    void unmap(const NodeKey& key) {
        auto it = mByKey.find(key);
        if (it == mByKey.end()) return;
        mByAddress.erase(it->second);
        mByKey.erase(it);
    }

    AudioOut&            mOut;
    const EngineConfig&  mConfig;
    EngineState&         mState;

    Channel<RtRequest>   mRequests;
    Channel<RtResponse>  mResponses;
    std::unique_ptr<RuntimeWorker> mWorker;
    std::thread          mThread;
    bool                 mShutdownSent = false;
    bool                 mMustWait = false;
    uint64_t             mSentUpTo = 0;   // commandsTaken that covers our last send

    RequestId                                   mNextRequestId = 0;
    std::unordered_map<RequestId, NodeKey>      mPendingInserts;
    std::unordered_map<NodeKey, NodeAddress>    mByKey;
    std::unordered_map<NodeAddress, NodeKey>    mByAddress;

    Runtime::StepEvents                                    mNodeEvents;
    std::unordered_map<OutputPort, std::vector<Value>>     mRecordings;
    std::vector<RejectedResp>                              mRejections;
    std::unique_ptr<Runtime>                               mCloned;
    uint64_t                                               mLastStep = 0;
};
