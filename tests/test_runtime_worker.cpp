// RuntimeWorker driven one iteration at a time against a fake sink whose
// queue the test drains by hand. No threads: pacing and command handling
// are checked deterministically.

#undef NDEBUG
#include <cassert>
#include <cmath>
#include <cstdio>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include "AudioOut.hpp"
#include "Channel.hpp"
#include "Protocol.hpp"
#include "RealtimeTypes.hpp"
#include "RuntimeWorker.hpp"
#include "nodes/BasicNodes.hpp"

namespace {

class FakeAudioOut : public AudioOut {
public:
    size_t queueLen() const override { return queued; }

    bool feed(const std::vector<float>& samples) override {
        if (refuse) return false;
        fed.insert(fed.end(), samples.begin(), samples.end());
        queued += samples.size();
        return true;
    }

    bool start() override {
        started = true;
        return true;
    }

    void stop() override { started = false; }

    void consume(size_t frames) { queued = frames > queued ? 0 : queued - frames; }

    size_t             queued = 0;
    bool               started = false;
    bool               refuse = false;
    std::vector<float> fed;
};

EngineConfig testConfig() {
    EngineConfig config;
    config.sampleRate           = 1000;
    config.bufferSize           = 10;
    config.fillTriggerSec       = 0.02;   // 20 frames
    config.fillTargetSec        = 0.05;   // 50 frames
    config.prefillSec           = 0.01;   // 10 frames
    config.idleSleepMs          = 0;
    config.commandsPerIteration = 1;
    return config;
}

struct Harness {
    EngineConfig        config = testConfig();
    EngineState         state;
    FakeAudioOut        out;
    Channel<RtRequest>  requests;
    Channel<RtResponse> responses;
    RuntimeWorker       worker{Runtime(), out, requests, responses, config, state};

    std::vector<RtResponse> collect() {
        std::vector<RtResponse> all;
        RtResponse r;
        while (responses.tryRecv(r) == RecvStatus::Ok) all.push_back(std::move(r));
        return all;
    }
};

template <typename T>
std::vector<T*> only(std::vector<RtResponse>& all) {
    std::vector<T*> out;
    for (auto& r : all) {
        if (T* p = std::get_if<T>(&r)) out.push_back(p);
    }
    return out;
}

void testPacing() {
    Harness h;
    assert(h.worker.prefill());
    assert(h.out.started);
    assert(h.out.queued == 10);

    // Below the trigger: one burst up to the target, in whole chunks.
    assert(h.worker.iterate());
    assert(h.out.queued == 50);
    assert(h.worker.runtime().stepCount() == 40);
    assert(h.state.framesEmitted.load() == 40);

    auto rs = h.collect();
    auto steps = only<StepResp>(rs);
    assert(steps.size() == 1);
    assert(steps[0]->stepCount == 40);
    assert(steps[0]->commandsTaken == 0);

    // Above the trigger: no stepping, still one Step marker.
    h.out.consume(25);
    assert(h.worker.iterate());
    assert(h.worker.runtime().stepCount() == 40);
    rs = h.collect();
    assert(only<StepResp>(rs).size() == 1);

    // Just under the trigger again.
    h.out.consume(10);
    assert(h.worker.iterate());
    assert(h.out.queued >= 50);
    assert(h.worker.runtime().stepCount() == 80);
    assert(h.state.xrunCount.load() == 0);

    // Sink ran dry before the burst: one xrun.
    h.out.consume(1000);
    assert(h.worker.iterate());
    assert(h.state.xrunCount.load() == 1);

    // Silence while nothing is selected for playback.
    for (float s : h.out.fed) assert(s == 0.0f);
}

void testInsertPlayRecord() {
    Harness h;
    assert(h.worker.prefill());
    assert(h.worker.iterate());
    h.collect();

    h.requests.send(InsertCmd{7, {std::nullopt}, std::make_unique<ConstantNode>(0.5f)});
    assert(h.worker.iterate());
    auto rs = h.collect();
    auto inserted = only<InsertedResp>(rs);
    assert(inserted.size() == 1);
    assert(inserted[0]->id == 7);
    const NodeAddress addr = inserted[0]->address;
    assert(h.worker.runtime().contains(addr));
    assert(only<StepResp>(rs).back()->commandsTaken == 1);

    h.requests.send(PlayCmd{OutputPort(addr, 0)});
    assert(h.worker.iterate());
    h.requests.send(RecordCmd{OutputPort(addr, 0)});
    assert(h.worker.iterate());
    assert(h.worker.playPort() && *h.worker.playPort() == OutputPort(addr, 0));
    assert(h.worker.isRecording(OutputPort(addr, 0)));
    h.collect();

    h.out.fed.clear();
    h.out.consume(1000);
    assert(h.worker.iterate());
    assert(!h.out.fed.empty());
    for (float s : h.out.fed) assert(std::fabs(s - 0.5f) < 1e-6f);

    rs = h.collect();
    auto samples = only<SamplesResp>(rs);
    assert(samples.size() == 1);
    assert(samples[0]->port == OutputPort(addr, 0));
    assert(samples[0]->values.size() == h.out.fed.size());
    assert(samples[0]->values.front() == Value::fromFloat(0.5f));

    // Stopping ships nothing new (the tap was emptied after the burst).
    h.requests.send(StopRecordingCmd{OutputPort(addr, 0)});
    assert(h.worker.iterate());
    assert(!h.worker.isRecording(OutputPort(addr, 0)));

    // Removing the played node falls back to silence.
    h.requests.send(RemoveCmd{addr});
    assert(h.worker.iterate());
    assert(!h.worker.playPort());
    assert(h.state.numNodes.load() == 0);
}

void testRejections() {
    Harness h;
    assert(h.worker.prefill());

    // Wrong arity: rejected with the request id.
    h.requests.send(InsertCmd{3, {}, std::make_unique<GainNode>()});
    assert(h.worker.iterate());
    auto rs = h.collect();
    auto rejected = only<RejectedResp>(rs);
    assert(rejected.size() == 1);
    assert(rejected[0]->command == "Insert");
    assert(rejected[0]->status == RuntimeStatus::ArityMismatch);
    assert(rejected[0]->id && *rejected[0]->id == 3);
    assert(h.worker.runtime().size() == 0);

    const NodeAddress stale{4, 1};
    h.requests.send(RemoveCmd{stale});
    assert(h.worker.iterate());
    rs = h.collect();
    rejected = only<RejectedResp>(rs);
    assert(rejected.size() == 1);
    assert(rejected[0]->status == RuntimeStatus::AddressNotFound);
    assert(rejected[0]->address && *rejected[0]->address == stale);

    h.requests.send(SetInputCmd{stale, 0, std::nullopt});
    assert(h.worker.iterate());
    h.requests.send(PlayCmd{OutputPort(stale, 0)});
    assert(h.worker.iterate());
    h.requests.send(ExternAppendCmd{"Nowhere", {Value::fromFloat(1.0f)}});
    assert(h.worker.iterate());
    rs = h.collect();
    rejected = only<RejectedResp>(rs);
    assert(rejected.size() == 3);
    assert(rejected[0]->command == "SetInput");
    assert(rejected[1]->command == "Play");
    assert(rejected[2]->status == RuntimeStatus::UnknownExternInput);
    assert(!h.worker.playPort());

    assert(h.state.commandsRejected.load() == 5);
    assert(h.state.commandsApplied.load() == 0);

    // Wiring to an output the source does not have.
    h.requests.send(InsertCmd{8, {std::nullopt}, std::make_unique<ConstantNode>(1.0f)});
    assert(h.worker.iterate());
    rs = h.collect();
    const NodeAddress one = only<InsertedResp>(rs)[0]->address;

    h.requests.send(InsertCmd{9, {OutputPort(one, 5), std::nullopt}, std::make_unique<GainNode>()});
    assert(h.worker.iterate());
    h.requests.send(SetAllInputsCmd{one, {OutputPort(one, 5)}});
    assert(h.worker.iterate());
    rs = h.collect();
    rejected = only<RejectedResp>(rs);
    assert(rejected.size() == 2);
    assert(rejected[0]->command == "Insert");
    assert(rejected[0]->status == RuntimeStatus::PortOutOfRange);
    assert(rejected[0]->id && *rejected[0]->id == 9);
    assert(rejected[1]->command == "SetAllInputs");
    assert(rejected[1]->status == RuntimeStatus::PortOutOfRange);
    assert(h.worker.runtime().size() == 1);
    assert(!(*h.worker.runtime().inputsOf(one))[0]);

    assert(h.state.commandsRejected.load() == 7);
    assert(h.state.commandsApplied.load() == 1);
}

void testBurstRunsBeforeQueuedCommand() {
    Harness h;
    assert(h.worker.prefill());
    h.requests.send(InsertCmd{1, {std::nullopt}, std::make_unique<ConstantNode>(1.0f)});
    assert(h.worker.iterate());
    auto rs = h.collect();
    const NodeAddress one = only<InsertedResp>(rs)[0]->address;
    assert(h.worker.runtime().stepCount() == 40);

    // The sink runs dry with a Play already queued: the whole burst is
    // rendered first (silence), then the command is applied.
    h.out.consume(1000);
    h.out.fed.clear();
    h.requests.send(PlayCmd{OutputPort(one, 0)});
    assert(h.worker.iterate());
    assert(h.worker.runtime().stepCount() == 90);
    assert(h.out.fed.size() == 50);
    for (float s : h.out.fed) assert(s == 0.0f);
    assert(h.worker.playPort() && *h.worker.playPort() == OutputPort(one, 0));
    rs = h.collect();
    assert(only<StepResp>(rs).back()->stepCount == 90);

    h.out.consume(1000);
    h.out.fed.clear();
    assert(h.worker.iterate());
    assert(!h.out.fed.empty());
    for (float s : h.out.fed) assert(s == 1.0f);
}

void testExternAppendsDoNotCountTowardsLimit() {
    Harness h;
    assert(h.worker.prefill());
    h.requests.send(ExternDefineCmd{"TrackAudio", ValueKind::Float});
    assert(h.worker.iterate());
    assert(h.out.queued == 50);   // no further bursts below

    for (int i = 0; i < 20; ++i) {
        h.requests.send(ExternAppendCmd{"TrackAudio", std::vector<Value>(8, Value::fromFloat(1.0f))});
    }
    h.requests.send(InsertCmd{1, {std::nullopt}, std::make_unique<ConstantNode>(1.0f)});
    h.requests.send(ExternAppendCmd{"TrackAudio", std::vector<Value>(8, Value::fromFloat(1.0f))});

    // Every queued append and one graph command in a single iteration.
    assert(h.worker.iterate());
    assert(h.worker.commandsTaken() == 22);
    assert(h.requests.size() == 1);
    assert(h.worker.runtime().size() == 1);
    auto handle = h.worker.runtime().externInputs().get("TrackAudio");
    assert(handle && h.worker.runtime().externInputs().queueLength(*handle) == 160);

    assert(h.worker.iterate());
    assert(h.requests.size() == 0);
    assert(h.worker.runtime().externInputs().queueLength(*handle) == 168);
}

void testOneCommandPerIteration() {
    Harness h;
    assert(h.worker.prefill());
    h.requests.send(ExternDefineCmd{"TrackAudio", ValueKind::Float});
    h.requests.send(ExternAppendCmd{"TrackAudio", {Value::fromFloat(1.0f)}});

    assert(h.worker.iterate());
    assert(h.worker.commandsTaken() == 1);
    assert(h.requests.size() == 1);
    assert(h.worker.iterate());
    assert(h.worker.commandsTaken() == 2);

    auto handle = h.worker.runtime().externInputs().get("TrackAudio");
    assert(handle);
    assert(h.worker.runtime().externInputs().queueLength(*handle) == 1);
}

void testCloneAndReplace() {
    Harness h;
    assert(h.worker.prefill());
    h.requests.send(ExternDefineCmd{"TrackAudio", ValueKind::Float});
    assert(h.worker.iterate());
    h.requests.send(InsertCmd{1, {}, std::make_unique<ExternInputReaderNode>("TrackAudio", ValueKind::Float)});
    assert(h.worker.iterate());
    auto rs = h.collect();
    const NodeAddress reader = only<InsertedResp>(rs)[0]->address;

    h.requests.send(CloneRuntimeCmd{});
    assert(h.worker.iterate());
    rs = h.collect();
    auto cloned = only<RuntimeClonedResp>(rs);
    assert(cloned.size() == 1);
    std::unique_ptr<Runtime> snapshot = std::move(cloned[0]->runtime);
    assert(snapshot && snapshot->contains(reader));

    // Play the reader, queue audio, then restore an empty graph: the play
    // port is dropped and the queued audio survives.
    h.requests.send(PlayCmd{OutputPort(reader, 0)});
    assert(h.worker.iterate());
    h.requests.send(ExternAppendCmd{"TrackAudio", {Value::fromFloat(0.25f), Value::fromFloat(0.25f)}});
    assert(h.worker.iterate());

    h.requests.send(ReplaceRuntimeCmd{std::make_unique<Runtime>()});
    assert(h.worker.iterate());
    assert(h.worker.runtime().stepCount() == 40);
    assert(h.worker.runtime().size() == 0);
    assert(!h.worker.playPort());
    auto handle = h.worker.runtime().externInputs().get("TrackAudio");
    assert(handle && h.worker.runtime().externInputs().queueLength(*handle) == 2);

    // Put the snapshot back after a burst, so the live graph is ahead of
    // it: the reader is live again under its old address.
    h.out.consume(1000);
    h.requests.send(ReplaceRuntimeCmd{std::move(snapshot)});
    assert(h.worker.iterate());
    assert(h.worker.runtime().contains(reader));

    // Step counts never go backwards across a restore.
    assert(h.worker.runtime().stepCount() == 90);
    assert(h.state.stepCount.load() == 90);
    rs = h.collect();
    assert(only<StepResp>(rs).back()->stepCount == 90);
}

void testShutdownAndSinkFailure() {
    {
        Harness h;
        assert(h.worker.prefill());
        h.requests.send(ShutdownCmd{});
        assert(!h.worker.iterate());
        h.worker.finish();
        assert(h.responses.closed());
        assert(!h.requests.send(ShutdownCmd{}));
        assert(!h.state.running.load());

        auto rs = h.collect();
        assert(!rs.empty() && std::holds_alternative<StepResp>(rs.back()));
        RtResponse r;
        assert(h.responses.tryRecv(r) == RecvStatus::Disconnected);
    }
    {
        Harness h;
        assert(h.worker.prefill());
        h.out.refuse = true;
        h.out.consume(1000);
        assert(!h.worker.iterate());
    }
    {
        Harness h;
        assert(h.worker.prefill());
        h.config.shouldExit.store(true);
        assert(!h.worker.iterate());
    }
}

}  // namespace

int main() {
    testPacing();
    testInsertPlayRecord();
    testRejections();
    testBurstRunsBeforeQueuedCommand();
    testOneCommandPerIteration();
    testExternAppendsDoNotCountTowardsLimit();
    testCloneAndReplace();
    testShutdownAndSinkFailure();
    std::printf("test_runtime_worker: PASS\n");
    return 0;
}
