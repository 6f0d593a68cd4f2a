// Protocol.hpp — commands (control → worker) and responses (worker → control)
//
// Every message crosses the thread boundary by value through a Channel.
// Nodes and runtime snapshots travel as unique_ptr so ownership moves with
// the message; nothing is shared afterwards except node configs and input
// defaults, which are atomic.
//
//  ┌──────────────────────┬──────────────────────────────────────────────┐
//  │ Command              │ Response(s)                                  │
//  ├──────────────────────┼──────────────────────────────────────────────┤
//  │ InsertCmd            │ InsertedResp{id, address} | RejectedResp     │
//  │ RemoveCmd            │ RejectedResp on a stale address              │
//  │ SetInputCmd          │ RejectedResp on failure                      │
//  │ SetAllInputsCmd      │ RejectedResp on failure                      │
//  │ ExternDefineCmd      │ none                                         │
//  │ ExternAppendCmd      │ RejectedResp if the name is undefined        │
//  │ PlayCmd              │ RejectedResp if the node is not live         │
//  │ RecordCmd            │ RejectedResp if the node is not live         │
//  │ StopRecordingCmd     │ final SamplesResp for the port, if non-empty │
//  │ ReplaceRuntimeCmd    │ none                                         │
//  │ CloneRuntimeCmd      │ RuntimeClonedResp{snapshot}                  │
//  │ ShutdownCmd          │ final SamplesResp / StepResp, then close     │
//  └──────────────────────┴──────────────────────────────────────────────┘
//
// Independently of commands the worker emits NodeEventsResp after a burst
// in which nodes raised events, SamplesResp for every non-empty tap after
// each burst, and one StepResp per loop iteration.

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "Runtime.hpp"

using RequestId = uint64_t;

// ─────────────────────────────────────────────────────────────────────────────
// Commands
// ─────────────────────────────────────────────────────────────────────────────

struct CloneRuntimeCmd {};

struct InsertCmd {
    RequestId             id = 0;
    InputWiring           inputs;
    std::unique_ptr<Node> node;
};

struct RemoveCmd {
    NodeAddress address;
};

struct SetInputCmd {
    NodeAddress               dst;
    size_t                    port = 0;
    std::optional<OutputPort> src;
};

struct SetAllInputsCmd {
    NodeAddress dst;
    InputWiring inputs;
};

struct ExternDefineCmd {
    std::string name;
    ValueKind   kind = ValueKind::Float;
};

struct ExternAppendCmd {
    std::string        name;
    std::vector<Value> values;
};

struct PlayCmd {
    std::optional<OutputPort> port;   // nullopt = silence
};

struct RecordCmd {
    OutputPort port;
};

struct StopRecordingCmd {
    OutputPort port;
};

/// Swap the live graph for a snapshot. The live extern-input queues are kept.
struct ReplaceRuntimeCmd {
    std::unique_ptr<Runtime> runtime;
};

struct ShutdownCmd {};

using RtRequest = std::variant<CloneRuntimeCmd, InsertCmd, RemoveCmd, SetInputCmd,
                               SetAllInputsCmd, ExternDefineCmd, ExternAppendCmd,
                               PlayCmd, RecordCmd, StopRecordingCmd,
                               ReplaceRuntimeCmd, ShutdownCmd>;

inline const char* requestName(const RtRequest& req) {
    static const char* const kNames[] = {
        "CloneRuntime", "Insert", "Remove", "SetInput", "SetAllInputs",
        "ExternDefine", "ExternAppend", "Play", "Record", "StopRecording",
        "ReplaceRuntime", "Shutdown"
    };
    return kNames[req.index()];
}

// ─────────────────────────────────────────────────────────────────────────────
// Responses
// ─────────────────────────────────────────────────────────────────────────────

/// Synchronisation marker. One per worker loop iteration. commandsTaken
/// counts every request the worker has taken off the channel so far, so a
/// sender whose request had send sequence n knows it was applied once
/// commandsTaken > n.
struct StepResp {
    uint64_t stepCount = 0;
    uint64_t commandsTaken = 0;
};

struct InsertedResp {
    RequestId   id = 0;
    NodeAddress address;
};

struct NodeEventsResp {
    Runtime::StepEvents events;
};

struct RuntimeClonedResp {
    std::unique_ptr<Runtime> runtime;
};

struct SamplesResp {
    OutputPort         port;
    std::vector<Value> values;
};

struct RejectedResp {
    std::string                command;   // requestName() of the rejected command
    RuntimeStatus              status = RuntimeStatus::Ok;
    std::optional<NodeAddress> address;   // the address the command referred to
    std::optional<RequestId>   id;        // InsertCmd only
};

using RtResponse = std::variant<StepResp, InsertedResp, NodeEventsResp,
                                RuntimeClonedResp, SamplesResp, RejectedResp>;
