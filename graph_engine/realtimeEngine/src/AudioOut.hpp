// AudioOut.hpp — the sink interface the worker feeds
//
// A sink buffers mono float samples for some consumer (an audio device, a
// WAV file paced against the wall clock, a test double). The worker uses
// queueLen() as its only clock: it steps the graph while the sink holds
// less than EngineConfig::fillTriggerSec of audio and stops once it holds
// fillTargetSec.

#pragma once

#include <cstddef>
#include <vector>

class AudioOut {
public:
    virtual ~AudioOut() = default;

    /// Frames currently buffered and not yet consumed.
    virtual size_t queueLen() const = 0;

    /// Append samples. Returns false when the sink can take no more audio
    /// (device lost, file write error, render length reached); the worker
    /// stops on false.
    virtual bool feed(const std::vector<float>& samples) = 0;

    /// Begin consuming. Called once, after the prefill.
    virtual bool start() = 0;

    /// Stop consuming. Safe to call more than once.
    virtual void stop() {}
};
