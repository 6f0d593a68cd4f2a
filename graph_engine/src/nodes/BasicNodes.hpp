// BasicNodes.hpp — stock node implementations
//
// A small set of nodes shipped with the engine so that patches and tests
// have something to run. Each is a black box behind the Node interface; the
// runtime never depends on any of them.
//
//   Constant           value                          → value
//   Gain               sig 0 × sig 1                  → product
//   Add                Σ sig i  (variable arity)      → sum
//   Delay              sig, time (s), feedback (0–1)  → delayed signal
//   SineOscillator     freq (Hz)                      → sin(phase)
//   ExternInputReader  (no inputs)                    → front of a named
//                                                       extern-input queue
//
// DEFAULTS:
// Every float input is backed by a RealInput shared with the control side,
// so a disconnected input falls back to a value the UI or a patch file can
// change while audio runs.

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../ExternInputs.hpp"
#include "../Node.hpp"

// ─────────────────────────────────────────────────────────────────────────────
// Constant
// ─────────────────────────────────────────────────────────────────────────────

class ConstantNode : public Node {
public:
    explicit ConstantNode(float value = 0.0f);

    const char* typeName() const override { return "Constant"; }
    std::unique_ptr<Node> clone() const override;

    std::vector<NodeEvent> feed(const ExternInputs& externInputs,
                                const std::vector<Value>& data) override;
    void read(std::vector<Value>& out) const override;
    std::vector<Input> inputs() const override;
    size_t outputCount() const override { return 1; }

    std::shared_ptr<RealInput> value() const { return mValue; }

private:
    std::shared_ptr<RealInput> mValue;
    float mOut = 0.0f;
};

// ─────────────────────────────────────────────────────────────────────────────
// Gain
// ─────────────────────────────────────────────────────────────────────────────
// A disconnected "sig 0" reads its default (0.0), so an unpatched Gain
// outputs silence rather than the bare multiplier.

class GainNode : public Node {
public:
    explicit GainNode(float multiplier = 1.0f);

    const char* typeName() const override { return "Gain"; }
    std::unique_ptr<Node> clone() const override;

    std::vector<NodeEvent> feed(const ExternInputs& externInputs,
                                const std::vector<Value>& data) override;
    void read(std::vector<Value>& out) const override;
    std::vector<Input> inputs() const override;
    size_t outputCount() const override { return 1; }

    std::shared_ptr<RealInput> signalDefault() const { return mSignal; }
    std::shared_ptr<RealInput> multiplier() const { return mMultiplier; }

private:
    std::shared_ptr<RealInput> mSignal;
    std::shared_ptr<RealInput> mMultiplier;
    float mOut = 0.0f;
};

// ─────────────────────────────────────────────────────────────────────────────
// Add — variable arity
// ─────────────────────────────────────────────────────────────────────────────
// The input count lives in a shared AddConfig. The control thread stores a
// new count; the node notices it on its next feed, grows or shrinks its
// defaults and returns RecalcInputs so the runtime rewires it.

class AddConfig : public NodeConfig {
public:
    explicit AddConfig(uint32_t ins) : mIns(ins) {}

    uint32_t ins() const { return mIns.load(std::memory_order_acquire); }
    void setIns(uint32_t ins) { mIns.store(ins, std::memory_order_release); }

private:
    std::atomic<uint32_t> mIns;
};

class AddNode : public Node {
public:
    explicit AddNode(uint32_t ins = 2);

    const char* typeName() const override { return "Add"; }
    std::unique_ptr<Node> clone() const override;

    std::vector<NodeEvent> feed(const ExternInputs& externInputs,
                                const std::vector<Value>& data) override;
    void read(std::vector<Value>& out) const override;
    std::shared_ptr<NodeConfig> config() const override { return mConfig; }
    std::vector<Input> inputs() const override;
    size_t outputCount() const override { return 1; }

    std::shared_ptr<AddConfig> addConfig() const { return mConfig; }

private:
    std::shared_ptr<AddConfig>              mConfig;
    std::vector<std::shared_ptr<RealInput>> mDefaults;
    uint32_t mIns = 0;
    float    mOut = 0.0f;
};

// ─────────────────────────────────────────────────────────────────────────────
// Delay
// ─────────────────────────────────────────────────────────────────────────────
// Circular buffer of up to kMaxDelaySec. "time" is in seconds and is
// clamped to [1 sample, kMaxDelaySec]. "feedback" mixes the delayed output
// back into the line and is clamped to [0, 1).

class DelayNode : public Node {
public:
    static constexpr float kMaxDelaySec = 5.0f;

    DelayNode(int sampleRate, float timeSec = 0.1f, float feedback = 0.0f);

    const char* typeName() const override { return "Delay"; }
    std::unique_ptr<Node> clone() const override;

    std::vector<NodeEvent> feed(const ExternInputs& externInputs,
                                const std::vector<Value>& data) override;
    void read(std::vector<Value>& out) const override;
    std::vector<Input> inputs() const override;
    size_t outputCount() const override { return 1; }

    std::shared_ptr<RealInput> time() const { return mTime; }
    std::shared_ptr<RealInput> feedback() const { return mFeedback; }

private:
    int                        mSampleRate;
    std::shared_ptr<RealInput> mTime;
    std::shared_ptr<RealInput> mFeedback;
    std::vector<float>         mLine;       // sized once to kMaxDelaySec
    size_t                     mWritePos = 0;
    float                      mOut = 0.0f;
};

// ─────────────────────────────────────────────────────────────────────────────
// SineOscillator
// ─────────────────────────────────────────────────────────────────────────────

class SineOscillatorNode : public Node {
public:
    SineOscillatorNode(int sampleRate, float freqHz = 440.0f);

    const char* typeName() const override { return "Sine"; }
    std::unique_ptr<Node> clone() const override;

    std::vector<NodeEvent> feed(const ExternInputs& externInputs,
                                const std::vector<Value>& data) override;
    void read(std::vector<Value>& out) const override;
    std::vector<Input> inputs() const override;
    size_t outputCount() const override { return 1; }

    std::shared_ptr<RealInput> frequency() const { return mFreq; }

private:
    int                        mSampleRate;
    std::shared_ptr<RealInput> mFreq;
    double                     mPhase = 0.0;   // radians, wrapped to [0, 2π)
    float                      mOut = 0.0f;
};

// ─────────────────────────────────────────────────────────────────────────────
// ExternInputReader
// ─────────────────────────────────────────────────────────────────────────────
// Outputs the front of the named extern-input queue, or None when the queue
// is empty or not defined. The handle is looked up lazily and re-resolved
// when it stops being valid (the runtime's ExternInputs may be replaced).

class ExternInputReaderNode : public Node {
public:
    ExternInputReaderNode(std::string inputName, ValueKind kind);

    const char* typeName() const override { return "ExternInputReader"; }
    std::unique_ptr<Node> clone() const override;

    std::vector<NodeEvent> feed(const ExternInputs& externInputs,
                                const std::vector<Value>& data) override;
    void read(std::vector<Value>& out) const override;
    std::vector<Output> outputs() const override;
    size_t outputCount() const override { return 1; }

    const std::string& inputName() const { return mInputName; }

private:
    std::string                      mInputName;
    ValueKind                        mKind;
    std::optional<ExternInputHandle> mHandle;
    Value                            mOut;
};
