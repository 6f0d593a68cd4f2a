#include "BasicNodes.hpp"

#include <algorithm>
#include <cmath>

namespace {
constexpr double kTwoPi = 6.283185307179586;
}

// ─────────────────────────────────────────────────────────────────────────────
// Constant
// ─────────────────────────────────────────────────────────────────────────────

ConstantNode::ConstantNode(float value)
    : mValue(std::make_shared<RealInput>(value)), mOut(value) {}

std::unique_ptr<Node> ConstantNode::clone() const {
    return std::make_unique<ConstantNode>(*this);
}

std::vector<NodeEvent> ConstantNode::feed(const ExternInputs&, const std::vector<Value>& data) {
    mOut = data.empty() ? mValue->value() : mValue->get(data[0]);
    return {};
}

void ConstantNode::read(std::vector<Value>& out) const {
    out[0] = Value::fromFloat(mOut);
}

std::vector<Input> ConstantNode::inputs() const {
    return {Input::stateful("value", mValue)};
}

// ─────────────────────────────────────────────────────────────────────────────
// Gain
// ─────────────────────────────────────────────────────────────────────────────

GainNode::GainNode(float multiplier)
    : mSignal(std::make_shared<RealInput>(0.0f)),
      mMultiplier(std::make_shared<RealInput>(multiplier)) {}

std::unique_ptr<Node> GainNode::clone() const {
    return std::make_unique<GainNode>(*this);
}

std::vector<NodeEvent> GainNode::feed(const ExternInputs&, const std::vector<Value>& data) {
    const float sig  = data.size() > 0 ? mSignal->get(data[0]) : mSignal->value();
    const float mult = data.size() > 1 ? mMultiplier->get(data[1]) : mMultiplier->value();
    mOut = sig * mult;
    return {};
}

void GainNode::read(std::vector<Value>& out) const {
    out[0] = Value::fromFloat(mOut);
}

std::vector<Input> GainNode::inputs() const {
    return {Input::stateful("sig 0", mSignal), Input::stateful("sig 1", mMultiplier)};
}

// ─────────────────────────────────────────────────────────────────────────────
// Add
// ─────────────────────────────────────────────────────────────────────────────

AddNode::AddNode(uint32_t ins)
    : mConfig(std::make_shared<AddConfig>(ins)), mIns(ins) {
    for (uint32_t i = 0; i < ins; ++i) mDefaults.push_back(std::make_shared<RealInput>(0.0f));
}

std::unique_ptr<Node> AddNode::clone() const {
    return std::make_unique<AddNode>(*this);
}

std::vector<NodeEvent> AddNode::feed(const ExternInputs&, const std::vector<Value>& data) {
    float sum = 0.0f;
    const size_t n = std::min(data.size(), mDefaults.size());
    for (size_t i = 0; i < n; ++i) sum += mDefaults[i]->get(data[i]);
    mOut = sum;

    const uint32_t wanted = mConfig->ins();
    if (wanted == mIns) return {};

    // Arity change: the only allocation this node does on the audio thread.
    mIns = wanted;
    if (mDefaults.size() > mIns) {
        mDefaults.resize(mIns);
    } else {
        while (mDefaults.size() < mIns) mDefaults.push_back(std::make_shared<RealInput>(0.0f));
    }

    std::vector<NodeEvent> events;
    events.push_back(NodeEvent::recalcInputs(inputs()));
    return events;
}

void AddNode::read(std::vector<Value>& out) const {
    out[0] = Value::fromFloat(mOut);
}

std::vector<Input> AddNode::inputs() const {
    std::vector<Input> ins;
    ins.reserve(mDefaults.size());
    for (size_t i = 0; i < mDefaults.size(); ++i) {
        ins.push_back(Input::stateful("sig " + std::to_string(i), mDefaults[i]));
    }
    return ins;
}

// ─────────────────────────────────────────────────────────────────────────────
// Delay
// ─────────────────────────────────────────────────────────────────────────────

DelayNode::DelayNode(int sampleRate, float timeSec, float feedback)
    : mSampleRate(std::max(1, sampleRate)),
      mTime(std::make_shared<RealInput>(timeSec)),
      mFeedback(std::make_shared<RealInput>(feedback)),
      mLine(static_cast<size_t>(kMaxDelaySec * static_cast<float>(std::max(1, sampleRate))) + 1,
            0.0f) {}

std::unique_ptr<Node> DelayNode::clone() const {
    return std::make_unique<DelayNode>(*this);
}

std::vector<NodeEvent> DelayNode::feed(const ExternInputs&, const std::vector<Value>& data) {
    const float in       = data.size() > 0 ? data[0].asFloat().value_or(0.0f) : 0.0f;
    const float timeSec  = data.size() > 1 ? mTime->get(data[1]) : mTime->value();
    float       feedback = data.size() > 2 ? mFeedback->get(data[2]) : mFeedback->value();
    feedback = std::clamp(feedback, 0.0f, 0.999f);

    const size_t maxDelay = mLine.size() - 1;
    long delay = std::lround(static_cast<double>(timeSec) * mSampleRate);
    delay = std::clamp<long>(delay, 1, static_cast<long>(maxDelay));

    const size_t readPos = (mWritePos + mLine.size() - static_cast<size_t>(delay)) % mLine.size();
    const float delayed = mLine[readPos];

    mLine[mWritePos] = in + feedback * delayed;
    mWritePos = (mWritePos + 1) % mLine.size();
    mOut = delayed;
    return {};
}

void DelayNode::read(std::vector<Value>& out) const {
    out[0] = Value::fromFloat(mOut);
}

std::vector<Input> DelayNode::inputs() const {
    return {Input("sig", ValueKind::Float),
            Input::stateful("time", mTime),
            Input::stateful("feedback", mFeedback)};
}

// ─────────────────────────────────────────────────────────────────────────────
// SineOscillator
// ─────────────────────────────────────────────────────────────────────────────

SineOscillatorNode::SineOscillatorNode(int sampleRate, float freqHz)
    : mSampleRate(std::max(1, sampleRate)),
      mFreq(std::make_shared<RealInput>(freqHz)) {}

std::unique_ptr<Node> SineOscillatorNode::clone() const {
    return std::make_unique<SineOscillatorNode>(*this);
}

std::vector<NodeEvent> SineOscillatorNode::feed(const ExternInputs&, const std::vector<Value>& data) {
    const float freq = data.empty() ? mFreq->value() : mFreq->get(data[0]);

    mOut = static_cast<float>(std::sin(mPhase));
    mPhase += kTwoPi * static_cast<double>(freq) / mSampleRate;
    mPhase = std::fmod(mPhase, kTwoPi);
    if (mPhase < 0.0) mPhase += kTwoPi;
    return {};
}

void SineOscillatorNode::read(std::vector<Value>& out) const {
    out[0] = Value::fromFloat(mOut);
}

std::vector<Input> SineOscillatorNode::inputs() const {
    return {Input::stateful("freq", mFreq)};
}

// ─────────────────────────────────────────────────────────────────────────────
// ExternInputReader
// ─────────────────────────────────────────────────────────────────────────────

ExternInputReaderNode::ExternInputReaderNode(std::string inputName, ValueKind kind)
    : mInputName(std::move(inputName)), mKind(kind) {}

std::unique_ptr<Node> ExternInputReaderNode::clone() const {
    auto copy = std::make_unique<ExternInputReaderNode>(*this);
    copy->mHandle.reset();
    return copy;
}

std::vector<NodeEvent> ExternInputReaderNode::feed(const ExternInputs& externInputs,
                                                   const std::vector<Value>&) {
    if (mHandle) {
        const std::string* name = externInputs.name(*mHandle);
        if (!name || *name != mInputName) mHandle.reset();
    }
    if (!mHandle) mHandle = externInputs.get(mInputName);

    const Value* front = mHandle ? externInputs.read(*mHandle) : nullptr;
    mOut = front ? *front : Value::none();
    return {};
}

void ExternInputReaderNode::read(std::vector<Value>& out) const {
    out[0] = mOut;
}

std::vector<Output> ExternInputReaderNode::outputs() const {
    return {Output(mInputName, mKind)};
}
