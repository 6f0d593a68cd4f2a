// AlloAudioOut.hpp — AudioOut sink backed by an AlloLib AudioIO device
//
// The worker thread feeds mono samples into a SampleRing; the AlloLib device
// callback drains the ring and copies each sample to every output channel.
// This is the ONLY file that touches al::AudioIO.
//
// RESPONSIBILITIES:
// 1. Initialize the audio device from EngineConfig (sample rate, buffer
//    size) with the requested output channel count.
// 2. Register the static device callback.
// 3. Start / stop / close the stream.
// 4. Count device underruns (ring ran dry mid-block).
//
// REAL-TIME CONTRACT (device callback):
// - No allocation, no locks, no I/O. The scratch block is sized in init()
//   to the device's actual buffer size.
// - masterGain is read ONCE per block (relaxed).
//
// REFERENCE: AlloLib AudioIO API (al/io/al_AudioIO.hpp)
//   AudioIO::init(callback, userData, framesPerBuf, framesPerSec, outChans, inChans)
//   AudioIO::open() / start() / stop() / close()
//   AudioIOData::out(chan, frame), framesPerBuffer(), channelsOut()

#pragma once

#include <algorithm>
#include <atomic>
#include <cstring>
#include <iostream>
#include <vector>

#include "al/io/al_AudioIO.hpp"

#include "AudioOut.hpp"
#include "RealtimeTypes.hpp"
#include "SampleRing.hpp"

class AlloAudioOut : public AudioOut {
public:

    // Ring holds this many seconds; the worker never fills past
    // fillTargetSec, so this only has to exceed it.
    static constexpr double kRingSeconds = 1.0;

    AlloAudioOut(const EngineConfig& config, int outputChannels)
        : mConfig(config),
          mOutputChannels(std::max(1, outputChannels)),
          mRing(static_cast<size_t>(kRingSeconds * config.sampleRate)) {}

    ~AlloAudioOut() override {
        shutdown();
    }

    // ── Lifecycle ────────────────────────────────────────────────────────

    /// Open the audio device. Must be called before the worker prefills.
    bool init() {
        std::cout << "[AudioOut] Initializing audio device..." << std::endl;
        std::cout << "  Sample rate:      " << mConfig.sampleRate << " Hz" << std::endl;
        std::cout << "  Buffer size:      " << mConfig.bufferSize << " frames" << std::endl;
        std::cout << "  Output channels:  " << mOutputChannels << std::endl;

        mAudioIO.init(
            audioCallback,
            this,
            mConfig.bufferSize,
            static_cast<double>(mConfig.sampleRate),
            mOutputChannels,
            0
        );

        if (!mAudioIO.open()) {
            std::cerr << "[AudioOut] ERROR: Failed to open audio device." << std::endl;
            return false;
        }

        mScratch.assign(std::max<size_t>(mAudioIO.framesPerBuffer(), mConfig.bufferSize), 0.0f);
        mInitialized = true;

        std::cout << "[AudioOut] Audio device opened." << std::endl;
        std::cout << "  Actual output channels: " << mAudioIO.channelsOut() << std::endl;
        std::cout << "  Actual buffer size:     " << mAudioIO.framesPerBuffer() << std::endl;
        return true;
    }

    bool start() override {
        if (!mInitialized) {
            std::cerr << "[AudioOut] ERROR: Cannot start, device not initialized." << std::endl;
            return false;
        }
        if (!mAudioIO.start()) {
            std::cerr << "[AudioOut] ERROR: Failed to start audio stream." << std::endl;
            return false;
        }
        std::cout << "[AudioOut] Audio stream started." << std::endl;
        return true;
    }

    void stop() override {
        if (mAudioIO.isRunning()) {
            mAudioIO.stop();
            std::cout << "[AudioOut] Audio stream stopped." << std::endl;
        }
    }

    void shutdown() {
        stop();
        if (mInitialized) {
            mAudioIO.close();
            mInitialized = false;
            std::cout << "[AudioOut] Audio device closed." << std::endl;
        }
    }

    // ── AudioOut (worker thread) ─────────────────────────────────────────

    size_t queueLen() const override { return mRing.size(); }

    bool feed(const std::vector<float>& samples) override {
        if (!mInitialized) return false;
        const size_t written = mRing.write(samples.data(), samples.size());
        if (written < samples.size()) {
            mDropped.fetch_add(samples.size() - written, std::memory_order_relaxed);
        }
        return true;
    }

    // ── Status ───────────────────────────────────────────────────────────

    void setMasterGain(float gain) { mMasterGain.store(gain, std::memory_order_relaxed); }
    float masterGain() const { return mMasterGain.load(std::memory_order_relaxed); }

    uint64_t underruns() const { return mUnderruns.load(std::memory_order_relaxed); }
    uint64_t droppedFrames() const { return mDropped.load(std::memory_order_relaxed); }
    double cpuLoad() const { return mAudioIO.cpu(); }

private:

    static void audioCallback(al::AudioIOData& io) {
        AlloAudioOut* self = static_cast<AlloAudioOut*>(io.user());
        if (self) {
            self->processBlock(io);
        }
    }

    // DEVICE thread.
    void processBlock(al::AudioIOData& io) {
        const size_t numFrames   = static_cast<size_t>(io.framesPerBuffer());
        const int    numChannels = static_cast<int>(io.channelsOut());
        const float  gain        = mMasterGain.load(std::memory_order_relaxed);

        const size_t want = std::min(numFrames, mScratch.size());
        const size_t got  = mRing.read(mScratch.data(), want);
        if (got < numFrames) {
            mUnderruns.fetch_add(1, std::memory_order_relaxed);
        }

        for (size_t f = 0; f < numFrames; ++f) {
            const float s = f < got ? mScratch[f] * gain : 0.0f;
            for (int ch = 0; ch < numChannels; ++ch) {
                io.out(ch, static_cast<int>(f)) = s;
            }
        }
    }

    const EngineConfig&   mConfig;
    int                   mOutputChannels;
    al::AudioIO           mAudioIO;
    bool                  mInitialized = false;

    SampleRing            mRing;
    std::vector<float>    mScratch;          // device-thread only
    std::atomic<float>    mMasterGain{0.5f};
    std::atomic<uint64_t> mUnderruns{0};
    std::atomic<uint64_t> mDropped{0};
};
