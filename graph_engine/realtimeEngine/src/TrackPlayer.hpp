// TrackPlayer.hpp — streams a mono WAV file into an extern input
//
// The host-side producer for the "TrackAudio" extern input. A background
// loader thread reads the file with libsndfile in chunks and sends each
// chunk as an ExternAppendCmd through the remote's request channel, staying
// kLeadSec ahead of where the graph should be playing.
//
// RESPONSIBILITIES:
// 1. Open the WAV file and check channel count and sample rate.
// 2. Define the extern input (ExternDefineCmd) before the first append.
// 3. Run a loader thread that paces itself against the wall clock × speed.
// 4. Stop at end-of-file, or rewind when looping is on.
//
// THREADING:
// - The loader thread is the ONLY thread that touches the SNDFILE*.
// - Channel::send is thread-safe; no other state is shared.
// - mLoaderRunning: release on write (control thread), acquire on read.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <sndfile.h>

#include "Channel.hpp"
#include "Protocol.hpp"

class TrackPlayer {
public:

    static constexpr sf_count_t kChunkFrames = 1024;
    static constexpr double     kLeadSec     = 0.2;

    TrackPlayer(Channel<RtRequest>& requests, std::string inputName = "TrackAudio")
        : mRequests(requests), mInputName(std::move(inputName)) {}

    ~TrackPlayer() {
        shutdown();
    }

    TrackPlayer(const TrackPlayer&) = delete;
    TrackPlayer& operator=(const TrackPlayer&) = delete;

    /// Open a mono WAV file. Returns false (and logs) on any mismatch.
    bool open(const std::string& path, int expectedSR) {
        SF_INFO info = {};
        mFile = sf_open(path.c_str(), SFM_READ, &info);
        if (!mFile) {
            std::cerr << "[TrackPlayer] ERROR: Cannot open " << path << ": "
                      << sf_strerror(nullptr) << std::endl;
            return false;
        }
        if (info.channels != 1) {
            std::cerr << "[TrackPlayer] ERROR: " << path << " has " << info.channels
                      << " channels, expected mono." << std::endl;
            close();
            return false;
        }
        if (info.samplerate != expectedSR) {
            std::cerr << "[TrackPlayer] ERROR: " << path << " is " << info.samplerate
                      << " Hz, engine runs at " << expectedSR << " Hz." << std::endl;
            close();
            return false;
        }

        mSampleRate  = info.samplerate;
        mTotalFrames = static_cast<uint64_t>(info.frames);
        std::cout << "[TrackPlayer] Opened " << path << " (" << mTotalFrames
                  << " frames, " << static_cast<double>(mTotalFrames) / mSampleRate
                  << " s)." << std::endl;
        return true;
    }

    /// Define the extern input and start the loader thread.
    bool start(double speed = 1.0, bool loop = false) {
        if (!mFile) {
            std::cerr << "[TrackPlayer] ERROR: No file open." << std::endl;
            return false;
        }
        mSpeed = speed > 0.0 ? speed : 1.0;
        mLoop  = loop;

        if (!mRequests.send(ExternDefineCmd{mInputName, ValueKind::Float})) return false;

        mLoaderRunning.store(true, std::memory_order_release);
        mLoaderThread = std::thread([this]() { loaderWorker(); });
        std::cout << "[TrackPlayer] Loader thread started." << std::endl;
        return true;
    }

    void shutdown() {
        mLoaderRunning.store(false, std::memory_order_release);
        if (mLoaderThread.joinable()) {
            mLoaderThread.join();
        }
        close();
    }

    bool finished() const { return mFinished.load(std::memory_order_acquire); }
    uint64_t framesSent() const { return mFramesSent.load(std::memory_order_relaxed); }
    uint64_t totalFrames() const { return mTotalFrames; }

private:

    void close() {
        if (mFile) {
            sf_close(mFile);
            mFile = nullptr;
        }
    }

    void loaderWorker() {
        std::vector<float> chunk(static_cast<size_t>(kChunkFrames));
        const auto t0 = std::chrono::steady_clock::now();

        while (mLoaderRunning.load(std::memory_order_acquire)) {
            const double elapsed = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - t0).count();
            const double wanted = (elapsed * mSpeed + kLeadSec) * mSampleRate;

            while (static_cast<double>(mFramesSent.load(std::memory_order_relaxed)) < wanted) {
                const sf_count_t got = sf_readf_float(mFile, chunk.data(), kChunkFrames);
                if (got <= 0) {
                    if (mLoop && mTotalFrames > 0) {
                        sf_seek(mFile, 0, SEEK_SET);
                        continue;
                    }
                    std::cout << "[TrackPlayer] End of file." << std::endl;
                    mFinished.store(true, std::memory_order_release);
                    return;
                }

                std::vector<Value> values;
                values.reserve(static_cast<size_t>(got));
                for (sf_count_t i = 0; i < got; ++i) values.push_back(Value::fromFloat(chunk[i]));

                if (!mRequests.send(ExternAppendCmd{mInputName, std::move(values)})) {
                    std::cout << "[TrackPlayer] Command channel closed." << std::endl;
                    mFinished.store(true, std::memory_order_release);
                    return;
                }
                mFramesSent.fetch_add(static_cast<uint64_t>(got), std::memory_order_relaxed);
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    Channel<RtRequest>& mRequests;
    std::string         mInputName;

    SNDFILE*            mFile = nullptr;
    int                 mSampleRate = 44100;
    uint64_t            mTotalFrames = 0;
    double              mSpeed = 1.0;
    bool                mLoop = false;

    std::thread           mLoaderThread;
    std::atomic<bool>     mLoaderRunning{false};
    std::atomic<bool>     mFinished{false};
    std::atomic<uint64_t> mFramesSent{0};
};
