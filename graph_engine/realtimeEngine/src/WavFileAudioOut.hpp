// WavFileAudioOut.hpp — AudioOut sink that writes a mono WAV file
//
// Used by the offline renderer. The file "consumes" audio at speed × the
// sample rate of wall-clock time, so the worker paces exactly as it would
// against a device and the control thread can still send commands (extern
// input from TrackPlayer, live rewiring) while the render runs.
//
//   queueLen() = framesWritten − elapsedSec × sampleRate × speed   (≥ 0)
//
// feed() returns false once maxFrames have been written (the render is
// complete) or libsndfile reports a short write. Either stops the worker.

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include <sndfile.h>

#include "AudioOut.hpp"

class WavFileAudioOut : public AudioOut {
public:

    /// maxFrames == 0 means no length limit (stop via shutdown only).
    WavFileAudioOut(std::string path, int sampleRate, double speed, uint64_t maxFrames)
        : mPath(std::move(path)),
          mSampleRate(std::max(1, sampleRate)),
          mSpeed(speed > 0.0 ? speed : 1.0),
          mMaxFrames(maxFrames) {}

    ~WavFileAudioOut() override {
        close();
    }

    /// Create the output file. Must be called before the worker prefills.
    bool open() {
        SF_INFO info = {};
        info.channels   = 1;
        info.samplerate = mSampleRate;
        info.format     = SF_FORMAT_WAV | SF_FORMAT_FLOAT;

        mFile = sf_open(mPath.c_str(), SFM_WRITE, &info);
        if (!mFile) {
            std::cerr << "[AudioOut] ERROR: Cannot create WAV file " << mPath
                      << ": " << sf_strerror(nullptr) << std::endl;
            return false;
        }
        std::cout << "[AudioOut] Writing " << mPath << " (" << mSampleRate
                  << " Hz mono, speed x" << mSpeed << ")" << std::endl;
        return true;
    }

    bool start() override {
        if (!mFile) {
            std::cerr << "[AudioOut] ERROR: Cannot start, file not open." << std::endl;
            return false;
        }
        mStart = std::chrono::steady_clock::now();
        mStarted = true;
        return true;
    }

    void stop() override { close(); }

    void close() {
        if (mFile) {
            sf_close(mFile);
            mFile = nullptr;
            std::cout << "[AudioOut] Closed " << mPath << " after "
                      << mFramesWritten << " frames." << std::endl;
        }
    }

    size_t queueLen() const override {
        if (!mStarted) return static_cast<size_t>(mFramesWritten);
        const double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - mStart).count();
        const double consumed = elapsed * mSampleRate * mSpeed;
        const double pending  = static_cast<double>(mFramesWritten) - consumed;
        return pending > 0.0 ? static_cast<size_t>(pending) : 0;
    }

    bool feed(const std::vector<float>& samples) override {
        if (!mFile) return false;

        sf_count_t n = static_cast<sf_count_t>(samples.size());
        if (mMaxFrames > 0) {
            const uint64_t room = mMaxFrames > mFramesWritten ? mMaxFrames - mFramesWritten : 0;
            n = std::min<sf_count_t>(n, static_cast<sf_count_t>(room));
        }

        if (n > 0) {
            const sf_count_t written = sf_write_float(mFile, samples.data(), n);
            mFramesWritten += static_cast<uint64_t>(std::max<sf_count_t>(written, 0));
            if (written != n) {
                std::cerr << "[AudioOut] ERROR: Short write to " << mPath << ": "
                          << sf_strerror(mFile) << std::endl;
                return false;
            }
        }

        return mMaxFrames == 0 || mFramesWritten < mMaxFrames;
    }

    uint64_t framesWritten() const { return mFramesWritten; }

private:
    std::string mPath;
    int         mSampleRate;
    double      mSpeed;
    uint64_t    mMaxFrames;

    SNDFILE*    mFile = nullptr;
    uint64_t    mFramesWritten = 0;
    bool        mStarted = false;
    std::chrono::steady_clock::time_point mStart;
};
