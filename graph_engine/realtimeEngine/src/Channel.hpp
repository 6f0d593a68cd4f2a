// Channel.hpp — unbounded FIFO message channel between two threads
//
// Used for the command (control → worker) and response (worker → control)
// streams. Messages are moved in and out; nothing is shared after send().
//
// The worker only ever calls tryRecv() (never blocks on the channel). The
// control thread may block in recv() while waiting for a Step marker.
//
// close() wakes every blocked receiver. After close, send() drops the
// message and returns false; receivers still drain what was queued and then
// see Disconnected.

#pragma once

#include <cstdint>
#include <condition_variable>
#include <deque>
#include <mutex>

enum class RecvStatus {
    Ok,
    Empty,          // nothing queued right now
    Disconnected    // closed and drained
};

template <typename T>
class Channel {
public:

    /// Queue a message. On success `seq` (if given) receives its position in
    /// the overall send order, counting from 0.
    bool send(T message, uint64_t* seq = nullptr) {
        {
            std::lock_guard<std::mutex> lock(mMutex);
            if (mClosed) return false;
            if (seq) *seq = mSent;
            ++mSent;
            mQueue.push_back(std::move(message));
        }
        mCond.notify_one();
        return true;
    }

    /// Non-blocking receive.
    RecvStatus tryRecv(T& out) {
        std::lock_guard<std::mutex> lock(mMutex);
        return popLocked(out);
    }

    /// Block until a message arrives or the channel is closed and drained.
    RecvStatus recv(T& out) {
        std::unique_lock<std::mutex> lock(mMutex);
        mCond.wait(lock, [this] { return !mQueue.empty() || mClosed; });
        return popLocked(out);
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mMutex);
            mClosed = true;
        }
        mCond.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mClosed;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mQueue.size();
    }

private:

    RecvStatus popLocked(T& out) {
        if (!mQueue.empty()) {
            out = std::move(mQueue.front());
            mQueue.pop_front();
            return RecvStatus::Ok;
        }
        return mClosed ? RecvStatus::Disconnected : RecvStatus::Empty;
    }

    mutable std::mutex      mMutex;
    std::condition_variable mCond;
    std::deque<T>           mQueue;
    uint64_t                mSent = 0;
    bool                    mClosed = false;
};
