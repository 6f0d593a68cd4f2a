// WavUtils, WavFileAudioOut and TrackPlayer against real files in the temp
// directory.

#undef NDEBUG
#include <cassert>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <sndfile.h>

#include "Channel.hpp"
#include "Protocol.hpp"
#include "TrackPlayer.hpp"
#include "WavFileAudioOut.hpp"
#include "WavUtils.hpp"

namespace {

std::string tempPath(const char* name) {
    return std::string("/tmp/pulsegraph_") + name;
}

MonoWavData readBack(const std::string& path) {
    SF_INFO info = {};
    SNDFILE* snd = sf_open(path.c_str(), SFM_READ, &info);
    assert(snd);
    assert(info.channels == 1);

    MonoWavData d;
    d.sampleRate = info.samplerate;
    d.samples.resize(static_cast<size_t>(info.frames));
    assert(sf_read_float(snd, d.samples.data(), info.frames) == info.frames);
    sf_close(snd);
    return d;
}

void writeStereo(const std::string& path) {
    SF_INFO info = {};
    info.channels = 2;
    info.samplerate = 8000;
    info.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;
    SNDFILE* snd = sf_open(path.c_str(), SFM_WRITE, &info);
    assert(snd);
    const short frames[4] = {0, 0, 0, 0};
    sf_writef_short(snd, frames, 2);
    sf_close(snd);
}

void testWriteMonoWav() {
    MonoWavData wav;
    wav.sampleRate = 22050;
    for (int i = 0; i < 100; ++i) wav.samples.push_back(std::sin(0.1f * i));

    const std::string path = tempPath("mono.wav");
    WavUtils::writeMonoWav(path, wav);
    const MonoWavData back = readBack(path);
    assert(back.sampleRate == 22050);
    assert(back.samples.size() == wav.samples.size());
    assert(std::fabs(back.samples[10] - wav.samples[10]) < 1e-6f);
    std::remove(path.c_str());

    bool threw = false;
    try {
        WavUtils::writeMonoWav("/nonexistent-dir/out.wav", wav);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
}

void testFileSinkStopsAtLength() {
    const std::string path = tempPath("sink.wav");
    WavFileAudioOut sink(path, 8000, 1.0, 100);
    assert(sink.open());

    const std::vector<float> chunk(64, 0.25f);
    assert(sink.queueLen() == 0);
    assert(sink.feed(chunk));
    assert(sink.queueLen() == 64);   // not started: nothing consumed yet
    assert(sink.start());
    assert(!sink.feed(chunk));       // reaches 100 frames
    assert(sink.framesWritten() == 100);
    sink.close();

    const MonoWavData back = readBack(path);
    assert(back.samples.size() == 100);
    assert(back.samples.back() == 0.25f);
    std::remove(path.c_str());
}

void testTrackPlayerStreamsWholeFile() {
    MonoWavData wav;
    wav.sampleRate = 8000;
    for (int i = 0; i < 3000; ++i) wav.samples.push_back(static_cast<float>(i % 100) / 100.0f);
    const std::string path = tempPath("track.wav");
    WavUtils::writeMonoWav(path, wav);

    Channel<RtRequest> requests;
    TrackPlayer player(requests);
    assert(!player.start());   // nothing open
    assert(player.open(path, 8000));
    assert(player.totalFrames() == 3000);
    assert(player.start(100.0));

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!player.finished() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    assert(player.finished());
    assert(player.framesSent() == 3000);
    player.shutdown();

    // The define comes first, then the file in order.
    RtRequest req;
    assert(requests.tryRecv(req) == RecvStatus::Ok);
    auto* define = std::get_if<ExternDefineCmd>(&req);
    assert(define && define->name == "TrackAudio" && define->kind == ValueKind::Float);

    std::vector<Value> streamed;
    while (requests.tryRecv(req) == RecvStatus::Ok) {
        auto* append = std::get_if<ExternAppendCmd>(&req);
        assert(append && append->name == "TrackAudio");
        streamed.insert(streamed.end(), append->values.begin(), append->values.end());
    }
    assert(streamed.size() == 3000);
    assert(streamed[0] == Value::fromFloat(0.0f));
    assert(std::fabs(*streamed[1234].asFloat() - 0.34f) < 1e-6f);
    std::remove(path.c_str());
}

void testTrackPlayerRejectsMismatch() {
    Channel<RtRequest> requests;
    TrackPlayer player(requests);

    const std::string stereo = tempPath("stereo.wav");
    writeStereo(stereo);
    assert(!player.open(stereo, 8000));
    std::remove(stereo.c_str());

    MonoWavData wav;
    wav.sampleRate = 22050;
    wav.samples.assign(10, 0.0f);
    const std::string mono = tempPath("rate.wav");
    WavUtils::writeMonoWav(mono, wav);
    assert(!player.open(mono, 8000));
    std::remove(mono.c_str());

    assert(!player.open(tempPath("missing.wav"), 8000));
    assert(requests.size() == 0);
}

}  // namespace

int main() {
    testWriteMonoWav();
    testFileSinkStopsAtLength();
    testTrackPlayerStreamsWholeFile();
    testTrackPlayerRejectsMismatch();
    std::printf("test_wav_utils: PASS\n");
    return 0;
}
