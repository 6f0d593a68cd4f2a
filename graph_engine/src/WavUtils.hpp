#pragma once

#include <string>
#include <vector>

struct MonoWavData {
    int sampleRate = 0;
    std::vector<float> samples;
};

class WavUtils {
public:
    /// Write a mono 32-bit float WAV file. Throws std::runtime_error on
    /// failure.
    static void writeMonoWav(const std::string& path, const MonoWavData& data);
};
