#include "WavUtils.hpp"

#include <iostream>
#include <stdexcept>

#include <sndfile.h>

void WavUtils::writeMonoWav(const std::string& path, const MonoWavData& data) {
    SF_INFO info = {};
    info.channels   = 1;
    info.samplerate = data.sampleRate;
    info.format     = SF_FORMAT_WAV | SF_FORMAT_FLOAT;

    SNDFILE* snd = sf_open(path.c_str(), SFM_WRITE, &info);
    if (!snd) {
        std::cerr << "[Wav] Error opening file for write: " << sf_strerror(nullptr) << std::endl;
        throw std::runtime_error("Cannot create WAV file: " + path);
    }

    const sf_count_t total = static_cast<sf_count_t>(data.samples.size());
    const sf_count_t written = sf_write_float(snd, data.samples.data(), total);
    if (written != total) {
        const std::string err = sf_strerror(snd);
        sf_close(snd);
        throw std::runtime_error("Short write to " + path + ": " + err);
    }
    sf_close(snd);

    std::cout << "[Wav] Wrote " << path << ": " << total << " samples, "
              << static_cast<double>(total) / data.sampleRate << " s" << std::endl;
}
