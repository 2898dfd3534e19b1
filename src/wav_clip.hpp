#pragma once

#include <cstdint>
#include <string>
#include <vector>

// 16-bit PCM audio, interleaved
struct WavClip {
    unsigned int sampleRate = 0;
    unsigned int channels = 0;
    std::vector<int16_t> samples;

    size_t frameCount() const { return channels ? samples.size() / channels : 0; }
};

// Load a RIFF/WAVE file holding 16-bit little-endian PCM with 1 or 2 channels.
// Throws std::runtime_error describing what is wrong with the file.
WavClip loadWavFile(const std::string& path);
