#include "wav_clip.hpp"
#include <cstring>
#include <fstream>
#include <stdexcept>

using namespace std;

static uint32_t readLE32(const uint8_t* p) {
    return uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) | (uint32_t(p[3]) << 24);
}

static uint16_t readLE16(const uint8_t* p) {
    return uint16_t(p[0] | (p[1] << 8));
}

WavClip loadWavFile(const string& path) {
    ifstream file(path, ios::binary);
    if (!file) {
        throw runtime_error("Could not open audio file: " + path);
    }
    vector<uint8_t> bytes((istreambuf_iterator<char>(file)), istreambuf_iterator<char>());

    if (bytes.size() < 12 || memcmp(bytes.data(), "RIFF", 4) != 0 || memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        throw runtime_error("Not a RIFF/WAVE file: " + path);
    }

    WavClip clip;
    bool haveFormat = false;
    bool haveData = false;
    uint16_t bitsPerSample = 0;

    // Walk the chunk list
    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* header = bytes.data() + pos;
        uint32_t size = readLE32(header + 4);
        size_t body = pos + 8;
        size_t available = bytes.size() - body;

        if (memcmp(header, "fmt ", 4) == 0) {
            if (size < 16 || available < 16) {
                throw runtime_error("Truncated format chunk in " + path);
            }
            const uint8_t* fmt = bytes.data() + body;
            uint16_t audioFormat = readLE16(fmt);
            clip.channels = readLE16(fmt + 2);
            clip.sampleRate = readLE32(fmt + 4);
            bitsPerSample = readLE16(fmt + 14);
            if (audioFormat != 1 || bitsPerSample != 16) {
                throw runtime_error("Only 16-bit PCM audio is supported: " + path);
            }
            if (clip.channels != 1 && clip.channels != 2) {
                throw runtime_error("Only mono or stereo audio is supported: " + path);
            }
            haveFormat = true;
        } else if (memcmp(header, "data", 4) == 0) {
            if (!haveFormat) {
                throw runtime_error("Data chunk before format chunk in " + path);
            }
            size_t length = size > available ? available : size;
            size_t frameBytes = clip.channels * sizeof(int16_t);
            length -= length % frameBytes;
            clip.samples.resize(length / sizeof(int16_t));
            const uint8_t* data = bytes.data() + body;
            for (size_t i = 0; i < clip.samples.size(); i++) {
                clip.samples[i] = static_cast<int16_t>(readLE16(data + i * 2));
            }
            haveData = true;
            break;
        }

        // Chunks are padded to an even size
        pos = body + size + (size & 1);
    }

    if (!haveFormat || !haveData) {
        throw runtime_error("Missing format or data chunk in " + path);
    }
    if (clip.samples.empty() || clip.sampleRate == 0) {
        throw runtime_error("Audio file has no samples: " + path);
    }
    return clip;
}
