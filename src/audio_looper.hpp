#pragma once

#include "wav_clip.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <thread>

#include <alsa/asoundlib.h>

// Plays one clip on repeat until stopped
class AudioLooper {
public:
    virtual ~AudioLooper() = default;

    // Start repeating playback. Returns false if playback could not start.
    virtual bool startLoop() = 0;

    // Halt playback now. Safe to call at any time, any number of times.
    virtual void stopLoop() = 0;

    virtual bool isPlaying() const = 0;
};

class AlsaAudioLooper : public AudioLooper {
public:
    AlsaAudioLooper(const std::string& file, const std::string& device = "default");
    ~AlsaAudioLooper() override;

    bool startLoop() override;
    void stopLoop() override;
    bool isPlaying() const override { return playing; }

private:
    bool openPlayback(const WavClip& clip);
    int configureDevice(const WavClip& clip);
    void playLoop(WavClip clip);
    void closePlayback();

    std::string filePath;
    std::string deviceName;
    snd_pcm_t* playback_handle;
    std::atomic<bool> playing{false};
    std::mutex controlMutex;
    std::thread playThread;
};
