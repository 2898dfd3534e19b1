#include "audio_looper.hpp"
#include "logger.hpp"
#include <algorithm>
#include <filesystem>
#include <stdexcept>

using namespace std;

// Frames written per call. Small so a stop is noticed quickly.
static const snd_pcm_uframes_t PERIOD_FRAMES = 1024;

AlsaAudioLooper::AlsaAudioLooper(const string& file, const string& device)
    : filePath(file), deviceName(device), playback_handle(nullptr) {}

AlsaAudioLooper::~AlsaAudioLooper() {
    stopLoop();
}

bool AlsaAudioLooper::startLoop() {
    lock_guard<mutex> lock(controlMutex);
    if (playing) {
        return true;
    }

    // A previous playback thread may have ended on its own after an error
    if (playThread.joinable()) {
        playThread.join();
    }
    closePlayback();

    if (!filesystem::exists(filePath)) {
        LOG_ERROR("Audio file not found: " + filePath);
        return false;
    }

    WavClip clip;
    try {
        clip = loadWavFile(filePath);
    } catch (const exception& e) {
        LOG_ERROR(string("Audio load error: ") + e.what());
        return false;
    }

    if (!openPlayback(clip)) {
        closePlayback();
        return false;
    }

    playing = true;
    playThread = thread(&AlsaAudioLooper::playLoop, this, move(clip));
    LOG_INFO("Audio alert loop started: " + filePath);
    return true;
}

void AlsaAudioLooper::stopLoop() {
    lock_guard<mutex> lock(controlMutex);
    bool wasPlaying = playing.exchange(false);

    // Discard queued frames so the sound stops immediately
    if (playback_handle) {
        snd_pcm_drop(playback_handle);
    }
    if (playThread.joinable()) {
        playThread.join();
    }
    closePlayback();

    if (wasPlaying) {
        LOG_INFO("Audio alert loop stopped");
    }
}

bool AlsaAudioLooper::openPlayback(const WavClip& clip) {
    // Non-blocking open so a device held by another process fails straight away
    int err = snd_pcm_open(&playback_handle, deviceName.c_str(), SND_PCM_STREAM_PLAYBACK, SND_PCM_NONBLOCK);
    if (err < 0) {
        LOG_ERROR("Failed to open ALSA playback device " + deviceName + ": " + snd_strerror(err));
        playback_handle = nullptr;
        return false;
    }
    err = configureDevice(clip);
    if (err < 0) {
        LOG_ERROR(string("Failed to configure ALSA playback device: ") + snd_strerror(err));
        return false;
    }

    // Writes block from here on, one period at a time
    err = snd_pcm_nonblock(playback_handle, 0);
    if (err < 0) {
        LOG_ERROR(string("Failed to set ALSA blocking mode: ") + snd_strerror(err));
        return false;
    }
    return true;
}

int AlsaAudioLooper::configureDevice(const WavClip& clip) {
    snd_pcm_hw_params_t* hw_params;
    snd_pcm_hw_params_alloca(&hw_params);
    int err;
    if ((err = snd_pcm_hw_params_any(playback_handle, hw_params)) < 0) return err;
    if ((err = snd_pcm_hw_params_set_access(playback_handle, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED)) < 0) return err;
    if ((err = snd_pcm_hw_params_set_format(playback_handle, hw_params, SND_PCM_FORMAT_S16_LE)) < 0) return err;
    unsigned int rate = clip.sampleRate;
    if ((err = snd_pcm_hw_params_set_rate_near(playback_handle, hw_params, &rate, 0)) < 0) return err;
    if ((err = snd_pcm_hw_params_set_channels(playback_handle, hw_params, clip.channels)) < 0) return err;
    if ((err = snd_pcm_hw_params(playback_handle, hw_params)) < 0) return err;
    if (rate != clip.sampleRate) {
        LOG_WARNF("Playing %u Hz clip at %u Hz", clip.sampleRate, rate);
    }
    return snd_pcm_prepare(playback_handle);
}

void AlsaAudioLooper::playLoop(WavClip clip) {
    const snd_pcm_uframes_t total = clip.frameCount();
    snd_pcm_uframes_t position = 0;

    while (playing) {
        snd_pcm_uframes_t frames = min(PERIOD_FRAMES, total - position);
        const int16_t* data = clip.samples.data() + position * clip.channels;
        snd_pcm_sframes_t written = snd_pcm_writei(playback_handle, data, frames);
        if (written < 0) {
            if (!playing) break;

            // Try to recover from an underrun or suspend
            int err = snd_pcm_recover(playback_handle, static_cast<int>(written), 1);
            if (err < 0) {
                LOG_ERROR(string("Audio playback error: ") + snd_strerror(err));
                playing = false;
                break;
            }
            continue;
        }

        position += static_cast<snd_pcm_uframes_t>(written);
        if (position >= total) {
            position = 0;
        }
    }
}

void AlsaAudioLooper::closePlayback() {
    if (playback_handle) {
        snd_pcm_close(playback_handle);
        playback_handle = nullptr;
    }
}
