// Facewatch controller.
// Idle / tracking / alert state machine and the loops behind each mode.

#pragma once

#include "actuator.hpp"
#include "audio_looper.hpp"
#include "camera.hpp"
#include "face_locator.hpp"
#include "settings.hpp"
#include "smoothing_filter.hpp"
#include "stop_signal.hpp"
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

enum class Mode {
    Idle,
    Tracking,
    Alert
};

const char* modeName(Mode mode);

struct ControllerStatus {
    bool cameraAvailable = false;
    bool arduinoConnected = false;
    bool trackingActive = false;
    bool alertMode = false;
    bool audioActive = false;      // Audio loop thread still running
    double smoothingFactor = 0.0;
};

class ModeController {
public:
    ModeController(FrameSource& frames, FaceLocator& locator, ActuatorChannel& actuator,
                   AudioLooper& audio, const LoopTiming& timing, double smoothingFactor);
    ~ModeController();

    ModeController(const ModeController&) = delete;
    ModeController& operator=(const ModeController&) = delete;

    // Returns false if the tracking loop is already running
    bool startTracking();

    // Stops the tracking loop only. Alert state is left alone.
    void stopTracking();

    // Returns false if the alert loops are already running
    bool startAlert();

    // Always ends with audio stopped, whatever the loop threads are doing.
    // Waits at most audioStopTimeoutMs for the audio loop to exit.
    bool stopAlert();

    // One SPIN command, no state change
    bool spinOnce();

    double smoothingFactor() const { return filter.factor(); }

    // Throws std::invalid_argument if factor is outside [0, 1]
    void setSmoothingFactor(double factor);

    ControllerStatus status() const;
    Mode mode() const;
    uint32_t frameCount() const { return frameCounter; }

    // Stop every loop. Called by the destructor.
    void shutdown();

    static const std::string SPIN_COMMAND;

private:
    void trackingLoop();
    void alertServoLoop();
    void audioLoop();

    FrameSource& frames;
    FaceLocator& locator;
    ActuatorChannel& actuator;
    AudioLooper& audio;
    LoopTiming timing;
    SmoothingFilter filter;

    // Serializes start/stop requests
    std::mutex controlMutex;

    // Held while the tracking loop decides to send, and while alert is raised,
    // so no coordinate goes out once startAlert() has returned
    std::mutex trackingSendMutex;

    std::atomic<bool> trackingRunning{false};
    std::atomic<bool> alertActive{false};
    std::atomic<bool> alertLoopRunning{false};
    std::atomic<bool> audioRunning{false};
    std::atomic<uint32_t> frameCounter{0};

    StopSignal trackingStop;
    StopSignal alertStop;
    StopSignal audioStop;
    StopSignal audioFinished;

    std::thread trackingThread;
    std::thread alertThread;
    std::thread audioThread;
};
