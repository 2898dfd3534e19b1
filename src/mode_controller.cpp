#include "mode_controller.hpp"
#include "logger.hpp"
#include <chrono>
#include <optional>

using namespace std;

const string ModeController::SPIN_COMMAND = "SPIN";

const char* modeName(Mode mode) {
    switch (mode) {
        case Mode::Idle:     return "idle";
        case Mode::Tracking: return "tracking";
        case Mode::Alert:    return "alert";
    }
    return "unknown";
}

ModeController::ModeController(FrameSource& frames, FaceLocator& locator, ActuatorChannel& actuator,
                               AudioLooper& audio, const LoopTiming& timing, double smoothingFactor)
    : frames(frames), locator(locator), actuator(actuator), audio(audio),
      timing(timing), filter(smoothingFactor) {}

ModeController::~ModeController() {
    shutdown();
}

bool ModeController::startTracking() {
    lock_guard<mutex> lock(controlMutex);
    if (trackingRunning) {
        return false;
    }

    // Reap a loop that ended on its own
    if (trackingThread.joinable()) {
        trackingThread.join();
    }

    trackingStop.reset();
    trackingRunning = true;
    trackingThread = thread(&ModeController::trackingLoop, this);
    LOG_INFO("Face tracking started");
    return true;
}

void ModeController::stopTracking() {
    lock_guard<mutex> lock(controlMutex);
    bool wasRunning = trackingRunning.exchange(false);
    trackingStop.requestStop();
    if (trackingThread.joinable()) {
        trackingThread.join();
    }
    if (wasRunning) {
        LOG_INFO("Face tracking stopped");
    }
}

bool ModeController::startAlert() {
    lock_guard<mutex> lock(controlMutex);
    if (alertLoopRunning) {
        return false;
    }
    if (alertThread.joinable()) {
        alertThread.join();
    }

    // An audio loop left behind by a timed-out stop still owns the looper
    if (audioRunning) {
        LOG_WARN("Alert audio from the last alert is still shutting down");
        return false;
    }
    if (audioThread.joinable()) {
        audioThread.join();
    }

    {
        lock_guard<mutex> sendLock(trackingSendMutex);
        alertActive = true;
    }

    alertStop.reset();
    alertLoopRunning = true;
    alertThread = thread(&ModeController::alertServoLoop, this);

    audioStop.reset();
    audioFinished.reset();
    audioRunning = true;
    audioThread = thread(&ModeController::audioLoop, this);

    LOG_INFO("Alert mode started - servo looping + audio playing");
    return true;
}

bool ModeController::stopAlert() {
    lock_guard<mutex> lock(controlMutex);
    bool wasActive = alertLoopRunning.exchange(false);
    {
        lock_guard<mutex> sendLock(trackingSendMutex);
        alertActive = false;
    }

    alertStop.requestStop();
    if (alertThread.joinable()) {
        alertThread.join();
    }

    // Stop audio even if the audio loop has not woken up yet
    audioStop.requestStop();
    audio.stopLoop();
    if (audioThread.joinable()) {
        if (audioFinished.waitFor(chrono::milliseconds(timing.audioStopTimeoutMs))) {
            audioThread.join();
        } else {
            LOG_WARNF("Audio loop still busy after %d ms, leaving it to finish", timing.audioStopTimeoutMs);
        }
    }

    if (wasActive) {
        LOG_INFO("Alert mode stopped - resuming face tracking, audio stopped");
    }
    return true;
}

bool ModeController::spinOnce() {
    return actuator.send(SPIN_COMMAND);
}

void ModeController::setSmoothingFactor(double factor) {
    filter.setFactor(factor);
    LOG_INFOF("Smoothing factor set to %.3f", factor);
}

ControllerStatus ModeController::status() const {
    ControllerStatus s;
    s.cameraAvailable = frames.isAvailable();
    s.arduinoConnected = actuator.isConnected();
    s.trackingActive = trackingRunning;
    s.alertMode = alertActive;
    s.audioActive = audioRunning;
    s.smoothingFactor = filter.factor();
    return s;
}

Mode ModeController::mode() const {
    if (alertActive) return Mode::Alert;
    if (trackingRunning) return Mode::Tracking;
    return Mode::Idle;
}

void ModeController::shutdown() {
    stopTracking();
    stopAlert();

    // The thread must not outlive us, so wait out a late audio loop here
    lock_guard<mutex> lock(controlMutex);
    if (audioThread.joinable()) {
        audioThread.join();
    }
}

void ModeController::trackingLoop() {
    LOG_INFO("Starting face tracking loop");
    const auto interval = chrono::milliseconds(timing.trackingIntervalMs);
    const auto retry = chrono::milliseconds(timing.idleRetryMs);

    try {
        while (!trackingStop.stopRequested()) {
            cv::Mat frame;
            if (!frames.isAvailable() || !frames.captureFrame(frame)) {
                trackingStop.waitFor(retry);
                continue;
            }
            uint32_t count = ++frameCounter;

            // Alert mode owns the servo
            if (!alertActive) {
                cv::flip(frame, frame, 1);  // Mirror
                optional<int> faceX = locator.locate(frame);
                if (faceX) {
                    int smoothX = filter.smooth(*faceX);

                    // Every other frame keeps serial traffic down
                    if (count % 2 == 0) {
                        lock_guard<mutex> sendLock(trackingSendMutex);
                        if (!alertActive) {
                            actuator.send(to_string(smoothX));
                        }
                    }
                }
            }

            trackingStop.waitFor(interval);
        }
    } catch (const exception& e) {
        LOG_ERROR(string("Face tracking error: ") + e.what());
        trackingRunning = false;
    }
    LOG_INFO("Face tracking loop stopped");
}

void ModeController::alertServoLoop() {
    LOG_INFO("Starting alert servo loop");
    const auto interval = chrono::milliseconds(timing.spinIntervalMs);

    try {
        while (!alertStop.stopRequested()) {
            actuator.send(SPIN_COMMAND);
            if (alertStop.waitFor(interval)) break;
        }
    } catch (const exception& e) {
        LOG_ERROR(string("Alert servo loop error: ") + e.what());
    }
    LOG_INFO("Alert servo loop stopped");
}

void ModeController::audioLoop() {
    LOG_INFO("Starting audio alert loop");
    const auto poll = chrono::milliseconds(timing.audioPollMs);

    try {
        if (!audioStop.stopRequested()) {
            if (audio.startLoop()) {
                while (!audioStop.waitFor(poll)) {
                    if (!audio.isPlaying()) {
                        LOG_WARN("Alert audio ended unexpectedly");
                        break;
                    }
                }
            } else {
                LOG_WARN("Alert audio not playing");
            }
        }
        audio.stopLoop();
    } catch (const exception& e) {
        LOG_ERROR(string("Audio playback error: ") + e.what());
        audio.stopLoop();
    }

    audioRunning = false;
    audioFinished.requestStop();
    LOG_INFO("Audio alert loop stopped");
}
