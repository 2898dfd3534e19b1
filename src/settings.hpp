// Facewatch controller.
// Runtime configuration: defaults, JSON config file, command line.

#pragma once

#include "logger.hpp"
#include <string>
#include <vector>

struct SerialSettings {
    std::string primaryPort = "/dev/ttyACM0";
    std::vector<std::string> alternatePorts = {"/dev/cu.usbmodem*", "/dev/ttyUSB*", "/dev/ttyACM*"};
    int baudRate = 9600;
    int settleMs = 2000;   // Arduino resets when the port is opened
    bool demo = false;     // Never touch a serial device
};

struct CameraSettings {
    bool enabled = true;
    std::vector<int> indices = {0, 1, 2};
    int width = 640;
    int height = 480;
    int fps = 30;
};

struct AudioSettings {
    std::string file = "alert-audio.wav";
    std::string device = "default";
};

struct LoopTiming {
    int trackingIntervalMs = 33;   // ~30 FPS
    int spinIntervalMs = 2000;
    int audioPollMs = 100;
    int idleRetryMs = 100;         // No camera or failed read
    int audioStopTimeoutMs = 2500; // Longest stop_alert waits on the audio loop
};

struct Settings {
    int httpPort = 5007;
    SerialSettings serial;
    CameraSettings camera;
    AudioSettings audio;
    LoopTiming timing;
    std::string cascadePath;       // Empty: probe standard locations
    double smoothingFactor = 0.7;
    LogLevel logLevel = LogLevel::Info;
    bool showHelp = false;
};

// Apply a JSON config file on top of the given settings.
// Throws std::runtime_error if the file cannot be read or is invalid.
void applyConfigFile(Settings& settings, const std::string& path);

// Build settings from defaults, then --config, then the other flags.
// Throws std::runtime_error on a bad flag or value.
Settings loadSettings(int argc, char** argv);

// Throws std::runtime_error describing the first invalid value
void validateSettings(const Settings& settings);

std::string usage(const std::string& program);
