#include "settings.hpp"
#include "smoothing_filter.hpp"
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace std;
using namespace nlohmann;

void applyConfigFile(Settings& settings, const string& path) {
    ifstream file(path);
    if (!file) {
        throw runtime_error("Could not open config file: " + path);
    }

    json j = json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw runtime_error("Config file is not a JSON object: " + path);
    }

    try {
        settings.httpPort = j.value("http_port", settings.httpPort);
        settings.cascadePath = j.value("cascade_path", settings.cascadePath);
        settings.smoothingFactor = j.value("smoothing_factor", settings.smoothingFactor);
        if (j.contains("log_level")) {
            settings.logLevel = parseLogLevel(j["log_level"].get<string>());
        }
        settings.serial.demo = j.value("demo", settings.serial.demo);

        if (j.contains("serial")) {
            const json& s = j["serial"];
            SerialSettings& serial = settings.serial;
            serial.primaryPort = s.value("primary_port", serial.primaryPort);
            serial.alternatePorts = s.value("alternate_ports", serial.alternatePorts);
            serial.baudRate = s.value("baud_rate", serial.baudRate);
            serial.settleMs = s.value("settle_ms", serial.settleMs);
        }

        if (j.contains("camera")) {
            const json& c = j["camera"];
            CameraSettings& camera = settings.camera;
            camera.enabled = c.value("enabled", camera.enabled);
            camera.indices = c.value("indices", camera.indices);
            camera.width = c.value("width", camera.width);
            camera.height = c.value("height", camera.height);
            camera.fps = c.value("fps", camera.fps);
        }

        if (j.contains("audio")) {
            const json& a = j["audio"];
            settings.audio.file = a.value("file", settings.audio.file);
            settings.audio.device = a.value("device", settings.audio.device);
        }

        if (j.contains("timing")) {
            const json& t = j["timing"];
            LoopTiming& timing = settings.timing;
            timing.trackingIntervalMs = t.value("tracking_interval_ms", timing.trackingIntervalMs);
            timing.spinIntervalMs = t.value("spin_interval_ms", timing.spinIntervalMs);
            timing.audioPollMs = t.value("audio_poll_ms", timing.audioPollMs);
            timing.idleRetryMs = t.value("idle_retry_ms", timing.idleRetryMs);
            timing.audioStopTimeoutMs = t.value("audio_stop_timeout_ms", timing.audioStopTimeoutMs);
        }
    } catch (const json::exception& e) {
        throw runtime_error("Invalid config file " + path + ": " + e.what());
    }
}

static int parseInt(const string& flag, const string& value) {
    try {
        size_t used = 0;
        int result = stoi(value, &used);
        if (used != value.size()) throw invalid_argument(value);
        return result;
    } catch (const logic_error&) {
        throw runtime_error("Invalid number for " + flag + ": " + value);
    }
}

static double parseDouble(const string& flag, const string& value) {
    try {
        size_t used = 0;
        double result = stod(value, &used);
        if (used != value.size()) throw invalid_argument(value);
        return result;
    } catch (const logic_error&) {
        throw runtime_error("Invalid number for " + flag + ": " + value);
    }
}

Settings loadSettings(int argc, char** argv) {
    Settings settings;
    vector<string> args(argv + 1, argv + argc);

    // Config file first so flags can override it
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) throw runtime_error("Missing value for --config");
            applyConfigFile(settings, args[i + 1]);
        }
    }

    for (size_t i = 0; i < args.size(); i++) {
        const string& flag = args[i];
        auto value = [&]() -> string {
            if (i + 1 >= args.size()) throw runtime_error("Missing value for " + flag);
            return args[++i];
        };

        if (flag == "--config")         { value(); }
        else if (flag == "--port")      { settings.httpPort = parseInt(flag, value()); }
        else if (flag == "--serial")    { settings.serial.primaryPort = value(); }
        else if (flag == "--audio")     { settings.audio.file = value(); }
        else if (flag == "--cascade")   { settings.cascadePath = value(); }
        else if (flag == "--smoothing") { settings.smoothingFactor = parseDouble(flag, value()); }
        else if (flag == "--log-level") { settings.logLevel = parseLogLevel(value()); }
        else if (flag == "--no-camera") { settings.camera.enabled = false; }
        else if (flag == "--demo")      { settings.serial.demo = true; }
        else if (flag == "--help" || flag == "-h") { settings.showHelp = true; }
        else throw runtime_error("Unknown option: " + flag);
    }

    validateSettings(settings);
    return settings;
}

void validateSettings(const Settings& settings) {
    if (settings.httpPort < 1 || settings.httpPort > 65535) {
        throw runtime_error("HTTP port must be between 1 and 65535");
    }
    if (!SmoothingFilter::isValidFactor(settings.smoothingFactor)) {
        throw runtime_error("Smoothing factor must be between 0.0 and 1.0");
    }
    if (settings.serial.baudRate <= 0) {
        throw runtime_error("Baud rate must be positive");
    }
    if (settings.serial.settleMs < 0) {
        throw runtime_error("Serial settle time must not be negative");
    }
    const LoopTiming& t = settings.timing;
    if (t.trackingIntervalMs <= 0 || t.spinIntervalMs <= 0 || t.audioPollMs <= 0 || t.idleRetryMs <= 0 ||
        t.audioStopTimeoutMs <= 0) {
        throw runtime_error("Loop intervals must be positive");
    }
    if (settings.camera.width <= 0 || settings.camera.height <= 0 || settings.camera.fps <= 0) {
        throw runtime_error("Camera size and frame rate must be positive");
    }
}

string usage(const string& program) {
    return "Usage: " + program + " [options]\n"
        "  --config <file>     JSON config file\n"
        "  --port <n>          HTTP port (default 5007)\n"
        "  --serial <path>     Primary Arduino serial port\n"
        "  --audio <file>      Alert clip (16-bit PCM WAV)\n"
        "  --cascade <file>    Haar cascade for face detection\n"
        "  --smoothing <f>     Smoothing factor in [0, 1]\n"
        "  --log-level <lvl>   debug, info, warn or error\n"
        "  --no-camera         Run without a camera\n"
        "  --demo              Log servo commands instead of sending them\n"
        "  --help              Show this message\n";
}
