#include "actuator.hpp"
#include "logger.hpp"
#include <chrono>
#include <glob.h>
#include <thread>

using namespace std;

static const char COMMAND_TERMINATOR = '\r';

SerialActuatorChannel::SerialActuatorChannel(unique_ptr<SerialPort> port) : port(move(port)) {}

bool SerialActuatorChannel::send(const string& command) {
    lock_guard<mutex> lock(writeMutex);
    if (!port->writeData(command + COMMAND_TERMINATOR)) {
        LOG_ERROR("Arduino communication error on " + port->name() + " sending: " + command);
        return false;
    }
    LOG_DEBUG("Sent command: " + command);
    return true;
}

bool DemoActuatorChannel::send(const string& command) {
    LOG_INFO("Demo mode: Command=" + command);
    return true;
}

vector<string> expandPortPattern(const string& pattern) {
    vector<string> paths;
    glob_t results;
    if (glob(pattern.c_str(), 0, nullptr, &results) == 0) {
        for (size_t i = 0; i < results.gl_pathc; i++) {
            paths.emplace_back(results.gl_pathv[i]);
        }
    }
    globfree(&results);
    return paths;
}

static unique_ptr<ActuatorChannel> tryOpen(const string& path, const SerialSettings& settings) {
    auto port = make_unique<SerialPort>(path);
    if (!port->openPort(settings.baudRate)) {
        return nullptr;
    }

    // Give the Arduino time to reboot after the port opens
    this_thread::sleep_for(chrono::milliseconds(settings.settleMs));
    LOG_INFO("Arduino connected on: " + path);
    return make_unique<SerialActuatorChannel>(move(port));
}

unique_ptr<ActuatorChannel> connectActuator(const SerialSettings& settings) {
    if (settings.demo) {
        LOG_INFO("Running in demo mode (serial disabled)");
        return make_unique<DemoActuatorChannel>();
    }

    if (auto channel = tryOpen(settings.primaryPort, settings)) {
        return channel;
    }
    LOG_WARN("Arduino not found on " + settings.primaryPort);

    for (const auto& pattern : settings.alternatePorts) {
        for (const auto& path : expandPortPattern(pattern)) {
            if (path == settings.primaryPort) continue;
            if (auto channel = tryOpen(path, settings)) {
                return channel;
            }
        }
    }

    LOG_INFO("Running in demo mode (no Arduino)");
    return make_unique<DemoActuatorChannel>();
}
