// Facewatch controller.
// Command channel to the servo controller.

#pragma once

#include "serial_port.hpp"
#include "settings.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// One-way text command sink. Every command goes out followed by '\r'.
class ActuatorChannel {
public:
    virtual ~ActuatorChannel() = default;

    // Returns false only if a write to a present device failed
    virtual bool send(const std::string& command) = 0;

    // True if a physical device is attached
    virtual bool isConnected() const = 0;
};

// Device present: writes go to the serial port
class SerialActuatorChannel : public ActuatorChannel {
public:
    explicit SerialActuatorChannel(std::unique_ptr<SerialPort> port);

    bool send(const std::string& command) override;
    bool isConnected() const override { return true; }

private:
    std::unique_ptr<SerialPort> port;
    std::mutex writeMutex;
};

// Device absent: commands are logged and reported as sent
class DemoActuatorChannel : public ActuatorChannel {
public:
    bool send(const std::string& command) override;
    bool isConnected() const override { return false; }
};

// Open the primary port, then each alternate pattern in turn.
// Falls back to the demo channel if nothing opens.
std::unique_ptr<ActuatorChannel> connectActuator(const SerialSettings& settings);

// Expand a glob pattern into existing paths, sorted
std::vector<std::string> expandPortPattern(const std::string& pattern);
