#include "serial_port.hpp"
#include "logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

using namespace std;

SerialPort::SerialPort(const string& port) : port_name(port), serial_fd(-1) {}

SerialPort::~SerialPort() {
    closePort();
}

speed_t SerialPort::baudConstant(int baud_rate) {
    switch (baud_rate) {
        case 1200:   return B1200;
        case 2400:   return B2400;
        case 4800:   return B4800;
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 115200: return B115200;
        default:     return B0;
    }
}

bool SerialPort::configurePort(int baud_rate) {
    // Get current serial port settings
    struct termios options;
    if (tcgetattr(serial_fd, &options) != 0) {
        LOG_ERROR("Failed to get serial port attributes: " + string(strerror(errno)));
        return false;
    }

    // Set baud rate
    speed_t speed = baudConstant(baud_rate);
    if (speed == B0 || cfsetspeed(&options, speed) != 0) {
        LOG_ERRORF("Failed to set baud rate %d", baud_rate);
        return false;
    }

    // Configure 8N1
    options.c_cflag &= ~PARENB;  // No parity
    options.c_cflag &= ~CSTOPB;  // One stop bit
    options.c_cflag &= ~CSIZE;   // Clear data size bits
    options.c_cflag |= CS8;      // 8 data bits

    // Enable the receiver and set local mode
    options.c_cflag |= (CLOCAL | CREAD);

    // Disable hardware flow control
    options.c_cflag &= ~CRTSCTS;

    // Raw input/output mode
    options.c_lflag &= ~(ICANON | ECHO | ECHOE | ISIG);
    options.c_iflag &= ~(IXON | IXOFF | IXANY); // Disable software flow
    options.c_oflag &= ~OPOST;

    if (tcsetattr(serial_fd, TCSANOW, &options) != 0) {
        LOG_ERROR("Failed to set serial port attributes: " + string(strerror(errno)));
        return false;
    }
    return true;
}

bool SerialPort::openPort(int baud_rate) {
    closePort();
    serial_fd = open(port_name.c_str(), O_RDWR | O_NOCTTY);
    if (serial_fd == -1) {
        LOG_DEBUG("Failed to open serial port " + port_name + ": " + strerror(errno));
        return false;
    }

    if (!configurePort(baud_rate)) {
        LOG_ERROR("Failed to configure serial port " + port_name);
        closePort();
        return false;
    }

    LOG_INFOF("Serial port %s configured with baud rate %d", port_name.c_str(), baud_rate);
    return true;
}

void SerialPort::closePort() {
    if (serial_fd != -1) {
        close(serial_fd);
        serial_fd = -1;
    }
}

bool SerialPort::writeData(const string& data) {
    if (serial_fd == -1) {
        LOG_ERROR("Serial port not open.");
        return false;
    }

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(serial_fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR("Failed to write to serial port: " + string(strerror(errno)));
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}
