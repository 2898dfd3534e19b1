#pragma once

#include <string>
#include <termios.h>

// Raw 8N1 serial port on a POSIX tty
class SerialPort {
public:
    explicit SerialPort(const std::string& port);
    ~SerialPort();

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    bool openPort(int baud_rate);
    void closePort();
    bool isOpen() const { return serial_fd != -1; }
    const std::string& name() const { return port_name; }

    bool writeData(const std::string& data);

    // Map a numeric baud rate to its termios constant. Returns B0 if unsupported.
    static speed_t baudConstant(int baud_rate);

private:
    bool configurePort(int baud_rate);

    std::string port_name;
    int serial_fd;
};
