#pragma once

#include <iostream>
#include <string>
#include <cstring>
#include <vector>
#include <fcntl.h>
#include <unistd.h>
#include <termios.h>
#include <errno.h>

#include "common/types.hpp"
#include "transport/channel.hpp"

namespace cavro {

class SerialPort : public Channel
{
public:

    explicit SerialPort(speed_t baud = B9600) : fd_(-1), baud_(baud), open_(false), timeout_ms_(1000) {}
    ~SerialPort() override
    {
        close();
    }

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    Result<bool> open(const std::string& port) override;
    Result<bool> close() override;
    Result<bool> discard_buffers() override;
    Result<size_t> write(const unsigned char* data, size_t len) override;
    Result<std::vector<unsigned char>> read_until(const std::string& terminator) override;

    bool is_open() override;
    void set_timeout_ms(int timeout_ms) override;

private:
    void set_8N1(termios& tty);

    int fd_;
    std::string port_;
    speed_t baud_;
    struct termios original_tty_;
    bool open_;
    int timeout_ms_;

};

// Enumerates serial device nodes under /dev and hands out SerialPorts.
class SerialChannelFactory : public ChannelFactory
{
public:
    explicit SerialChannelFactory(std::vector<std::string> prefixes = {"ttyUSB", "ttyACM", "ttyS"},
                                  speed_t baud = B9600)
        : prefixes_(std::move(prefixes)), baud_(baud) {}

    std::vector<std::string> enumerate() override;
    std::unique_ptr<Channel> create() override;

private:
    std::vector<std::string> prefixes_;
    speed_t baud_;
};

} // namespace cavro
