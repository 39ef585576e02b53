#include "transport/serial.hpp"
#include <poll.h>
#include <dirent.h>
#include <algorithm>
#include <chrono>

namespace cavro {

Result<bool> SerialPort::open(const std::string& port)
{
    if (fd_ >= 0) {
        close();
    }

    port_ = port;

    fd_ = ::open(port_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if(fd_ < 0)
    {
        std::cerr << "Error opening " << port << ": " << strerror(errno) << "\n";
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    if(tcgetattr(fd_, &original_tty_) != 0)
    {
        std::cerr << "Error getting port attributes: " << strerror(errno) << "\n";
        ::close(fd_);
        fd_ = -1;
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    struct termios tty = original_tty_;
    set_8N1(tty);

    if(tcsetattr(fd_, TCSANOW, &tty) != 0)
    {
        std::cerr << "Error setting port attributes: " << strerror(errno) << "\n";
        ::close(fd_);
        fd_ = -1;
        return Result<bool>::failure(Error::PORT_ERROR);
    }

    // Non-blocking was only needed so open() can't hang on modem lines.
    int flags = fcntl(fd_, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd_, F_SETFL, flags & ~O_NONBLOCK);
    }

    tcflush(fd_, TCIOFLUSH);
    open_ = true;
    return Result<bool>::success(true);
}

Result<bool> SerialPort::close()
{
    if(fd_ >= 0)
    {
        tcsetattr(fd_, TCSANOW, &original_tty_);
        ::close(fd_);
        fd_ = -1;
        open_ = false;
        return Result<bool>::success(true);
    }
    return Result<bool>::success(false);
}

Result<bool> SerialPort::discard_buffers()
{
    if (fd_ < 0)
        return Result<bool>::failure(Error::PORT_ERROR);

    if (tcflush(fd_, TCIOFLUSH) != 0) {
        std::cerr << "Error flushing " << port_ << ": " << strerror(errno) << "\n";
        return Result<bool>::failure(Error::PORT_ERROR);
    }
    return Result<bool>::success(true);
}

Result<size_t> SerialPort::write(const unsigned char* data, size_t len)
{
    if(fd_ < 0)
        return Result<size_t>::failure(Error::PORT_ERROR);

    ssize_t written = ::write(fd_, data, len);
    if(written < 0)
    {
        std::cerr << "Error writing " << port_ << ": " << strerror(errno) << "\n";
        return Result<size_t>::failure(Error::WRITE_ERROR);
    }
    if (static_cast<size_t>(written) != len)
        return Result<size_t>::failure(Error::WRITE_ERROR);

    tcdrain(fd_);
    return Result<size_t>::success(static_cast<size_t>(written));
}

Result<std::vector<unsigned char>> SerialPort::read_until(const std::string& terminator)
{
    std::vector<unsigned char> buffer;

    if (fd_ < 0)
        return Result<std::vector<unsigned char>>::failure(Error::PORT_ERROR);

    auto ends_with_terminator = [&]() {
        if (terminator.empty() || buffer.size() < terminator.size())
            return false;
        return std::equal(terminator.begin(), terminator.end(),
                          buffer.end() - terminator.size(),
                          [](char a, unsigned char b) { return static_cast<unsigned char>(a) == b; });
    };

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);
    unsigned char temp[64];

    while (true)
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0)
            break;

        struct pollfd pfd = {fd_, POLLIN, 0};
        int ret = poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining, 50)));

        if (ret > 0)
        {
            // One byte at a time so nothing past the terminator is consumed.
            ssize_t n = ::read(fd_, temp, 1);
            if (n > 0)
            {
                buffer.insert(buffer.end(), temp, temp + n);
                if (ends_with_terminator()) {
                    buffer.resize(buffer.size() - terminator.size());
                    return Result<std::vector<unsigned char>>::success(std::move(buffer));
                }
            }
            else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                return Result<std::vector<unsigned char>>::failure(Error::PORT_ERROR);
            }
        }
        else if (ret < 0 && errno != EINTR) {
            return Result<std::vector<unsigned char>>::failure(Error::PORT_ERROR);
        }
    }

    return Result<std::vector<unsigned char>>::failure(Error::TIMEOUT);
}

bool SerialPort::is_open()
{
    return open_;
}

void SerialPort::set_timeout_ms(int timeout_ms)
{
    timeout_ms_ = timeout_ms;
}

void SerialPort::set_8N1(termios &tty)
{
    cfsetispeed(&tty, baud_);
    cfsetospeed(&tty, baud_);
    cfmakeraw(&tty);

    tty.c_cflag = (tty.c_cflag & ~CSIZE) | CS8;
    tty.c_cflag &= ~PARENB;
    tty.c_cflag &= ~CSTOPB;
    tty.c_cflag &= ~CRTSCTS;
    tty.c_cflag |= CREAD | CLOCAL;

    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;
}

std::vector<std::string> SerialChannelFactory::enumerate()
{
    std::vector<std::string> ports;

    DIR* dir = opendir("/dev");
    if (!dir) {
        std::cerr << "Error listing /dev: " << strerror(errno) << "\n";
        return ports;
    }

    while (struct dirent* entry = readdir(dir)) {
        std::string name = entry->d_name;
        for (const auto& prefix : prefixes_) {
            if (name.compare(0, prefix.size(), prefix) == 0) {
                ports.push_back("/dev/" + name);
                break;
            }
        }
    }
    closedir(dir);

    std::sort(ports.begin(), ports.end());
    return ports;
}

std::unique_ptr<Channel> SerialChannelFactory::create()
{
    return std::make_unique<SerialPort>(baud_);
}

} // namespace cavro
