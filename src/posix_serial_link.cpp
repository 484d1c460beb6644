#include "posix_serial_link.hpp"
#include "pump_errors.hpp"
#include "logger.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace
{
    struct BaudEntry
    {
        int baud;
        speed_t speed;
    };

    const BaudEntry kBaudTable[] = {
        {9600, B9600},
        {19200, B19200},
        {38400, B38400},
        {57600, B57600},
        {115200, B115200},
        {230400, B230400},
    };

    std::string errnoText()
    {
        return std::strerror(errno);
    }
}

const int SerialLink::kWaitForever;

bool PosixSerialLink::isSupportedBaud(int baud)
{
    for (const auto &entry : kBaudTable)
    {
        if (entry.baud == baud)
        {
            return true;
        }
    }
    return false;
}

PosixSerialLink::PosixSerialLink(const std::string &device, int baud, int timeout_ms)
    : device_(device), timeout_ms_(timeout_ms)
{
    speed_t speed = 0;
    bool found = false;
    for (const auto &entry : kBaudTable)
    {
        if (entry.baud == baud)
        {
            speed = entry.speed;
            found = true;
            break;
        }
    }
    if (!found)
    {
        throw ConnectivityError("unsupported baud rate " + std::to_string(baud) + " for " + device_);
    }

    fd_ = ::open(device_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0)
    {
        throw ConnectivityError("cannot open " + device_ + ": " + errnoText());
    }

    struct termios tty;
    std::memset(&tty, 0, sizeof(tty));
    if (tcgetattr(fd_, &tty) != 0)
    {
        std::string reason = errnoText();
        ::close(fd_);
        fd_ = -1;
        throw ConnectivityError("tcgetattr failed on " + device_ + ": " + reason);
    }

    cfmakeraw(&tty);
    tty.c_cflag &= ~(PARENB | CSTOPB | CSIZE | CRTSCTS);
    tty.c_cflag |= CS8 | CLOCAL | CREAD;
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;
    cfsetispeed(&tty, speed);
    cfsetospeed(&tty, speed);

    if (tcsetattr(fd_, TCSANOW, &tty) != 0)
    {
        std::string reason = errnoText();
        ::close(fd_);
        fd_ = -1;
        throw ConnectivityError("tcsetattr failed on " + device_ + ": " + reason);
    }
    tcflush(fd_, TCIOFLUSH);

    LegatoLogger::debug("串口 {} 已打开, 波特率 {}, 超时 {}ms", device_, baud, timeout_ms_);
}

PosixSerialLink::~PosixSerialLink()
{
    close();
}

void PosixSerialLink::write(const std::string &data)
{
    if (fd_ < 0)
    {
        throw ConnectivityError("write on closed port " + device_);
    }

    size_t written = 0;
    while (written < data.size())
    {
        ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
        if (n < 0)
        {
            if (errno == EAGAIN || errno == EINTR)
            {
                struct pollfd pfd = {fd_, POLLOUT, 0};
                if (::poll(&pfd, 1, 100) < 0 && errno != EINTR)
                {
                    throw ConnectivityError("poll failed on " + device_ + ": " + errnoText());
                }
                continue;
            }
            throw ConnectivityError("write failed on " + device_ + ": " + errnoText());
        }
        written += static_cast<size_t>(n);
    }
    if (tcdrain(fd_) != 0)
    {
        throw ConnectivityError("tcdrain failed on " + device_ + ": " + errnoText());
    }
}

bool PosixSerialLink::waitReadable(int wait_ms)
{
    struct pollfd pfd = {fd_, POLLIN, 0};
    while (true)
    {
        int ret = ::poll(&pfd, 1, wait_ms);
        if (ret < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            throw ConnectivityError("poll failed on " + device_ + ": " + errnoText());
        }
        if (ret == 0)
        {
            return false;
        }
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))
        {
            throw ConnectivityError("port " + device_ + " hung up");
        }
        return true;
    }
}

bool PosixSerialLink::readByte(char &c)
{
    if (fd_ < 0)
    {
        throw ConnectivityError("read on closed port " + device_);
    }

    while (true)
    {
        if (!waitReadable(timeout_ms_))
        {
            return false;
        }
        ssize_t n = ::read(fd_, &c, 1);
        if (n == 1)
        {
            return true;
        }
        if (n < 0 && errno != EAGAIN && errno != EINTR)
        {
            throw ConnectivityError("read failed on " + device_ + ": " + errnoText());
        }
    }
}

bool PosixSerialLink::readLine(std::string &line)
{
    if (fd_ < 0)
    {
        throw ConnectivityError("read on closed port " + device_);
    }

    line.clear();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);
    while (true)
    {
        int wait_ms = kWaitForever;
        if (timeout_ms_ != kWaitForever)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            wait_ms = remaining.count() > 0 ? static_cast<int>(remaining.count()) : 0;
        }
        if (!waitReadable(wait_ms))
        {
            return false;
        }

        char c = 0;
        ssize_t n = ::read(fd_, &c, 1);
        if (n < 0)
        {
            if (errno == EAGAIN || errno == EINTR)
            {
                continue;
            }
            throw ConnectivityError("read failed on " + device_ + ": " + errnoText());
        }
        if (n == 0)
        {
            continue;
        }
        line.push_back(c);
        if (c == '\n')
        {
            return true;
        }
    }
}

size_t PosixSerialLink::bytesAvailable()
{
    if (fd_ < 0)
    {
        return 0;
    }
    int count = 0;
    if (ioctl(fd_, FIONREAD, &count) < 0)
    {
        throw ConnectivityError("FIONREAD failed on " + device_ + ": " + errnoText());
    }
    return count > 0 ? static_cast<size_t>(count) : 0;
}

void PosixSerialLink::setTimeout(int timeout_ms)
{
    timeout_ms_ = timeout_ms;
}

int PosixSerialLink::timeout() const
{
    return timeout_ms_;
}

void PosixSerialLink::close()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
        LegatoLogger::debug("串口 {} 已关闭", device_);
    }
}

bool PosixSerialLink::isOpen() const
{
    return fd_ >= 0;
}
