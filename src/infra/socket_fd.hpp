#pragma once

#include <unistd.h>

#include <utility>

namespace sr
{
// Owns one socket descriptor; closes it on destruction.
class SocketFd
{
public:
    SocketFd() = default;
    explicit SocketFd(int fd) : fd_(fd) {}
    ~SocketFd() { reset(); }

    SocketFd(const SocketFd &) = delete;
    SocketFd &operator=(const SocketFd &) = delete;

    SocketFd(SocketFd &&other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    SocketFd &operator=(SocketFd &&other) noexcept
    {
        if (this != &other)
        {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    int get() const { return fd_; }
    explicit operator bool() const { return fd_ >= 0; }

    int release() { return std::exchange(fd_, -1); }

    void reset()
    {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_ = -1;
};
} // namespace sr
