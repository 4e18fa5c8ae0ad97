#pragma once

#include <sys/epoll.h>
#include <fcntl.h>
#include <unistd.h>
#include <cstdint>
#include <vector>

// Owning wrapper for a POSIX file descriptor; closes on destruction.
class Fd
{
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { reset(); }

    Fd(const Fd &) = delete;
    Fd &operator=(const Fd &) = delete;

    Fd(Fd &&other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    Fd &operator=(Fd &&other) noexcept
    {
        if (this != &other)
        {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int get() const { return fd_; }
    bool valid() const { return fd_ != -1; }

    void reset(int new_fd = -1)
    {
        if (fd_ != -1)
        {
            ::close(fd_);
        }
        fd_ = new_fd;
    }

    // Switches the descriptor to non-blocking mode.
    bool set_nonblocking()
    {
        int flags = ::fcntl(fd_, F_GETFL, 0);
        if (flags == -1)
            return false;
        return ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) == 0;
    }

private:
    int fd_{-1};
};

// Owns an epoll instance; ctl calls report failure as false.
class Epoll
{
public:
    Epoll() : epfd_(::epoll_create1(0)) {}

    bool valid() const { return epfd_.valid(); }

    bool add(int fd, uint32_t events) { return ctl(EPOLL_CTL_ADD, fd, events); }
    bool mod(int fd, uint32_t events) { return ctl(EPOLL_CTL_MOD, fd, events); }
    bool del(int fd) { return ctl(EPOLL_CTL_DEL, fd, 0); }

    // Waits up to `timeout_ms`; returns the ready count or -1 with errno set.
    int wait(std::vector<epoll_event> &events, int timeout_ms)
    {
        return ::epoll_wait(epfd_.get(), events.data(), static_cast<int>(events.size()), timeout_ms);
    }

private:
    bool ctl(int op, int fd, uint32_t events)
    {
        if (!epfd_.valid())
            return false;
        epoll_event ev{};
        ev.events = events;
        ev.data.fd = fd;
        return ::epoll_ctl(epfd_.get(), op, fd, &ev) == 0;
    }

    Fd epfd_;
};
