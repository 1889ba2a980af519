#pragma once

#include <cstdint>
#include <sys/epoll.h>

/// Owns the epoll instance. Every registration is edge-triggered and carries
/// a caller-chosen 64-bit token that comes back with each ready event.
///
/// wait() is the only call in the process that blocks.
///
/// Must NOT know about: connections, buffers, what a token means.
class Poller {
public:
    /// Throws std::system_error if epoll_create1() fails.
    Poller();
    ~Poller();

    Poller(const Poller&) = delete;
    Poller& operator=(const Poller&) = delete;

    /// Register fd for `events` (EPOLLIN / EPOLLOUT). EPOLLET is always added,
    /// and EPOLLRDHUP whenever EPOLLIN is requested.
    /// Throws std::system_error on failure (out of memory, fd limits).
    void add(int fd, uint32_t events, uint64_t token);

    /// Remove fd's registration. Failing here means the fd was never
    /// registered or is already closed; throws std::logic_error.
    void remove(int fd);

    /// Block until at least one event is ready or timeoutMs elapses
    /// (-1 waits forever). EINTR is retried. Returns the number of ready
    /// events. Throws std::system_error on any other failure.
    int wait(int timeoutMs = -1);

    /// Access the i-th ready event from the most recent wait() call.
    const struct epoll_event& event(int i) const { return events_[i]; }

    /// Number of events returned by the most recent wait().
    int ready() const { return numReady_; }

    int fd() const { return epollFd_; }

private:
    int epollFd_;
    static constexpr int kMaxEvents = 64;
    struct epoll_event events_[kMaxEvents];
    int numReady_ = 0;
};
