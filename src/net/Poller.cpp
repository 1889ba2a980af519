#include "net/Poller.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unistd.h>  // close

Poller::Poller() {
    epollFd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epollFd_ < 0) {
        throw std::system_error(errno, std::generic_category(),
                                "epoll_create1()");
    }
}

Poller::~Poller() {
    if (epollFd_ >= 0) {
        ::close(epollFd_);
    }
}

void Poller::add(int fd, uint32_t events, uint64_t token) {
    struct epoll_event ev{};
    ev.events = events | EPOLLET;
    if (events & EPOLLIN) {
        ev.events |= EPOLLRDHUP;
    }
    ev.data.u64 = token;
    if (::epoll_ctl(epollFd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        throw std::system_error(errno, std::generic_category(),
                                "epoll_ctl(ADD, fd " + std::to_string(fd) + ")");
    }
}

void Poller::remove(int fd) {
    if (::epoll_ctl(epollFd_, EPOLL_CTL_DEL, fd, nullptr) < 0) {
        throw std::logic_error("epoll_ctl(DEL, fd " + std::to_string(fd) +
                               ") failed: " + std::strerror(errno));
    }
}

int Poller::wait(int timeoutMs) {
    while (true) {
        int n = ::epoll_wait(epollFd_, events_, kMaxEvents, timeoutMs);
        if (n >= 0) {
            numReady_ = n;
            return n;
        }
        numReady_ = 0;
        if (errno != EINTR) {
            throw std::system_error(errno, std::generic_category(),
                                    "epoll_wait()");
        }
        // Interrupted by a signal: not an error, wait again.
    }
}
