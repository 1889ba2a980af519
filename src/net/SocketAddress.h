#pragma once

#include <string>
#include <sys/socket.h>

/// A resolved IPv4/IPv6 endpoint, stored the way the socket calls take it.
struct SocketAddress {
    struct sockaddr_storage storage{};
    socklen_t length = 0;

    int family() const { return storage.ss_family; }
    const struct sockaddr* addr() const {
        return reinterpret_cast<const struct sockaddr*>(&storage);
    }

    /// "127.0.0.1:9090" / "[::1]:9090".
    std::string toString() const;

    /// Port in host byte order.
    int port() const;
};

/// Resolve "host:port" with getaddrinfo() and keep the first result.
/// An empty host means the wildcard address when `passive` is set (listen
/// side) and the loopback address otherwise. The port may be a service name.
///
/// Throws std::invalid_argument if the string has no ":port" part, and
/// std::runtime_error if resolution fails or yields nothing usable.
SocketAddress resolveFirst(const std::string& hostPort, int family,
                           bool passive);

/// Open a non-blocking TCP socket and start connecting it to `addr`.
/// Returns the fd once connected or while the connect is in progress
/// (EINPROGRESS); the first writable event confirms the outcome.
/// Returns -1 with errno set if the attempt fails immediately.
int connectTcp(const SocketAddress& addr);
