#pragma once

#include "net/SocketAddress.h"

/// Manages the proxy's listening socket.
/// Binds to a resolved address and accepts new client connections.
/// The socket is non-blocking so accept won't stall the event loop.
class Listener {
public:
    /// Throws std::system_error if socket(), bind() or listen() fails.
    explicit Listener(const SocketAddress& addr);
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    int fd() const { return fd_; }

    /// The address actually bound (resolves port 0 to the kernel's choice).
    SocketAddress localAddress() const;

    /// Accept one pending client connection.
    /// Returns a non-blocking client fd, or -1 with errno set: EAGAIN when
    /// no connection is pending, anything else on error.
    int acceptClient();

private:
    int fd_ = -1;
};
