#pragma once

#include "net/PipeBuffer.h"

#include <cstddef>

class Poller;

/// One proxied session: the accepted client socket, the backend socket, and
/// one PipeBuffer per direction.
///
/// Owns all four resources. The destructor closes both sockets first, then
/// the member buffers release their pipes. A Connection is destroyed by its
/// ConnectionTable once both Poll Descriptors have released it.
/// Not copyable, not movable — always held via unique_ptr.
class Connection {
public:
    /// Takes ownership of both fds. If a pipe cannot be created this throws
    /// std::system_error and the caller still owns (and must close) the fds.
    Connection(int clientFd, int backendFd, size_t pipeCapacity);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    int clientFd() const { return clientFd_; }
    int backendFd() const { return backendFd_; }

    /// Move bytes client -> inbound pipe -> backend.
    /// After terminate() this reports Complete without touching anything.
    TransferResult transferClientToBackend();

    /// Move bytes backend -> outbound pipe -> client.
    TransferResult transferBackendToClient();

    /// First call deregisters both sockets from `poller` and marks the
    /// connection closed, returning true; the caller then releases the two
    /// Poll Descriptors. Later calls do nothing and return false.
    bool terminate(Poller& poller);

    bool isClosed() const { return closed_; }

    const PipeBuffer& inbound() const { return inbound_; }
    const PipeBuffer& outbound() const { return outbound_; }

private:
    int clientFd_;
    int backendFd_;
    PipeBuffer inbound_;   // client -> backend
    PipeBuffer outbound_;  // backend -> client
    bool closed_ = false;
};
