#pragma once

class ConnectionTable;
class Listener;
struct ProxyContext;

/// Turns pending inbound connections into registered Connections.
///
/// For each accepted client it starts a non-blocking connect to the backend,
/// stores a Connection in the table, and registers both sockets with the
/// poller (readable + writable, edge-triggered) under their Poll Descriptor
/// tokens. A backend connect that fails immediately closes the client and
/// creates nothing.
class Acceptor {
public:
    Acceptor(const ProxyContext& ctx, Listener& listener, ConnectionTable& table);

    Acceptor(const Acceptor&) = delete;
    Acceptor& operator=(const Acceptor&) = delete;

    /// Accept until the backlog is empty. Returns the number of Connections
    /// created. Throws std::system_error if registration with the poller
    /// fails.
    int onReadable();

private:
    bool associate(int clientFd);

    const ProxyContext& ctx_;
    Listener& listener_;
    ConnectionTable& table_;
};
