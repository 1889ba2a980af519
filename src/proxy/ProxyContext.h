#pragma once

#include "net/SocketAddress.h"

#include <cstddef>

class Poller;

/// Process-wide state fixed at startup and shared read-only by the
/// Acceptor and the EventLoop.
struct ProxyContext {
    Poller& poller;
    SocketAddress backend;  // where every accepted client is forwarded
    size_t pipeCapacity;    // from probePipeCapacity()
};
