#pragma once

#include "proxy/Acceptor.h"
#include "proxy/ConnectionTable.h"
#include "proxy/PollDescriptor.h"

#include <cstdint>
#include <vector>

class Listener;
struct ProxyContext;

/// The proxy's single control thread.
///
/// One iteration = one batch from Poller::wait(). Events are handled in the
/// order the poller returns them; listener events go to the Acceptor, all
/// others are decoded into a PollDescriptor and routed to its Connection.
/// Connections that reach a terminal state are only recorded during the
/// batch and terminated once it ends, because the other socket of the same
/// Connection may still have an event later in the batch.
///
/// Must NOT know about: address resolution, option parsing.
class EventLoop {
public:
    /// Registers the listening socket under kListenerToken.
    EventLoop(const ProxyContext& ctx, Listener& listener);

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /// Serve forever. Only returns by exception (process-fatal errors).
    void run();

    /// Run one batch: wait, dispatch, tear down. Returns the batch size.
    int runOnce(int timeoutMs = -1);

    const ConnectionTable& connections() const { return table_; }

private:
    void dispatch(uint64_t token, uint32_t events);
    void schedule(ConnectionHandle h);
    bool isScheduled(ConnectionHandle h) const;
    void teardownScheduled();

    const ProxyContext& ctx_;
    ConnectionTable table_;
    Acceptor acceptor_;
    std::vector<ConnectionHandle> pending_;  // terminal in this batch, deduplicated
};
