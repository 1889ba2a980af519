#include "proxy/EventLoop.h"

#include "net/Listener.h"
#include "net/Poller.h"
#include "proxy/ProxyContext.h"

#include <algorithm>
#include <cstdio>
#include <cstring>

static void logTerminal(const char* side, const Connection& conn,
                        const TransferResult& r) {
    if (r.status == TransferStatus::Failed) {
        std::fprintf(stderr, "EventLoop: copy data failed on %s (%d+%d): %s\n",
                     side, conn.clientFd(), conn.backendFd(),
                     std::strerror(r.error));
    } else {
        std::printf("EventLoop: stream complete on %s (%d+%d)\n",
                    side, conn.clientFd(), conn.backendFd());
    }
}

EventLoop::EventLoop(const ProxyContext& ctx, Listener& listener)
    : ctx_(ctx), table_(), acceptor_(ctx, listener, table_) {
    ctx_.poller.add(listener.fd(), EPOLLIN, kListenerToken);
}

void EventLoop::run() {
    while (true) {
        runOnce(-1);
    }
}

int EventLoop::runOnce(int timeoutMs) {
    int n = ctx_.poller.wait(timeoutMs);
    for (int i = 0; i < n; ++i) {
        const auto& ev = ctx_.poller.event(i);
        dispatch(ev.data.u64, ev.events);
    }
    teardownScheduled();
    return n;
}

void EventLoop::dispatch(uint64_t token, uint32_t events) {
    // ── Listener event: accept new connections ─────────────────────────
    if (token == kListenerToken) {
        acceptor_.onReadable();
        return;
    }

    // ── Connection event ───────────────────────────────────────────────
    PollDescriptor pd = PollDescriptor::fromToken(token);
    if (isScheduled(pd.conn)) {
        return;  // already terminal this batch; don't touch it again
    }
    Connection* conn = table_.get(pd.conn);
    if (conn == nullptr) {
        std::fprintf(stderr, "EventLoop: stale token %#llx\n",
                     static_cast<unsigned long long>(token));
        return;
    }

    bool client = pd.role == Role::ClientSide;

    // Readable: this socket is the source of one direction.
    if (events & (EPOLLIN | EPOLLERR | EPOLLRDHUP)) {
        TransferResult r = client ? conn->transferClientToBackend()
                                  : conn->transferBackendToClient();
        if (r.terminal()) {
            logTerminal("IN", *conn, r);
            schedule(pd.conn);
            return;
        }
    }

    // Writable: this socket is the destination of the other direction.
    if (events & (EPOLLOUT | EPOLLERR | EPOLLHUP)) {
        TransferResult r = client ? conn->transferBackendToClient()
                                  : conn->transferClientToBackend();
        if (r.terminal()) {
            logTerminal("OUT", *conn, r);
            schedule(pd.conn);
        }
    }
}

bool EventLoop::isScheduled(ConnectionHandle h) const {
    return std::find(pending_.begin(), pending_.end(), h) != pending_.end();
}

void EventLoop::schedule(ConnectionHandle h) {
    if (!isScheduled(h)) {
        pending_.push_back(h);
    }
}

void EventLoop::teardownScheduled() {
    for (ConnectionHandle h : pending_) {
        Connection* conn = table_.get(h);
        if (conn == nullptr || !conn->terminate(ctx_.poller)) {
            continue;
        }
        // Release both Poll Descriptors; the second one destroys the
        // Connection (sockets, then pipes).
        table_.release(h);  // ClientSide
        table_.release(h);  // BackendSide
    }
    pending_.clear();
}
