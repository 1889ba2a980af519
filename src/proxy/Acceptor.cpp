#include "proxy/Acceptor.h"

#include "net/Listener.h"
#include "net/Poller.h"
#include "proxy/ConnectionTable.h"
#include "proxy/PollDescriptor.h"
#include "proxy/ProxyContext.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <system_error>
#include <unistd.h>   // close

Acceptor::Acceptor(const ProxyContext& ctx, Listener& listener,
                   ConnectionTable& table)
    : ctx_(ctx), listener_(listener), table_(table) {}

int Acceptor::onReadable() {
    int created = 0;
    // Edge-triggered: drain the whole backlog.
    while (true) {
        int clientFd = listener_.acceptClient();
        if (clientFd < 0) {
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            // On a hard error (EMFILE, ENFILE) any remaining backlog waits
            // for the next incoming connection to raise a new edge.
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                std::fprintf(stderr, "Acceptor: accept failed: %s\n",
                             std::strerror(errno));
            }
            break;
        }
        std::printf("accept client_fd: %d\n", clientFd);
        if (associate(clientFd)) {
            ++created;
        }
    }
    return created;
}

bool Acceptor::associate(int clientFd) {
    int backendFd = connectTcp(ctx_.backend);
    if (backendFd < 0) {
        int savedErrno = errno;
        std::fprintf(stderr, "Acceptor: connect backend %s failed: %s\n",
                     ctx_.backend.toString().c_str(), std::strerror(savedErrno));
        ::close(clientFd);
        return false;
    }

    std::unique_ptr<Connection> conn;
    try {
        conn = std::make_unique<Connection>(clientFd, backendFd,
                                            ctx_.pipeCapacity);
    } catch (const std::system_error& e) {
        // Out of descriptors for the pipes; drop this client only.
        std::fprintf(stderr, "Acceptor: %s\n", e.what());
        ::close(clientFd);
        ::close(backendFd);
        return false;
    }

    std::printf("associate client_fd %d backend_fd %d\n", clientFd, backendFd);

    ConnectionHandle h = table_.insert(std::move(conn));
    PollDescriptor clientSide{Role::ClientSide, h};
    PollDescriptor backendSide{Role::BackendSide, h};
    table_.retain(h);
    table_.retain(h);

    ctx_.poller.add(clientFd, EPOLLIN | EPOLLOUT, clientSide.token());
    ctx_.poller.add(backendFd, EPOLLIN | EPOLLOUT, backendSide.token());
    return true;
}
