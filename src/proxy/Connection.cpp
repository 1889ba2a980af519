#include "proxy/Connection.h"

#include "net/Poller.h"

#include <cstdio>
#include <unistd.h>   // close

Connection::Connection(int clientFd, int backendFd, size_t pipeCapacity)
    : clientFd_(clientFd),
      backendFd_(backendFd),
      inbound_(pipeCapacity),
      outbound_(pipeCapacity) {
    std::printf("Connection: new %d+%d\n", clientFd_, backendFd_);
}

Connection::~Connection() {
    std::printf("Connection: drop %d+%d\n", clientFd_, backendFd_);
    ::close(clientFd_);
    ::close(backendFd_);
    // inbound_ and outbound_ release their pipes after this body returns.
}

TransferResult Connection::transferClientToBackend() {
    if (closed_) {
        return {TransferStatus::Complete, 0};
    }
    return inbound_.transfer(clientFd_, backendFd_);
}

TransferResult Connection::transferBackendToClient() {
    if (closed_) {
        return {TransferStatus::Complete, 0};
    }
    return outbound_.transfer(backendFd_, clientFd_);
}

bool Connection::terminate(Poller& poller) {
    if (closed_) {
        return false;
    }
    // Deregister before anything is closed so no event can name a dead fd.
    poller.remove(clientFd_);
    poller.remove(backendFd_);
    closed_ = true;
    return true;
}
