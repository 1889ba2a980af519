#include "net/Listener.h"

#include <cerrno>
#include <string>
#include <system_error>
#include <sys/socket.h>    // socket, setsockopt, bind, listen, accept4
#include <unistd.h>        // close

Listener::Listener(const SocketAddress& addr) {
    fd_ = ::socket(addr.family(), SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
        throw std::system_error(errno, std::generic_category(), "socket()");
    }

    // Allow address reuse so we can restart quickly after a crash.
    int opt = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (::bind(fd_, addr.addr(), addr.length) < 0) {
        int savedErrno = errno;
        ::close(fd_);
        throw std::system_error(savedErrno, std::generic_category(),
                                "bind(" + addr.toString() + ")");
    }

    if (::listen(fd_, SOMAXCONN) < 0) {
        int savedErrno = errno;
        ::close(fd_);
        throw std::system_error(savedErrno, std::generic_category(),
                                "listen()");
    }
}

Listener::~Listener() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

SocketAddress Listener::localAddress() const {
    SocketAddress out;
    out.length = sizeof(out.storage);
    if (::getsockname(fd_, reinterpret_cast<struct sockaddr*>(&out.storage),
                      &out.length) < 0) {
        throw std::system_error(errno, std::generic_category(),
                                "getsockname()");
    }
    return out;
}

int Listener::acceptClient() {
    // Client fd is born non-blocking and close-on-exec.
    return ::accept4(fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
}
