#include "net/SocketAddress.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <arpa/inet.h>     // inet_ntop, ntohs
#include <netdb.h>         // getaddrinfo
#include <netinet/in.h>    // sockaddr_in, sockaddr_in6
#include <unistd.h>        // close

std::string SocketAddress::toString() const {
    char host[INET6_ADDRSTRLEN] = {};
    if (family() == AF_INET) {
        const auto* sin = reinterpret_cast<const struct sockaddr_in*>(&storage);
        ::inet_ntop(AF_INET, &sin->sin_addr, host, sizeof(host));
        return std::string(host) + ":" + std::to_string(port());
    }
    if (family() == AF_INET6) {
        const auto* sin6 = reinterpret_cast<const struct sockaddr_in6*>(&storage);
        ::inet_ntop(AF_INET6, &sin6->sin6_addr, host, sizeof(host));
        return "[" + std::string(host) + "]:" + std::to_string(port());
    }
    return "<unspecified>";
}

int SocketAddress::port() const {
    if (family() == AF_INET) {
        return ntohs(reinterpret_cast<const struct sockaddr_in*>(&storage)->sin_port);
    }
    if (family() == AF_INET6) {
        return ntohs(reinterpret_cast<const struct sockaddr_in6*>(&storage)->sin6_port);
    }
    return 0;
}

SocketAddress resolveFirst(const std::string& hostPort, int family,
                           bool passive) {
    size_t colon = hostPort.rfind(':');
    if (colon == std::string::npos) {
        throw std::invalid_argument("missing service in address '" +
                                    hostPort + "'");
    }
    std::string host = hostPort.substr(0, colon);
    std::string port = hostPort.substr(colon + 1);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    if (port.empty()) {
        throw std::invalid_argument("missing service in address '" +
                                    hostPort + "'");
    }

    struct addrinfo hints{};
    hints.ai_family   = family;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags    = passive ? AI_PASSIVE : 0;

    struct addrinfo* res = nullptr;
    int rc = ::getaddrinfo(host.empty() ? nullptr : host.c_str(),
                           port.c_str(), &hints, &res);
    if (rc != 0) {
        throw std::runtime_error("cannot resolve '" + hostPort +
                                 "': " + ::gai_strerror(rc));
    }

    SocketAddress out;
    for (struct addrinfo* p = res; p != nullptr; p = p->ai_next) {
        if ((p->ai_family == AF_INET || p->ai_family == AF_INET6) &&
            p->ai_addrlen <= sizeof(out.storage)) {
            std::memcpy(&out.storage, p->ai_addr, p->ai_addrlen);
            out.length = p->ai_addrlen;
            break;
        }
    }
    ::freeaddrinfo(res);

    if (out.length == 0) {
        throw std::runtime_error("nothing resolved for '" + hostPort + "'");
    }
    return out;
}

int connectTcp(const SocketAddress& addr) {
    int fd = ::socket(addr.family(), SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return -1;
    }
    if (::connect(fd, addr.addr(), addr.length) < 0 && errno != EINPROGRESS) {
        int savedErrno = errno;
        ::close(fd);
        errno = savedErrno;
        return -1;
    }
    return fd;
}
