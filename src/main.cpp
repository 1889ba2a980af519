#include "net/Listener.h"
#include "net/PipeBuffer.h"
#include "net/Poller.h"
#include "net/SocketAddress.h"
#include "proxy/EventLoop.h"
#include "proxy/Options.h"
#include "proxy/ProxyContext.h"

#include <csignal>
#include <cstdio>
#include <exception>
#include <stdexcept>
#include <sys/resource.h>  // setrlimit
#include <sys/socket.h>    // AF_INET

int main(int argc, char* argv[]) {
    // ── Parse arguments ────────────────────────────────────────────────
    Options opts;
    try {
        opts = parseOptions(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::fprintf(stderr, "%s\n%s", e.what(), usage(argv[0]).c_str());
        return 2;
    }
    if (opts.help) {
        std::printf("%s", usage(argv[0]).c_str());
        return 0;
    }

    // ── Signal setup ───────────────────────────────────────────────────
    // splice() into a reset socket raises SIGPIPE; we want EPIPE instead.
    std::signal(SIGPIPE, SIG_IGN);

    // ── Raise fd limit: each connection holds 2 sockets + 2 pipes ──────
    {
        struct rlimit rl{};
        rl.rlim_cur = 65536;
        rl.rlim_max = 65536;
        if (::setrlimit(RLIMIT_NOFILE, &rl) != 0) {
            // Fallback: at least raise the soft limit to the current hard limit.
            ::getrlimit(RLIMIT_NOFILE, &rl);
            rl.rlim_cur = rl.rlim_max;
            ::setrlimit(RLIMIT_NOFILE, &rl);
        }
    }

    try {
        size_t pipeCapacity = probePipeCapacity();

        SocketAddress backend    = resolveFirst(opts.backend, AF_INET, false);
        SocketAddress listenAddr = resolveFirst(opts.listen, AF_INET, true);

        // ── Create poller + listener + event loop ──────────────────────
        Poller   poller;
        Listener listener(listenAddr);

        ProxyContext ctx{poller, backend, pipeCapacity};
        EventLoop    loop(ctx, listener);

        std::printf("listen %s\n", listener.localAddress().toString().c_str());
        std::printf("backend %s\n", backend.toString().c_str());
        std::printf("pipe capacity %zu\n", pipeCapacity);

        loop.run();
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Fatal: %s\n", e.what());
        return 1;
    }
    return 0;
}
