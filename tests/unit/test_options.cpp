/// Unit tests for startup configuration: option parsing and "host:port"
/// resolution.
///
/// Test framework: lightweight macros — no external dependencies.

#include "net/SocketAddress.h"
#include "proxy/Options.h"

#include <cstdio>
#include <stdexcept>
#include <string>

// ── Minimal test harness ───────────────────────────────────────────────────
static int g_pass = 0;
static int g_fail = 0;

#define EXPECT(cond)                                                         \
    do {                                                                     \
        if (!(cond)) {                                                       \
            std::printf("  FAILED: %s  (%s:%d)\n", #cond, __FILE__,         \
                        __LINE__);                                           \
            return false;                                                    \
        }                                                                    \
    } while (0)

#define RUN(fn)                                                              \
    do {                                                                     \
        if (fn()) {                                                          \
            g_pass++;                                                        \
            std::printf("[PASS] %s\n", #fn);                                 \
        } else {                                                             \
            g_fail++;                                                        \
            std::printf("[FAIL] %s\n", #fn);                                 \
        }                                                                    \
    } while (0)

template <typename Ex, typename Fn>
static bool throws(Fn fn) {
    try {
        fn();
    } catch (const Ex&) {
        return true;
    }
    return false;
}

// ── Options ────────────────────────────────────────────────────────────────

/// No arguments: listen on :8080, forward to 127.0.0.1:9090.
static bool test_defaults() {
    const char* argv[] = {"spliceproxy"};
    Options o = parseOptions(1, argv);
    EXPECT(o.listen == ":8080");
    EXPECT(o.backend == "127.0.0.1:9090");
    EXPECT(!o.help);
    return true;
}

static bool test_listen_and_backend_flags() {
    const char* argv[] = {"spliceproxy", "-l", "127.0.0.1:7000",
                          "-d", "10.0.0.2:80"};
    Options o = parseOptions(5, argv);
    EXPECT(o.listen == "127.0.0.1:7000");
    EXPECT(o.backend == "10.0.0.2:80");
    return true;
}

/// A flag at the end with no value is a configuration error.
static bool test_missing_value_throws() {
    const char* argv1[] = {"spliceproxy", "-l"};
    const char* argv2[] = {"spliceproxy", "-l", ":1", "-d"};
    EXPECT(throws<std::invalid_argument>([&] { parseOptions(2, argv1); }));
    EXPECT(throws<std::invalid_argument>([&] { parseOptions(4, argv2); }));
    return true;
}

static bool test_unknown_option_throws() {
    const char* argv[] = {"spliceproxy", "-x"};
    EXPECT(throws<std::invalid_argument>([&] { parseOptions(2, argv); }));
    return true;
}

static bool test_help_flag() {
    const char* argv[] = {"spliceproxy", "-h"};
    EXPECT(parseOptions(2, argv).help);
    EXPECT(usage("spliceproxy").find("-l <listen>") != std::string::npos);
    return true;
}

// ── SocketAddress ──────────────────────────────────────────────────────────

static bool test_resolve_numeric() {
    SocketAddress a = resolveFirst("127.0.0.1:9090", AF_INET, false);
    EXPECT(a.family() == AF_INET);
    EXPECT(a.port() == 9090);
    EXPECT(a.toString() == "127.0.0.1:9090");
    return true;
}

/// Empty host on the listen side means every interface.
static bool test_resolve_wildcard_listen() {
    SocketAddress a = resolveFirst(":8080", AF_INET, true);
    EXPECT(a.toString() == "0.0.0.0:8080");
    return true;
}

static bool test_resolve_missing_port_throws() {
    EXPECT(throws<std::invalid_argument>(
        [] { resolveFirst("127.0.0.1", AF_INET, false); }));
    EXPECT(throws<std::invalid_argument>(
        [] { resolveFirst("127.0.0.1:", AF_INET, false); }));
    return true;
}

static bool test_resolve_garbage_throws() {
    EXPECT(throws<std::runtime_error>(
        [] { resolveFirst("127.0.0.1:no-such-service", AF_INET, false); }));
    return true;
}

// ── Main ───────────────────────────────────────────────────────────────────

int main() {
    std::printf("=== Options / SocketAddress unit tests ===\n");

    RUN(test_defaults);
    RUN(test_listen_and_backend_flags);
    RUN(test_missing_value_throws);
    RUN(test_unknown_option_throws);
    RUN(test_help_flag);
    RUN(test_resolve_numeric);
    RUN(test_resolve_wildcard_listen);
    RUN(test_resolve_missing_port_throws);
    RUN(test_resolve_garbage_throws);

    std::printf("\nResults: %d passed, %d failed\n", g_pass, g_fail);
    return g_fail > 0 ? 1 : 0;
}
