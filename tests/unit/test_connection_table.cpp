/// Unit tests for ConnectionTable and PollDescriptor tokens.
///
/// Verifies the ownership protocol (two owners per Connection, destroyed
/// at the last release) and that recycled slots invalidate old handles.
///
/// Test framework: lightweight macros — no external dependencies.

#include "proxy/ConnectionTable.h"
#include "proxy/PollDescriptor.h"
#include "SocketTestUtil.h"

#include <cstdio>
#include <memory>
#include <sys/socket.h>

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

/// A Connection over a throwaway socketpair. The table owns it afterwards.
static std::unique_ptr<Connection> makeConnection(int& clientFd, int& backendFd) {
    int sv[2];
    ::socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK, 0, sv);
    clientFd = sv[0];
    backendFd = sv[1];
    return std::make_unique<Connection>(clientFd, backendFd, 4096);
}

// ── Tests ──────────────────────────────────────────────────────────────────

/// Fresh table is empty and every handle is stale.
static bool test_empty_table() {
    ConnectionTable table;
    EXPECT(table.size() == 0);
    EXPECT(table.get(ConnectionHandle{0, 1}) == nullptr);
    EXPECT(table.owners(ConnectionHandle{0, 1}) == 0);
    EXPECT(table.handles().empty());
    return true;
}

/// insert() returns a live handle resolving to the same Connection.
static bool test_insert_and_get() {
    ConnectionTable table;
    int c = -1, b = -1;
    auto conn = makeConnection(c, b);
    Connection* raw = conn.get();

    ConnectionHandle h = table.insert(std::move(conn));
    EXPECT(table.size() == 1);
    EXPECT(table.get(h) == raw);
    EXPECT(table.get(h)->clientFd() == c);
    EXPECT(table.owners(h) == 0);

    table.retain(h);
    table.release(h);  // owner count back to 0 -> destroyed
    EXPECT(table.size() == 0);
    return true;
}

/// Two owners: the first release keeps it alive, the second destroys it
/// and closes its sockets.
static bool test_last_release_destroys() {
    ConnectionTable table;
    int c = -1, b = -1;
    ConnectionHandle h = table.insert(makeConnection(c, b));
    table.retain(h);
    table.retain(h);
    EXPECT(table.owners(h) == 2);

    table.release(h);
    EXPECT(table.owners(h) == 1);
    EXPECT(table.get(h) != nullptr);
    EXPECT(isOpen(c));

    table.release(h);
    EXPECT(table.get(h) == nullptr);
    EXPECT(table.size() == 0);
    EXPECT(!isOpen(c));
    EXPECT(!isOpen(b));
    return true;
}

/// A recycled slot gets a new generation; the old handle stays stale.
static bool test_recycled_slot_invalidates_old_handle() {
    ConnectionTable table;
    int c = -1, b = -1;
    ConnectionHandle first = table.insert(makeConnection(c, b));
    table.retain(first);
    table.release(first);

    ConnectionHandle second = table.insert(makeConnection(c, b));
    EXPECT(second.index == first.index);
    EXPECT(second.generation != first.generation);
    EXPECT(table.get(first) == nullptr);
    EXPECT(table.get(second) != nullptr);
    EXPECT(first != second);

    table.retain(second);
    table.release(second);
    return true;
}

/// Independent connections don't affect each other's owner counts.
static bool test_independent_connections() {
    ConnectionTable table;
    int c1 = -1, b1 = -1, c2 = -1, b2 = -1;
    ConnectionHandle h1 = table.insert(makeConnection(c1, b1));
    ConnectionHandle h2 = table.insert(makeConnection(c2, b2));
    table.retain(h1);
    table.retain(h1);
    table.retain(h2);
    table.retain(h2);
    EXPECT(table.size() == 2);
    EXPECT(table.handles().size() == 2);

    table.release(h1);
    table.release(h1);
    EXPECT(table.size() == 1);
    EXPECT(table.get(h1) == nullptr);
    EXPECT(table.get(h2) != nullptr);
    EXPECT(table.owners(h2) == 2);
    EXPECT(isOpen(c2));

    auto live = table.handles();
    EXPECT(live.size() == 1);
    EXPECT(live[0] == h2);

    table.release(h2);
    table.release(h2);
    return true;
}

/// Tokens never collide with the listener token and decode to the same
/// role and handle they were built from.
static bool test_poll_descriptor_tokens() {
    ConnectionHandle h{0, 1};
    PollDescriptor client{Role::ClientSide, h};
    PollDescriptor backend{Role::BackendSide, h};

    EXPECT(client.token() != kListenerToken);
    EXPECT(backend.token() != kListenerToken);
    EXPECT(client.token() != backend.token());

    PollDescriptor d = PollDescriptor::fromToken(backend.token());
    EXPECT(d.role == Role::BackendSide);
    EXPECT(d.conn == h);

    // Large index and generation survive the packing.
    ConnectionHandle big{0x7ffffffe, 0xfffffff0};
    PollDescriptor far{Role::ClientSide, big};
    PollDescriptor back = PollDescriptor::fromToken(far.token());
    EXPECT(back.role == Role::ClientSide);
    EXPECT(back.conn == big);
    return true;
}

/// A token minted before its slot was recycled resolves to nothing.
static bool test_stale_token_resolves_to_null() {
    ConnectionTable table;
    int c = -1, b = -1;
    ConnectionHandle h = table.insert(makeConnection(c, b));
    uint64_t token = PollDescriptor{Role::ClientSide, h}.token();
    table.retain(h);
    table.release(h);

    ConnectionHandle reused = table.insert(makeConnection(c, b));
    PollDescriptor old = PollDescriptor::fromToken(token);
    EXPECT(table.get(old.conn) == nullptr);
    EXPECT(table.get(reused) != nullptr);

    table.retain(reused);
    table.release(reused);
    return true;
}

// ── Main ───────────────────────────────────────────────────────────────────

int main() {
    std::printf("=== ConnectionTable unit tests ===\n");

    RUN(test_empty_table);
    RUN(test_insert_and_get);
    RUN(test_last_release_destroys);
    RUN(test_recycled_slot_invalidates_old_handle);
    RUN(test_independent_connections);
    RUN(test_poll_descriptor_tokens);
    RUN(test_stale_token_resolves_to_null);

    std::printf("\nResults: %d passed, %d failed\n", g_pass, g_fail);
    return g_fail > 0 ? 1 : 0;
}
