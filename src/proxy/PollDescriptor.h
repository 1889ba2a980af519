#pragma once

#include "proxy/ConnectionTable.h"

#include <cstdint>

/// Token registered for the listening socket. No PollDescriptor encodes to 0.
constexpr uint64_t kListenerToken = 0;

/// Which endpoint of a Connection a registration stands for.
enum class Role : uint8_t {
    ClientSide  = 0,
    BackendSide = 1
};

/// The correlation record behind every socket registration: which
/// Connection, and which of its two sockets.
///
/// It travels through epoll as a 64-bit token:
///   bits 63..32  handle generation
///   bits 31..1   handle index + 1
///   bit  0       role
/// Decoding is free and never dereferences anything; the handle is checked
/// against the ConnectionTable before use.
struct PollDescriptor {
    Role role = Role::ClientSide;
    ConnectionHandle conn;

    uint64_t token() const {
        return (static_cast<uint64_t>(conn.generation) << 32) |
               (static_cast<uint64_t>(conn.index + 1) << 1) |
               static_cast<uint64_t>(role);
    }

    static PollDescriptor fromToken(uint64_t token) {
        PollDescriptor pd;
        pd.role = (token & 1) ? Role::BackendSide : Role::ClientSide;
        pd.conn.index = static_cast<uint32_t>((token & 0xffffffffULL) >> 1) - 1;
        pd.conn.generation = static_cast<uint32_t>(token >> 32);
        return pd;
    }
};
