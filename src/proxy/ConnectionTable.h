#pragma once

#include "proxy/Connection.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

/// Stable name for a Connection stored in a ConnectionTable.
/// A handle goes stale when its slot is recycled (generation mismatch).
struct ConnectionHandle {
    uint32_t index = 0;
    uint32_t generation = 0;

    bool operator==(const ConnectionHandle& o) const {
        return index == o.index && generation == o.generation;
    }
    bool operator!=(const ConnectionHandle& o) const { return !(*this == o); }
};

/// Arena of live Connections, addressed by ConnectionHandle.
///
/// Each slot counts its owners. A Connection is owned by its two Poll
/// Descriptors: each retain()s it once at registration and release()s it
/// once at teardown. When the count drops to zero the Connection is
/// destroyed, the slot's generation is bumped and the slot is recycled.
///
/// Only the event loop thread touches the table.
class ConnectionTable {
public:
    ConnectionTable() = default;

    ConnectionTable(const ConnectionTable&) = delete;
    ConnectionTable& operator=(const ConnectionTable&) = delete;

    /// Store a new Connection with zero owners and return its handle.
    ConnectionHandle insert(std::unique_ptr<Connection> conn);

    /// Returns nullptr if the handle is stale.
    Connection* get(ConnectionHandle h) const;

    /// Add one owner. The handle must be live.
    void retain(ConnectionHandle h);

    /// Drop one owner; destroys the Connection when none remain.
    void release(ConnectionHandle h);

    /// Owner count of a live handle, 0 if stale.
    int owners(ConnectionHandle h) const;

    /// Number of live Connections.
    size_t size() const { return live_; }

    /// Handles of every live Connection, in slot order.
    std::vector<ConnectionHandle> handles() const;

private:
    struct Slot {
        std::unique_ptr<Connection> conn;
        uint32_t generation = 1;
        int owners = 0;
    };

    bool isLive(ConnectionHandle h) const;

    std::vector<Slot> slots_;
    std::vector<uint32_t> freeList_;  // recycled slot indices
    size_t live_ = 0;
};
