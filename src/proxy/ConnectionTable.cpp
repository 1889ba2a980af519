#include "proxy/ConnectionTable.h"

#include <cassert>
#include <utility>

ConnectionHandle ConnectionTable::insert(std::unique_ptr<Connection> conn) {
    assert(conn != nullptr);
    uint32_t index;
    if (!freeList_.empty()) {
        index = freeList_.back();
        freeList_.pop_back();
    } else {
        index = static_cast<uint32_t>(slots_.size());
        slots_.emplace_back();
    }

    Slot& slot = slots_[index];
    slot.conn = std::move(conn);
    slot.owners = 0;
    ++live_;
    return ConnectionHandle{index, slot.generation};
}

bool ConnectionTable::isLive(ConnectionHandle h) const {
    return h.index < slots_.size() &&
           slots_[h.index].generation == h.generation &&
           slots_[h.index].conn != nullptr;
}

Connection* ConnectionTable::get(ConnectionHandle h) const {
    if (!isLive(h)) {
        return nullptr;
    }
    return slots_[h.index].conn.get();
}

void ConnectionTable::retain(ConnectionHandle h) {
    assert(isLive(h));
    ++slots_[h.index].owners;
}

void ConnectionTable::release(ConnectionHandle h) {
    assert(isLive(h));
    Slot& slot = slots_[h.index];
    // INV: every release pairs with an earlier retain.
    assert(slot.owners > 0);
    if (--slot.owners > 0) {
        return;
    }

    // Last owner gone: close sockets, then pipes (Connection destructor).
    std::unique_ptr<Connection> dead = std::move(slot.conn);
    ++slot.generation;
    freeList_.push_back(h.index);
    --live_;
    dead.reset();
}

int ConnectionTable::owners(ConnectionHandle h) const {
    return isLive(h) ? slots_[h.index].owners : 0;
}

std::vector<ConnectionHandle> ConnectionTable::handles() const {
    std::vector<ConnectionHandle> out;
    out.reserve(live_);
    for (uint32_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].conn != nullptr) {
            out.push_back(ConnectionHandle{i, slots_[i].generation});
        }
    }
    return out;
}
