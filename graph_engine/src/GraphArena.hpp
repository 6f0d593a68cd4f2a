// GraphArena.hpp — generational-index storage for graph entries
//
// Every entry lives in a slot. A NodeAddress is (slot, generation). When an
// entry is removed its slot goes on a free list and the slot's generation
// is bumped, so an address handed out before the removal can never alias
// the entry that later reuses the slot: lookups compare generations and a
// stale address simply resolves to nothing.
//
// Addresses of other entries are unaffected by insert/remove — entries are
// never moved between slots. Iteration visits live slots in slot order.
//
// Generations start at 1 so that a default-constructed NodeAddress
// (generation 0) is never valid.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

// ─────────────────────────────────────────────────────────────────────────────
// NodeAddress
// ─────────────────────────────────────────────────────────────────────────────

struct NodeAddress {
    uint32_t slot       = 0;
    uint32_t generation = 0;

    /// Pack into 64 bits: slot in the low half, generation in the high half.
    uint64_t toBits() const {
        return (static_cast<uint64_t>(generation) << 32) | static_cast<uint64_t>(slot);
    }

    /// Inverse of toBits(). Generation 0 is never issued, so it is rejected.
    static std::optional<NodeAddress> fromBits(uint64_t bits) {
        NodeAddress a;
        a.slot       = static_cast<uint32_t>(bits & 0xFFFFFFFFu);
        a.generation = static_cast<uint32_t>(bits >> 32);
        if (a.generation == 0) return std::nullopt;
        return a;
    }

    bool operator==(const NodeAddress& o) const {
        return slot == o.slot && generation == o.generation;
    }
    bool operator!=(const NodeAddress& o) const { return !(*this == o); }
    bool operator<(const NodeAddress& o) const { return toBits() < o.toBits(); }
};

namespace std {
template <>
struct hash<NodeAddress> {
    size_t operator()(const NodeAddress& a) const noexcept {
        return std::hash<uint64_t>()(a.toBits());
    }
};
}  // namespace std

// ─────────────────────────────────────────────────────────────────────────────
// GraphArena<T>
// ─────────────────────────────────────────────────────────────────────────────

template <typename T>
class GraphArena {
public:

    GraphArena() = default;

    /// Store a value and return its address. Reuses the most recently freed
    /// slot if there is one.
    NodeAddress insert(T value) {
        uint32_t slotIndex;
        if (!mFreeSlots.empty()) {
            slotIndex = mFreeSlots.back();
            mFreeSlots.pop_back();
        } else {
            slotIndex = static_cast<uint32_t>(mSlots.size());
            mSlots.emplace_back();
        }

        Slot& slot = mSlots[slotIndex];
        slot.value.emplace(std::move(value));
        ++mLive;
        return NodeAddress{slotIndex, slot.generation};
    }

    /// Remove the entry at `address`. Returns the removed value, or nullopt
    /// if the address is stale or out of range.
    std::optional<T> remove(NodeAddress address) {
        if (!contains(address)) return std::nullopt;

        Slot& slot = mSlots[address.slot];
        std::optional<T> out(std::move(*slot.value));
        slot.value.reset();
        ++slot.generation;
        if (slot.generation == 0) slot.generation = 1;  // wrapped
        mFreeSlots.push_back(address.slot);
        --mLive;
        return out;
    }

    bool contains(NodeAddress address) const {
        return address.slot < mSlots.size() &&
               mSlots[address.slot].generation == address.generation &&
               mSlots[address.slot].value.has_value();
    }

    T* get(NodeAddress address) {
        return contains(address) ? &*mSlots[address.slot].value : nullptr;
    }

    const T* get(NodeAddress address) const {
        return contains(address) ? &*mSlots[address.slot].value : nullptr;
    }

    /// Number of live entries.
    size_t size() const { return mLive; }
    bool empty() const { return mLive == 0; }

    /// Number of slots ever allocated (live + free). Upper bound on slot
    /// indices, used to size per-slot side tables.
    size_t capacity() const { return mSlots.size(); }

    void clear() {
        for (uint32_t i = 0; i < mSlots.size(); ++i) {
            if (mSlots[i].value) remove(NodeAddress{i, mSlots[i].generation});
        }
    }

    /// Visit every live entry in slot order.
    template <typename Fn>
    void forEach(Fn&& fn) {
        for (uint32_t i = 0; i < mSlots.size(); ++i) {
            Slot& slot = mSlots[i];
            if (slot.value) fn(NodeAddress{i, slot.generation}, *slot.value);
        }
    }

    template <typename Fn>
    void forEach(Fn&& fn) const {
        for (uint32_t i = 0; i < mSlots.size(); ++i) {
            const Slot& slot = mSlots[i];
            if (slot.value) fn(NodeAddress{i, slot.generation}, *slot.value);
        }
    }

    std::vector<NodeAddress> addresses() const {
        std::vector<NodeAddress> out;
        out.reserve(mLive);
        forEach([&out](NodeAddress a, const T&) { out.push_back(a); });
        return out;
    }

private:

    struct Slot {
        uint32_t         generation = 1;
        std::optional<T> value;
    };

    std::vector<Slot>     mSlots;
    std::vector<uint32_t> mFreeSlots;
    size_t                mLive = 0;
};
