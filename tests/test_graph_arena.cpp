// Generational arena: stale addresses never alias a reused slot.

#undef NDEBUG
#include <cassert>
#include <cstdio>
#include <string>
#include <vector>

#include "GraphArena.hpp"

namespace {

void testInsertGetRemove() {
    GraphArena<std::string> arena;
    const NodeAddress a = arena.insert("a");
    const NodeAddress b = arena.insert("b");

    assert(arena.size() == 2);
    assert(a != b);
    assert(arena.get(a) && *arena.get(a) == "a");
    assert(arena.get(b) && *arena.get(b) == "b");

    auto removed = arena.remove(a);
    assert(removed && *removed == "a");
    assert(!arena.contains(a));
    assert(arena.get(a) == nullptr);
    assert(!arena.remove(a));

    // Other addresses are unaffected.
    assert(arena.get(b) && *arena.get(b) == "b");
    assert(arena.size() == 1);
}

void testSlotReuseBumpsGeneration() {
    GraphArena<int> arena;
    const NodeAddress first = arena.insert(1);
    arena.remove(first);

    const NodeAddress second = arena.insert(2);
    assert(second.slot == first.slot);
    assert(second.generation != first.generation);
    assert(!arena.contains(first));
    assert(arena.get(first) == nullptr);
    assert(*arena.get(second) == 2);
    assert(arena.capacity() == 1);
}

void testRemoveFromMiddleThenInsert() {
    GraphArena<int> arena;
    std::vector<NodeAddress> before;
    for (int i = 0; i < 8; ++i) before.push_back(arena.insert(i));

    arena.remove(before[3]);
    const NodeAddress added = arena.insert(100);

    for (const NodeAddress& old : before) assert(added != old);
    assert(added.slot == before[3].slot);
    assert(!arena.contains(before[3]));
    for (int i = 0; i < 8; ++i) {
        if (i == 3) continue;
        assert(arena.get(before[i]) && *arena.get(before[i]) == i);
    }
    assert(*arena.get(added) == 100);
    assert(arena.size() == 8);
}

void testDefaultAddressIsInvalid() {
    GraphArena<int> arena;
    arena.insert(7);
    assert(!arena.contains(NodeAddress{}));
}

void testForEachVisitsLiveSlotsInOrder() {
    GraphArena<int> arena;
    const NodeAddress a = arena.insert(10);
    arena.insert(20);
    arena.insert(30);
    arena.remove(a);

    int sum = 0;
    int visits = 0;
    arena.forEach([&](NodeAddress, int& v) { sum += v; ++visits; });
    assert(visits == 2);
    assert(sum == 50);

    const auto addrs = arena.addresses();
    assert(addrs.size() == 2);
    assert(addrs[0].slot < addrs[1].slot);

    arena.clear();
    assert(arena.empty());
}

void testAddressBits() {
    const NodeAddress a{5, 9};
    const auto back = NodeAddress::fromBits(a.toBits());
    assert(back && *back == a);
    assert(a.toBits() == ((uint64_t(9) << 32) | 5u));

    // Generation 0 is never issued.
    assert(!NodeAddress::fromBits(5u));
}

}  // namespace

int main() {
    testInsertGetRemove();
    testSlotReuseBumpsGeneration();
    testRemoveFromMiddleThenInsert();
    testDefaultAddressIsInvalid();
    testForEachVisitsLiveSlotsInOrder();
    testAddressBits();
    std::printf("test_graph_arena: PASS\n");
    return 0;
}
