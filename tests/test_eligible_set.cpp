#include "core/eligible_set.h"
#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>

using curator::core::EligibleSet;
using curator::core::SeedId;

static void testInsertIsIdempotent() {
    EligibleSet set;
    assert(set.empty());
    assert(set.insert(1));
    assert(set.insert(2));
    assert(!set.insert(1));
    assert(set.size() == 2);
    assert(set.contains(1));
    assert(!set.contains(3));
}

static void testRemoveSwapsLastIntoSlot() {
    EligibleSet set;
    for (SeedId id = 1; id <= 4; id++) set.insert(id);

    assert(set.remove(2));
    assert(!set.remove(2));
    assert(set.size() == 3);
    assert(!set.contains(2));

    // 4 moved into the slot 2 left behind.
    const auto& ids = set.ids();
    assert(ids[0] == 1);
    assert(ids[1] == 4);
    assert(ids[2] == 3);

    auto sorted = set.sorted();
    assert(sorted.size() == 3);
    assert(sorted[0] == 1 && sorted[1] == 3 && sorted[2] == 4);
}

static void testRemoveLastAndReinsert() {
    EligibleSet set;
    set.insert(7);
    assert(set.remove(7));
    assert(set.empty());
    assert(set.insert(7));
    assert(set.contains(7));
    set.clear();
    assert(set.empty());
    assert(!set.contains(7));
}

static void testPaging() {
    EligibleSet set;
    for (SeedId id = 1; id <= 10; id++) set.insert(id);

    auto first = set.page(0, 3);
    assert(first.size() == 3);
    assert(first[0] == 1 && first[2] == 3);

    auto tail = set.page(8, 5);
    assert(tail.size() == 2);
    assert(tail[1] == 10);

    assert(set.page(10, 5).empty());
    assert(set.page(3, 0).empty());

    auto huge = set.page(4, std::numeric_limits<size_t>::max());
    assert(huge.size() == 6);
    assert(set.page(std::numeric_limits<size_t>::max(), 2).empty());
}

int main() {
    testInsertIsIdempotent();
    testRemoveSwapsLastIntoSlot();
    testRemoveLastAndReinsert();
    testPaging();
    std::cout << "Eligible set tests passed" << std::endl;
    return 0;
}
