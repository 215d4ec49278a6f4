#include <cassert>
#include <iostream>
#include <vector>

#include "menukit/core/Navigation.hpp"

using namespace menukit::core;

namespace {

void TestLinkIsSymmetric() {
    NavigationRing ring(2);
    assert(ring.Link(0, 1));
    assert(ring.next(0) == 1u);
    assert(ring.previous(1) == 0u);
    assert(!ring.previous(0).has_value());
    assert(!ring.next(1).has_value());
}

void TestRelinkCutsStaleEnds() {
    NavigationRing ring(3);
    ring.Link(0, 1);
    ring.Link(0, 2);
    assert(ring.next(0) == 2u);
    assert(ring.previous(2) == 0u);
    // 1 no longer claims 0 as its previous.
    assert(!ring.previous(1).has_value());
}

void TestChainWithAndWithoutWrap() {
    NavigationRing open(3);
    open.LinkChain(false);
    assert(open.next(0) == 1u && open.next(1) == 2u);
    assert(!open.next(2).has_value());
    assert(!open.previous(0).has_value());

    NavigationRing ring(3);
    ring.LinkChain(true);
    assert(ring.next(2) == 0u);
    assert(ring.previous(0) == 2u);

    std::vector<std::size_t> visited;
    std::size_t cursor = 0;
    for (int i = 0; i < 4; ++i) {
        visited.push_back(cursor);
        cursor = *ring.next(cursor);
    }
    assert((visited == std::vector<std::size_t>{0, 1, 2, 0}));
}

void TestSingleEntryWrap() {
    NavigationRing ring(1);
    ring.LinkChain(true);
    assert(!ring.next(0).has_value());
}

void TestUnlinkAndBounds() {
    NavigationRing ring(3);
    ring.LinkChain(true);
    ring.Unlink(1);
    assert(!ring.next(0).has_value());
    assert(!ring.previous(2).has_value());
    assert(ring.next(2) == 0u);

    assert(!ring.Link(0, 7));
    assert(!ring.next(9).has_value());
    assert(ring.Append() == 3u);
    assert(ring.size() == 4u);
}

void TestStackCentered() {
    const Rect area{0, 0, 100, 100};
    const std::vector<Size> sizes = {{20, 10}, {40, 20}, {10, 10}};
    const auto corners = StackCentered(area, sizes, 5);
    assert(corners.size() == 3);
    assert(corners[0] == (Point{40, 25}));
    assert(corners[1] == (Point{30, 40}));
    assert(corners[2] == (Point{45, 65}));

    const auto offset = StackCentered(Rect{50, 100, 100, 100}, {{20, 10}}, 5);
    assert(offset[0] == (Point{90, 145}));

    assert(StackCentered(area, {}, 5).empty());
}

}  // namespace

int main() {
    TestLinkIsSymmetric();
    TestRelinkCutsStaleEnds();
    TestChainWithAndWithoutWrap();
    TestSingleEntryWrap();
    TestUnlinkAndBounds();
    TestStackCentered();
    std::cout << "All navigation tests passed.\n";
    return 0;
}
