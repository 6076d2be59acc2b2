#include <cassert>
#include <iostream>
#include <vector>

#include "domain/TaskGraph.hpp"

using namespace taskweave::domain;

namespace {

std::vector<Handle> Handles(const std::vector<TraversalEntry>& entries) {
    std::vector<Handle> out;
    for (const auto& e : entries) out.push_back(e.handle);
    return out;
}

std::vector<std::size_t> Depths(const std::vector<TraversalEntry>& entries) {
    std::vector<std::size_t> out;
    for (const auto& e : entries) out.push_back(e.depth);
    return out;
}

void TestClean() {
    std::cout << "[Test] Clean remaps handles densely..." << std::endl;
    TaskGraph g;
    Handle a = g.insertRoot("A");
    Handle b = g.insertChild("B", a);
    Handle c = g.insertChild("C", a);
    Handle d = g.insertChild("D", c);
    Handle day = g.insertDate(CalendarDate{2024, 7, 4});
    g.setAlias(d, "d");
    g.setArchived(c, true);
    g.remove(b);

    assert(g.slotCount() == 5);
    g.clean();

    assert(g.slotCount() == 4);
    assert(g.nodeCount() == 4);
    (void)day;
    // A=0, C=1, D=2, date=3
    assert(g.node(0).getTitle() == "A");
    assert(g.node(1).getTitle() == "C");
    assert(g.node(2).getTitle() == "D");
    assert(g.node(3).isDate());
    for (Handle h = 0; h < g.slotCount(); ++h) {
        assert(g.node(h).getIndex() == h);
    }
    assert(g.node(0).getMetadata().children == std::vector<Handle>{1});
    assert(g.node(1).getMetadata().parents == std::vector<Handle>{0});
    assert(g.node(1).getMetadata().children == std::vector<Handle>{2});
    assert(g.aliases().at("d") == 2);
    assert(g.archived() == std::vector<Handle>{1});
    assert(g.dates().at("2024-07-04") == 3);
    assert(g.roots() == std::vector<Handle>{0});

    TaskGraph again = g;
    again.clean();
    assert(again == g);
}

void TestCleanRebuildsAliasIndex() {
    std::cout << "[Test] Clean rebuilds indices from node data..." << std::endl;
    TaskGraph g;
    Handle x = g.insertRoot("X");
    Handle y = g.insertRoot("Y");
    g.setAlias(x, "k");
    g.setAlias(y, "other");
    g.setAlias(x, "k2");
    g.clean();

    assert(g.aliases().size() == 2);
    assert(g.aliases().at("k2") == x);
    assert(g.aliases().at("other") == y);
}

void TestTraverse() {
    std::cout << "[Test] Traversal order, depth and archive filter..." << std::endl;
    TaskGraph g;
    Handle a = g.insertRoot("A");
    Handle b = g.insertChild("B", a);
    Handle c = g.insertChild("C", b);
    Handle d = g.insertChild("D", a);
    Handle s = g.insertChild("Shared", b);
    g.link(d, s);

    auto all = g.traverse({a}, false, 0);
    assert((Handles(all) == std::vector<Handle>{a, b, c, s, d, s}));
    assert((Depths(all) == std::vector<std::size_t>{0, 1, 2, 2, 1, 2}));

    // The limit is inclusive: depth 1 still lists the direct children.
    auto shallow = g.traverse({a}, false, 1);
    assert((Handles(shallow) == std::vector<Handle>{a, b, d}));
    assert((Depths(shallow) == std::vector<std::size_t>{0, 1, 1}));
    assert(g.traverse({a}, false, 2).size() == all.size());

    g.setArchived(b, true);
    assert((Handles(g.traverse({a}, false, 0)) == std::vector<Handle>{a, d, s}));
    assert(g.traverse({a}, true, 0).size() == 6);

    auto fromRoots = g.traverse(g.roots(), false, 0);
    assert(fromRoots.front().handle == a);
}

void TestCycleDetection() {
    std::cout << "[Test] Traversal detects loops..." << std::endl;
    TaskGraph g;
    Handle a = g.insertRoot("A");
    Handle b = g.insertChild("B", a);
    Handle c = g.insertChild("C", b);
    g.link(c, a);

    bool threw = false;
    try {
        g.traverse({a}, true, 0);
    } catch (const CycleDetectedError& e) {
        threw = true;
        assert(e.start() == a);
        assert(e.reentered() == a);
    }
    assert(threw);

    Handle x = g.insertRoot("X");
    g.link(x, b);
    threw = false;
    try {
        g.traverse({x}, true, 0);
    } catch (const CycleDetectedError& e) {
        threw = true;
        assert(e.start() == x);
        assert(e.reentered() == b);
    }
    assert(threw);

    // A depth limit below the loop never reaches it.
    assert(g.traverse({a}, true, 2).size() == 3);
}

} // namespace

int main() {
    std::cout << "[Test] Starting Compaction Test..." << std::endl;

    TestClean();
    TestCleanRebuildsAliasIndex();
    TestTraverse();
    TestCycleDetection();

    std::cout << "[PASS] Compaction Test." << std::endl;
    return 0;
}
