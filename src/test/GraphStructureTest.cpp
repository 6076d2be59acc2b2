#include <cassert>
#include <iostream>
#include <vector>

#include "domain/TaskGraph.hpp"

using namespace taskweave::domain;

namespace {

// Every parent/child reference must be mirrored on the other side.
void AssertEdgesSymmetric(const TaskGraph& graph) {
    for (Handle h = 0; h < graph.slotCount(); ++h) {
        if (!graph.isLive(h)) continue;
        const auto& meta = graph.node(h).getMetadata();
        assert(meta.index == h);
        for (Handle child : meta.children) {
            assert(graph.node(child).hasParent(h));
        }
        for (Handle parent : meta.parents) {
            assert(graph.node(parent).hasChild(h));
        }
    }
}

bool Contains(const std::vector<Handle>& list, Handle h) {
    for (Handle x : list) {
        if (x == h) return true;
    }
    return false;
}

void TestInsertAndLink() {
    std::cout << "[Test] Insert, link and unlink..." << std::endl;
    TaskGraph g;
    Handle a = g.insertRoot("A");
    Handle b = g.insertChild("B", a);
    Handle c = g.insertChild("C", a);

    assert(a == 0 && b == 1 && c == 2);
    assert(g.roots() == std::vector<Handle>{a});
    assert((g.node(a).getMetadata().children == std::vector<Handle>{b, c}));
    assert(g.node(b).getMetadata().parents == std::vector<Handle>{a});

    g.link(b, c);
    assert((g.node(c).getMetadata().parents == std::vector<Handle>{a, b}));
    g.link(b, c); // existing edge
    assert(g.node(b).getMetadata().children.size() == 1);
    AssertEdgesSymmetric(g);

    g.unlink(a, c);
    assert(g.node(a).getMetadata().children == std::vector<Handle>{b});
    assert(g.node(c).getMetadata().parents == std::vector<Handle>{b});
    assert(!Contains(g.roots(), c));

    g.unlink(a, c); // missing edge
    assert(g.node(c).getMetadata().parents == std::vector<Handle>{b});

    g.cleanParents(c);
    assert(g.node(c).getMetadata().parents.empty());
    assert(g.node(b).getMetadata().children.empty());
    assert((g.roots() == std::vector<Handle>{a, c}));
    AssertEdgesSymmetric(g);

    bool threw = false;
    try {
        g.insertChild("X", 99);
    } catch (const InvalidHandleError& e) {
        threw = true;
        assert(e.handle() == 99);
    }
    assert(threw);
    assert(g.slotCount() == 3);
}

void TestRemove() {
    std::cout << "[Test] Remove promotes orphans and clears indices..." << std::endl;
    TaskGraph g;
    Handle x = g.insertRoot("X");
    Handle y = g.insertChild("Y", x);
    Handle z = g.insertChild("Z", y);
    g.setAlias(y, "middle");
    g.setArchived(y, true);

    g.remove(y);
    assert(!g.isLive(y));
    assert(g.slotCount() == 3 && g.nodeCount() == 2);
    assert(g.node(x).getMetadata().children.empty());
    assert(g.node(z).getMetadata().parents.empty());
    assert((g.roots() == std::vector<Handle>{x, z}));
    assert(g.aliases().empty());
    assert(g.archived().empty());

    bool threw = false;
    try {
        g.node(y);
    } catch (const InvalidHandleError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        g.link(x, y);
    } catch (const InvalidHandleError&) {
        threw = true;
    }
    assert(threw);
    AssertEdgesSymmetric(g);
}

void TestRemoveRecursiveDiamond() {
    std::cout << "[Test] Recursive removal of a diamond..." << std::endl;
    TaskGraph g;
    Handle keep = g.insertRoot("Keep");
    Handle r = g.insertRoot("R");
    Handle p = g.insertChild("P", r);
    Handle q = g.insertChild("Q", r);
    Handle s = g.insertChild("S", p);
    g.link(q, s);
    g.link(keep, q);

    g.removeChildrenRecursive(r);
    assert(g.nodeCount() == 1);
    assert(!g.isLive(r) && !g.isLive(p) && !g.isLive(q) && !g.isLive(s));
    assert(g.roots() == std::vector<Handle>{keep});
    assert(g.node(keep).getMetadata().children.empty());
    AssertEdgesSymmetric(g);
}

void TestDates() {
    std::cout << "[Test] Date nodes..." << std::endl;
    TaskGraph g;
    CalendarDate march{2024, 3, 1};
    Handle d = g.insertDate(march);
    assert(g.node(d).getTitle() == "2024-03-01");
    assert(g.node(d).isDate());
    assert(g.dates().at("2024-03-01") == d);
    assert(g.roots().empty());

    Handle again = g.insertDate(march, "Other title");
    assert(again == d);
    assert(g.slotCount() == 1);

    Handle t = g.insertChild("Meeting", d);
    assert(g.node(t).hasParent(d));
    assert(g.roots().empty());

    g.remove(d);
    assert(g.dates().empty());
    assert(g.roots() == std::vector<Handle>{t});
}

void TestAliases() {
    std::cout << "[Test] Alias assignment..." << std::endl;
    TaskGraph g;
    Handle a = g.insertRoot("A");
    Handle b = g.insertRoot("B");

    g.setAlias(a, "home");
    assert(g.aliases().at("home") == a);
    g.setAlias(a, "work");
    assert(g.aliases().count("home") == 0);
    assert(g.aliases().at("work") == a);

    // The previous owner keeps its node-local copy.
    g.setAlias(b, "work");
    assert(g.aliases().at("work") == b);
    assert(*g.node(a).getMetadata().alias == "work");

    g.unsetAlias(a);
    assert(!g.node(a).getMetadata().alias);
    assert(g.aliases().at("work") == b);

    g.unsetAlias(a); // no alias left
    assert(g.aliases().size() == 1);

    bool threw = false;
    try {
        g.setAlias(a, "");
    } catch (const InvalidAliasError&) {
        threw = true;
    }
    assert(threw);
}

void TestReorder() {
    std::cout << "[Test] Reorder children..." << std::endl;
    TaskGraph g;
    Handle p = g.insertRoot("P");
    Handle c1 = g.insertChild("1", p);
    Handle c2 = g.insertChild("2", p);
    Handle c3 = g.insertChild("3", p);
    Handle other = g.insertRoot("Other");

    g.reorderChild(p, c3, -1);
    assert((g.node(p).getMetadata().children == std::vector<Handle>{c1, c3, c2}));
    g.reorderChild(p, c1, 10);
    assert((g.node(p).getMetadata().children == std::vector<Handle>{c3, c2, c1}));
    g.reorderChild(p, c1, -10);
    assert((g.node(p).getMetadata().children == std::vector<Handle>{c1, c3, c2}));

    bool threw = false;
    try {
        g.reorderChild(p, other, 1);
    } catch (const InvalidHandleError&) {
        threw = true;
    }
    assert(threw);
}

void TestArchiveAndRename() {
    std::cout << "[Test] Archive flag and rename..." << std::endl;
    TaskGraph g;
    Handle a = g.insertRoot("A");
    g.setArchived(a, true);
    g.setArchived(a, true);
    assert(g.archived() == std::vector<Handle>{a});
    assert(g.node(a).getMetadata().archived);
    g.setArchived(a, false);
    assert(g.archived().empty());
    assert(!g.node(a).getMetadata().archived);

    g.rename(a, "Renamed");
    assert(g.node(a).getTitle() == "Renamed");
}

} // namespace

int main() {
    std::cout << "[Test] Starting Graph Structure Test..." << std::endl;

    TestInsertAndLink();
    TestRemove();
    TestRemoveRecursiveDiamond();
    TestDates();
    TestAliases();
    TestReorder();
    TestArchiveAndRename();

    std::cout << "[PASS] Graph Structure Test." << std::endl;
    return 0;
}
