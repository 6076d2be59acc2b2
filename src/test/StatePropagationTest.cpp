#include <cassert>
#include <iostream>

#include "domain/TaskGraph.hpp"

using namespace taskweave::domain;

int main() {
    std::cout << "[Test] Starting State Propagation Test..." << std::endl;

    // Partial and done aggregation
    {
        TaskGraph g;
        Handle r = g.insertRoot("R");
        Handle a = g.insertChild("A", r);
        Handle b = g.insertChild("B", r);

        g.setState(a, TaskState::Done, true);
        assert(g.node(r).getState() == TaskState::Partial);
        g.setState(b, TaskState::Done, true);
        assert(g.node(r).getState() == TaskState::Done);

        g.setState(r, TaskState::None, true);
        assert(g.node(a).getState() == TaskState::None);
        assert(g.node(b).getState() == TaskState::None);
        assert(g.node(r).getState() == TaskState::None);

        g.setState(a, TaskState::Partial, true);
        assert(g.node(r).getState() == TaskState::Partial);

        g.setState(r, TaskState::Done, true);
        assert(g.node(a).getState() == TaskState::Done);
        assert(g.node(b).getState() == TaskState::Done);

        // Without propagation only the target changes.
        g.setState(a, TaskState::None, false);
        assert(g.node(a).getState() == TaskState::None);
        assert(g.node(r).getState() == TaskState::Done);
    }

    // Pseudo nodes neither count nor change
    {
        TaskGraph g;
        Handle r = g.insertRoot("R");
        Handle t = g.insertChild("T", r);
        Handle p = g.insertChild("P", r, true);
        Handle q = g.insertChild("Q", p);

        g.setState(t, TaskState::Done, true);
        assert(g.node(r).getState() == TaskState::Done);

        g.setState(r, TaskState::None, true);
        g.setState(q, TaskState::Done, true);
        assert(g.node(p).isPseudo());
        assert(g.node(r).getState() == TaskState::None);

        g.setState(r, TaskState::Done, true);
        assert(g.node(t).getState() == TaskState::Done);
        g.setState(r, TaskState::None, true);
        assert(g.node(q).getState() == TaskState::Done);

        bool threw = false;
        try {
            g.setState(p, TaskState::Done, true);
        } catch (const NotTaskNodeError& e) {
            threw = true;
            assert(e.handle() == p);
        }
        assert(threw);
    }

    // Diamond fan-in
    {
        TaskGraph g;
        Handle top = g.insertRoot("Top");
        Handle m1 = g.insertChild("M1", top);
        Handle m2 = g.insertChild("M2", top);
        Handle leaf = g.insertChild("Leaf", m1);
        g.link(m2, leaf);

        g.setState(leaf, TaskState::Done, true);
        assert(g.node(m1).getState() == TaskState::Done);
        assert(g.node(m2).getState() == TaskState::Done);
        assert(g.node(top).getState() == TaskState::Done);

        Handle extra = g.insertChild("Extra", m1);
        assert(g.node(extra).getState() == TaskState::None);
        assert(g.node(m1).getState() == TaskState::Partial);
        assert(g.node(m2).getState() == TaskState::Done);
        assert(g.node(top).getState() == TaskState::Partial);

        g.remove(extra);
        assert(g.node(m1).getState() == TaskState::Done);
        assert(g.node(top).getState() == TaskState::Done);

        g.unlink(m1, leaf);
        assert(g.node(m1).getState() == TaskState::None);
        assert(g.node(top).getState() == TaskState::Partial);

        g.link(m1, leaf);
        assert(g.node(top).getState() == TaskState::Done);
    }

    // Ascent passes through date nodes
    {
        TaskGraph g;
        Handle d = g.insertDate(CalendarDate{2024, 1, 15});
        Handle t = g.insertChild("Call", d);
        g.setState(t, TaskState::Done, true);
        assert(g.node(t).getState() == TaskState::Done);
        assert(g.node(d).isDate());

        bool threw = false;
        try {
            g.setState(d, TaskState::Done, false);
        } catch (const NotTaskNodeError&) {
            threw = true;
        }
        assert(threw);
    }

    // A loop in the graph does not hang propagation
    {
        TaskGraph g;
        Handle r = g.insertRoot("R");
        Handle a = g.insertChild("A", r);
        g.link(a, r);

        g.setState(r, TaskState::Done, true);
        assert(g.node(a).getState() == TaskState::Done);
        assert(g.node(r).getState() == TaskState::Done);
    }

    std::cout << "[PASS] State Propagation Test." << std::endl;
    return 0;
}
