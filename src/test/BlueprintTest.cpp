#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "application/BlueprintService.hpp"
#include "domain/TaskGraph.hpp"

using namespace taskweave::domain;
using taskweave::application::BlueprintService;

int main() {
    std::cout << "[Test] Starting Blueprint Test..." << std::endl;

    TaskGraph g;
    Handle r = g.insertRoot("Release");
    Handle a = g.insertChild("Build", r);
    Handle b = g.insertChild("Docs", r);
    Handle s = g.insertChild("Changelog", a);
    g.link(b, s);
    Handle p = g.insertChild("Notes", b, true);
    Handle outside = g.insertRoot("Outside");
    g.link(outside, a);
    Handle day = g.insertDate(CalendarDate{2024, 9, 1});
    g.link(r, day);
    g.setAlias(a, "build");
    g.setArchived(b, true);
    g.setState(s, TaskState::Done, true);

    BlueprintService service;

    // Extraction
    BlueprintDocument doc = service.extractBlueprint(g, r, std::string("ops"), 5);
    assert(doc.title == "Release");
    assert(doc.author && *doc.author == "ops");
    assert(doc.version == 5);
    // Discovery order: Release, Build, Changelog, Docs, Notes, date
    assert(doc.nodes.size() == 6);
    assert(doc.nodes[0].getTitle() == "Release");
    assert(doc.nodes[1].getTitle() == "Build");
    assert(doc.nodes[2].getTitle() == "Changelog");
    assert(doc.nodes[3].getTitle() == "Docs");
    assert(doc.nodes[4].getTitle() == "Notes");
    assert(doc.nodes[5].isDate());
    for (Handle i = 0; i < doc.nodes.size(); ++i) {
        assert(doc.nodes[i].getIndex() == i);
        assert(!doc.nodes[i].getMetadata().alias);
        assert(!doc.nodes[i].getMetadata().archived);
    }
    assert(doc.nodes[0].getMetadata().parents.empty());
    assert((doc.nodes[0].getMetadata().children == std::vector<Handle>{1, 3, 5}));
    assert(doc.nodes[1].getMetadata().parents == std::vector<Handle>{0}); // Outside dropped
    assert((doc.nodes[2].getMetadata().parents == std::vector<Handle>{1, 3}));
    assert((doc.nodes[3].getMetadata().children == std::vector<Handle>{2, 4}));
    assert(doc.nodes[2].getState() == TaskState::Done);
    assert(doc.nodes[4].isPseudo());

    // Extracting an inner node clears its parents
    BlueprintDocument inner = service.extractBlueprint(g, a, std::nullopt, 5);
    assert(inner.nodes.size() == 2);
    assert(inner.nodes[0].getMetadata().parents.empty());
    assert(!inner.author);

    // Import under a new parent
    TaskGraph target;
    Handle host = target.insertRoot("Host");
    Handle imported = service.importBlueprint(target, doc, host, std::string("Release 2"));
    assert(target.nodeCount() == 7);
    assert(target.node(imported).getTitle() == "Release 2");
    assert(target.node(imported).getMetadata().parents == std::vector<Handle>{host});
    assert(target.roots() == std::vector<Handle>{host});
    for (Handle h = 0; h < target.slotCount(); ++h) {
        const TaskNode& node = target.node(h);
        assert(!node.isDate());
        if (node.isTask()) {
            assert(node.getState() == TaskState::None);
        }
    }
    Handle changelog = target.node(target.node(imported).getMetadata().children[0]).getMetadata().children[0];
    assert(target.node(changelog).getTitle() == "Changelog");
    assert(target.node(changelog).getMetadata().parents.size() == 2);
    Handle notes = target.node(target.node(imported).getMetadata().children[1]).getMetadata().children[1];
    assert(target.node(notes).isPseudo());

    // Import as a new root
    Handle second = service.importBlueprint(target, inner, std::nullopt);
    assert((target.roots() == std::vector<Handle>{host, second}));
    assert(target.node(second).getTitle() == "Build");

    // Preview graph
    TaskGraph preview = service.toGraph(doc);
    assert(preview.nodeCount() == doc.nodes.size());
    assert(preview.roots() == std::vector<Handle>{0});

    // Invalid documents
    bool threw = false;
    try {
        service.importBlueprint(target, BlueprintDocument{}, std::nullopt);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    BlueprintDocument broken = doc;
    broken.nodes[0].metadata().parents.push_back(1);
    threw = false;
    try {
        service.importBlueprint(target, broken, std::nullopt);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // A looping subtree cannot be extracted
    g.link(s, r);
    threw = false;
    try {
        service.extractBlueprint(g, r, std::nullopt, 5);
    } catch (const CycleDetectedError& e) {
        threw = true;
        assert(e.start() == r);
    }
    assert(threw);
    (void)p;
    (void)day;

    std::cout << "[PASS] Blueprint Test." << std::endl;
    return 0;
}
