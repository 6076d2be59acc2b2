#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "domain/TaskGraph.hpp"
#include "infrastructure/DocumentCodec.hpp"
#include "infrastructure/YamlConverter.hpp"

using namespace taskweave::domain;
using taskweave::infrastructure::DocumentCodec;
using taskweave::infrastructure::ParseError;
using taskweave::infrastructure::YamlConverter;

namespace {

const char* kVersion3 = R"(version: 3
graph:
  nodes:
    - {message: Root, state: partial, index: 0, alias: r, parents: [], children: [1]}
    - {message: Child, state: complete, index: 1, alias: ~, parents: [0], children: []}
    - {message: 2024-01-05, state: none, index: 2, alias: ~, parents: [], children: []}
    - ~
  roots: [0]
  dates: {2024-01-05: 2}
  aliases: {r: 0, ghost: 3}
)";

const char* kVersion4 = R"(version: 4
graph:
  nodes:
    - {message: Root, type: normal, state: partial, archived: false, index: 0, alias: r, parents: [], children: [1]}
    - {message: Child, type: normal, state: complete, archived: false, index: 1, alias: ~, parents: [0], children: []}
    - {message: 2024-01-05, type: date, state: none, archived: false, index: 2, alias: ~, parents: [], children: []}
    - ~
  roots: [0]
  archived: []
  dates: {2024-01-05: 2}
  aliases: {r: 0, ghost: 3}
)";

// The graph of kVersion3 and kVersion4 written in the current shape.
const char* kCurrent = R"(version: 5
graph:
  nodes:
    - title: Root
      type: task
      state: partial
      metadata: {archived: false, index: 0, alias: r, parents: [], children: [1]}
    - title: Child
      type: task
      state: done
      metadata: {archived: false, index: 1, alias: ~, parents: [0], children: []}
    - title: '2024-01-05'
      type: date
      state: none
      date: '2024-01-05'
      metadata: {archived: false, index: 2, alias: ~, parents: [], children: []}
    - ~
  roots: [0]
  archived: []
  dates: {'2024-01-05': 2}
  aliases: {r: 0}
)";

const char* kVersion4Repairs = R"(version: 4
graph:
  nodes:
    - {message: Top, type: normal, state: none, index: 0, parents: [], children: [1, 7]}
    - {message: Inner, type: normal, state: none, archived: true, index: 1, alias: y, parents: [], children: []}
    - {message: Loose, type: normal, state: none, index: 2, parents: [], children: []}
    - {message: Shelf, type: pseudo, state: none, index: 3, parents: [], children: []}
  roots: [5, 0]
  aliases: {x: 1, z: 0}
)";

const char* kVersion5Tagged = R"(version: 5
graph:
  nodes:
    - title: Root
      data: !Task {state: Partial}
      metadata: {archived: false, index: 0, alias: ~, parents: [], children: [1, 2]}
    - title: Sub
      data: Pseudo
      metadata: {archived: true, index: 1, alias: sub, parents: [0], children: []}
    - title: Leap day
      data: !Date {date: 2024-02-29}
      metadata: {archived: false, index: 2, alias: ~, parents: [0], children: []}
  roots: [0]
  archived: []
  dates: {}
  aliases: {}
)";

void TestVersion3MatchesVersion4() {
    std::cout << "[Test] v3 and v4 load to the same graph..." << std::endl;
    TaskGraph v3 = DocumentCodec::DecodeYaml(kVersion3);
    TaskGraph v4 = DocumentCodec::DecodeYaml(kVersion4);

    assert(v3 == v4);
    assert(v3.slotCount() == 4);
    assert(!v3.isLive(3));
    assert(v3.node(0).getState() == TaskState::Partial);
    assert(v3.node(1).getState() == TaskState::Done);
    assert(v3.node(2).isDate());
    assert(v3.dates().at("2024-01-05") == 2);
    assert(v3.roots() == std::vector<Handle>{0});
    assert(v3.aliases().size() == 1);
    assert(v3.aliases().at("r") == 0);
    assert(*v3.node(0).getMetadata().alias == "r");
    assert(v3.archived().empty());

    // The same graph written by hand in the current shape reads strictly.
    TaskGraph current = DocumentCodec::FromJson(YamlConverter::ToJson(YAML::Load(kCurrent)));
    assert(current == v3);
    assert(DocumentCodec::DecodeYaml(kCurrent) == v4);
    assert(DocumentCodec::ToJson(v3) == YamlConverter::ToJson(YAML::Load(kCurrent)));
}

void TestRepairs() {
    std::cout << "[Test] Legacy loader restores invariants..." << std::endl;
    TaskGraph g = DocumentCodec::DecodeYaml(kVersion4Repairs);

    // One-sided edge mirrored, dangling child 7 dropped
    assert(g.node(0).getMetadata().children == std::vector<Handle>{1});
    assert(g.node(1).getMetadata().parents == std::vector<Handle>{0});

    // Node-local alias wins; table-only alias is written onto its node
    assert(g.aliases().size() == 2);
    assert(g.aliases().at("y") == 1);
    assert(g.aliases().at("z") == 0);
    assert(*g.node(0).getMetadata().alias == "z");

    // Flagged node listed as archived
    assert(g.archived() == std::vector<Handle>{1});

    // Listed roots first, dangling entries dropped, unlisted parentless nodes appended
    assert((g.roots() == std::vector<Handle>{0, 2, 3}));
    assert(g.node(3).isPseudo());
}

void TestTaggedVersion5() {
    std::cout << "[Test] Tagged v5 content..." << std::endl;
    TaskGraph g = DocumentCodec::DecodeYaml(kVersion5Tagged);

    assert(g.node(0).isTask());
    assert(g.node(0).getState() == TaskState::Partial);
    assert(g.node(1).isPseudo());
    assert(g.node(1).getMetadata().archived);
    assert(g.archived() == std::vector<Handle>{1});
    assert(g.aliases().at("sub") == 1);
    assert(g.node(2).isDate());
    assert(g.node(2).getTitle() == "Leap day");
    assert(g.node(2).asDate()->date == (CalendarDate{2024, 2, 29}));
    assert(g.dates().at("2024-02-29") == 2);
    assert(g.roots() == std::vector<Handle>{0});
}

void TestJsonFallback() {
    std::cout << "[Test] Legacy JSON text..." << std::endl;
    const char* json = R"({"version": 4, "graph": {"nodes": [
        {"message": "Root", "type": "normal", "state": "partial", "archived": false, "index": 0,
         "alias": "r", "parents": [], "children": [1]},
        {"message": "Child", "type": "normal", "state": "complete", "archived": false, "index": 1,
         "alias": null, "parents": [0], "children": []},
        {"message": "2024-01-05", "type": "date", "state": "none", "archived": false, "index": 2,
         "alias": null, "parents": [], "children": []},
        null],
        "roots": [0], "archived": [], "dates": {"2024-01-05": 2}, "aliases": {"r": 0, "ghost": 3}}})";

    assert(DocumentCodec::DecodeJson(json) == DocumentCodec::DecodeYaml(kVersion4));
}

void TestUnknownVersions() {
    std::cout << "[Test] Unknown versions are rejected..." << std::endl;
    bool threw = false;
    try {
        DocumentCodec::DecodeYaml("version: 2\ngraph: {nodes: []}\n");
    } catch (const ParseError& e) {
        threw = true;
        assert(std::string(e.what()).find("version 2") != std::string::npos);
    }
    assert(threw);

    threw = false;
    try {
        DocumentCodec::DecodeYaml("version: three\ngraph: {}\n");
    } catch (const ParseError&) {
        threw = true;
    }
    assert(threw);
}

} // namespace

int main() {
    std::cout << "[Test] Starting Legacy Load Test..." << std::endl;

    TestVersion3MatchesVersion4();
    TestRepairs();
    TestTaggedVersion5();
    TestJsonFallback();
    TestUnknownVersions();

    std::cout << "[PASS] Legacy Load Test." << std::endl;
    return 0;
}
