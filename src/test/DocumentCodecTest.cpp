#include <cassert>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "domain/TaskGraph.hpp"
#include "infrastructure/DocumentCodec.hpp"

using namespace taskweave::domain;
using taskweave::infrastructure::DocumentCodec;
using taskweave::infrastructure::ParseError;

namespace {

TaskGraph BuildSample() {
    TaskGraph g;
    Handle root = g.insertRoot("Garden");
    Handle weed = g.insertChild("Weed the beds", root);
    g.insertChild("Ideas", root, true);
    Handle day = g.insertDate(CalendarDate{2024, 4, 20});
    g.link(day, weed);
    g.setState(weed, TaskState::Done, true);
    g.setAlias(root, "garden");
    g.setAlias(weed, "007");

    // Titles that would read back as other scalar types
    Handle odd = g.insertChild("true", root);
    g.insertChild("42", odd);
    g.insertChild("", odd);
    g.insertChild("null", odd);
    g.insertChild("key: value", odd);
    g.insertChild("1.5", odd);
    g.setArchived(odd, true);

    Handle gone = g.insertRoot("Temporary");
    g.remove(gone);
    return g;
}

bool ThrowsParseError(const std::string& text, bool json) {
    try {
        if (json) {
            DocumentCodec::DecodeJson(text);
        } else {
            DocumentCodec::DecodeYaml(text);
        }
    } catch (const ParseError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Document Codec Test..." << std::endl;

    TaskGraph sample = BuildSample();

    // YAML round trip
    std::string yaml = DocumentCodec::EncodeYaml(sample);
    assert(yaml.find("version: 5") != std::string::npos);
    TaskGraph fromYaml = DocumentCodec::DecodeYaml(yaml);
    assert(fromYaml == sample);
    assert(DocumentCodec::EncodeYaml(fromYaml) == yaml);

    // JSON round trip
    TaskGraph fromJson = DocumentCodec::DecodeJson(DocumentCodec::EncodeJson(sample));
    assert(fromJson == sample);
    assert(DocumentCodec::DecodeJson(DocumentCodec::EncodeJson(sample, 2)) == sample);

    nlohmann::json doc = DocumentCodec::ToJson(sample);
    assert(doc["version"] == 5);
    assert(doc["graph"]["nodes"].size() == sample.slotCount());
    assert(doc["graph"]["nodes"].back().is_null());
    assert(doc["graph"]["nodes"][0]["type"] == "task");
    assert(doc["graph"]["nodes"][2]["state"] == "pseudo");
    assert(doc["graph"]["nodes"][3]["date"] == "2024-04-20");
    assert(doc["graph"]["nodes"][3]["state"] == "none");
    assert(doc["graph"]["aliases"]["007"] == 1);

    // Empty payloads
    assert(DocumentCodec::DecodeYaml("").slotCount() == 0);
    assert(DocumentCodec::DecodeYaml("  \n\t\n").slotCount() == 0);
    assert(DocumentCodec::DecodeJson("").slotCount() == 0);

    // Strict schema violations
    {
        nlohmann::json bad = doc;
        bad["graph"]["nodes"][0]["metadata"]["index"] = 1;
        bool threw = false;
        try {
            DocumentCodec::FromJson(bad);
        } catch (const ParseError&) {
            threw = true;
        }
        assert(threw);
    }
    {
        nlohmann::json bad = doc;
        bad["graph"]["nodes"][0]["metadata"]["children"].push_back(sample.slotCount() - 1);
        bool threw = false;
        try {
            DocumentCodec::FromJson(bad);
        } catch (const ParseError&) {
            threw = true;
        }
        assert(threw);
    }
    {
        nlohmann::json bad = doc;
        bad["graph"]["nodes"][2]["state"] = "done";
        bool threw = false;
        try {
            DocumentCodec::FromJson(bad);
        } catch (const ParseError&) {
            threw = true;
        }
        assert(threw);
    }
    {
        nlohmann::json bad = doc;
        bad["graph"]["nodes"][0].erase("type");
        bool threw = false;
        try {
            DocumentCodec::FromJson(bad);
        } catch (const ParseError&) {
            threw = true;
        }
        assert(threw);
    }

    // Unreadable payloads
    assert(ThrowsParseError("version: 99\ngraph: {}\n", false));
    assert(ThrowsParseError("just a string\n", false));
    assert(ThrowsParseError("graph: {}\n", false));
    assert(ThrowsParseError("[1, 2", false));
    assert(ThrowsParseError("{", true));
    assert(ThrowsParseError("{\"version\": 1, \"graph\": {}}", true));

    // Blueprints
    BlueprintDocument bp;
    bp.title = "Trip";
    bp.author = "me";
    bp.version = DocumentCodec::CurrentVersion;
    TaskNode first("Trip", 0);
    first.metadata().children = {1};
    TaskNode second("Pack", 1, TaskData{TaskState::Done});
    second.metadata().parents = {0};
    bp.nodes = {first, second};

    assert(DocumentCodec::DecodeBlueprint(DocumentCodec::EncodeBlueprint(bp)) == bp);
    bp.author.reset();
    assert(DocumentCodec::DecodeBlueprint(DocumentCodec::EncodeBlueprint(bp)) == bp);

    bool threw = false;
    try {
        DocumentCodec::DecodeBlueprint("title: x\nnodes: []\n");
    } catch (const ParseError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] Document Codec Test." << std::endl;
    return 0;
}
