/**
 * @file DocumentCodec.cpp
 * @brief Implementation of DocumentCodec.
 */

#include "infrastructure/DocumentCodec.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <optional>

#include <yaml-cpp/yaml.h>

#include "infrastructure/LegacyDocumentParser.hpp"
#include "infrastructure/YamlConverter.hpp"

namespace taskweave::infrastructure {

using nlohmann::json;
using domain::CalendarDate;
using domain::Handle;
using domain::TaskGraph;
using domain::TaskNode;
using domain::TaskState;

namespace {

bool IsBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string TypeName(const TaskNode& node) {
    if (node.isDate()) return "date";
    if (node.isPseudo()) return "pseudo";
    return "task";
}

std::string StateName(const TaskNode& node) {
    if (node.isPseudo()) return "pseudo";
    return domain::TaskStateToString(node.getState());
}

Handle ReadHandle(const json& value, std::size_t slotCount, const std::string& what) {
    if (!value.is_number_integer()) {
        throw ParseError(what + " is not an integer handle");
    }
    long long raw = value.get<long long>();
    if (raw < 0 || static_cast<unsigned long long>(raw) >= slotCount) {
        throw ParseError(what + " " + std::to_string(raw) + " is out of range");
    }
    return static_cast<Handle>(raw);
}

std::vector<Handle> ReadHandles(const json& value, std::size_t slotCount, const std::string& what) {
    if (!value.is_array()) {
        throw ParseError(what + " is not a list");
    }
    std::vector<Handle> handles;
    handles.reserve(value.size());
    for (const auto& item : value) {
        handles.push_back(ReadHandle(item, slotCount, what));
    }
    return handles;
}

void RequireLive(const std::vector<TaskGraph::Slot>& nodes, Handle handle, const std::string& what) {
    if (!nodes[handle]) {
        throw ParseError(what + " " + std::to_string(handle) + " refers to a removed node");
    }
}

// Runs the strict decoder; nullopt means a legacy decoder should be tried.
std::optional<TaskGraph> TryStrict(const json& tree) {
    try {
        return DocumentCodec::FromJson(tree);
    } catch (const ParseError& e) {
        int version = 0;
        if (tree.is_object() && tree.contains("version") && tree["version"].is_number_integer()) {
            version = tree["version"].get<int>();
        }
        if (version == DocumentCodec::CurrentVersion) {
            std::cerr << "[DocumentCodec] Strict decode failed (" << e.what()
                      << "), retrying tolerantly" << std::endl;
        }
        return std::nullopt;
    }
}

} // namespace

// --- Encoding ---

json DocumentCodec::NodeToJson(const TaskNode& node) {
    const auto& meta = node.getMetadata();

    json j;
    j["title"] = node.getTitle();
    j["type"] = TypeName(node);
    j["state"] = StateName(node);
    if (const auto* date = node.asDate()) {
        j["date"] = date->date.toKey();
    }
    j["metadata"] = {
        {"archived", meta.archived},
        {"index", meta.index},
        {"alias", meta.alias ? json(*meta.alias) : json(nullptr)},
        {"parents", meta.parents},
        {"children", meta.children}
    };
    return j;
}

json DocumentCodec::ToJson(const TaskGraph& graph) {
    json nodes = json::array();
    for (const auto& slot : graph.nodes()) {
        nodes.push_back(slot ? NodeToJson(*slot) : json(nullptr));
    }

    json g;
    g["nodes"] = std::move(nodes);
    g["roots"] = graph.roots();
    g["archived"] = graph.archived();
    g["dates"] = json::object();
    for (const auto& [key, handle] : graph.dates()) {
        g["dates"][key] = handle;
    }
    g["aliases"] = json::object();
    for (const auto& [alias, handle] : graph.aliases()) {
        g["aliases"][alias] = handle;
    }

    json doc;
    doc["version"] = CurrentVersion;
    doc["graph"] = std::move(g);
    return doc;
}

std::string DocumentCodec::EncodeYaml(const TaskGraph& graph) {
    return YamlConverter::Emit(ToJson(graph));
}

std::string DocumentCodec::EncodeJson(const TaskGraph& graph, int indent) {
    return ToJson(graph).dump(indent);
}

// --- Strict decoding ---

TaskNode DocumentCodec::NodeFromJson(const json& j, Handle slot, std::size_t slotCount) {
    try {
        if (!j.is_object()) {
            throw ParseError("node " + std::to_string(slot) + " is not a mapping");
        }
        const std::string prefix = "node " + std::to_string(slot) + ": ";

        std::string title = j.at("title").get<std::string>();
        std::string type = j.at("type").get<std::string>();
        std::string state = j.at("state").get<std::string>();

        domain::NodeContent content;
        if (type == "task") {
            auto parsed = domain::TaskStateFromString(state);
            if (!parsed) throw ParseError(prefix + "unknown state '" + state + "'");
            content = domain::TaskData{*parsed};
        } else if (type == "date") {
            if (state != "none") throw ParseError(prefix + "date node with state '" + state + "'");
            auto date = CalendarDate::parse(j.at("date").get<std::string>());
            if (!date) throw ParseError(prefix + "malformed date");
            content = domain::DateData{*date};
        } else if (type == "pseudo") {
            if (state != "pseudo") throw ParseError(prefix + "pseudo node with state '" + state + "'");
            content = domain::PseudoData{};
        } else {
            throw ParseError(prefix + "unknown type '" + type + "'");
        }

        const json& meta = j.at("metadata");
        Handle index = ReadHandle(meta.at("index"), slotCount, prefix + "index");
        if (index != slot) {
            throw ParseError(prefix + "index " + std::to_string(index) + " does not match its slot");
        }

        TaskNode node(std::move(title), index, std::move(content));
        node.metadata().archived = meta.at("archived").get<bool>();
        const json& alias = meta.at("alias");
        if (!alias.is_null()) {
            node.metadata().alias = alias.get<std::string>();
        }
        node.metadata().parents = ReadHandles(meta.at("parents"), slotCount, prefix + "parent");
        node.metadata().children = ReadHandles(meta.at("children"), slotCount, prefix + "child");
        return node;
    } catch (const json::exception& e) {
        throw ParseError("node " + std::to_string(slot) + ": " + e.what());
    }
}

TaskGraph DocumentCodec::FromJson(const json& doc) {
    try {
        if (!doc.is_object()) {
            throw ParseError("document is not a mapping");
        }
        const json& version = doc.at("version");
        if (!version.is_number_integer() || version.get<long long>() != CurrentVersion) {
            throw ParseError("version mismatch, expected " + std::to_string(CurrentVersion));
        }

        const json& g = doc.at("graph");
        const json& nodesJson = g.at("nodes");
        if (!nodesJson.is_array()) {
            throw ParseError("graph.nodes is not a list");
        }

        const std::size_t count = nodesJson.size();
        std::vector<TaskGraph::Slot> nodes;
        nodes.reserve(count);
        for (Handle i = 0; i < count; ++i) {
            const json& entry = nodesJson[i];
            if (entry.is_null()) {
                nodes.emplace_back(std::nullopt);
            } else {
                nodes.emplace_back(NodeFromJson(entry, i, count));
            }
        }

        for (const auto& slot : nodes) {
            if (!slot) continue;
            for (Handle h : slot->getMetadata().parents) RequireLive(nodes, h, "parent");
            for (Handle h : slot->getMetadata().children) RequireLive(nodes, h, "child");
        }

        std::vector<Handle> roots = ReadHandles(g.at("roots"), count, "root");
        std::vector<Handle> archived = ReadHandles(g.at("archived"), count, "archived");
        for (Handle h : roots) RequireLive(nodes, h, "root");
        for (Handle h : archived) RequireLive(nodes, h, "archived");

        std::map<std::string, Handle> dates;
        for (const auto& item : g.at("dates").items()) {
            Handle h = ReadHandle(item.value(), count, "date");
            RequireLive(nodes, h, "date");
            const auto* content = nodes[h]->asDate();
            if (!content || content->date.toKey() != item.key()) {
                throw ParseError("date '" + item.key() + "' does not point at its date node");
            }
            dates.emplace(item.key(), h);
        }

        std::map<std::string, Handle> aliases;
        for (const auto& item : g.at("aliases").items()) {
            Handle h = ReadHandle(item.value(), count, "alias");
            RequireLive(nodes, h, "alias");
            aliases.emplace(item.key(), h);
        }

        return TaskGraph::restore(std::move(nodes), std::move(roots), std::move(archived),
                                  std::move(dates), std::move(aliases));
    } catch (const json::exception& e) {
        throw ParseError(e.what());
    }
}

// --- Decoding entry points ---

TaskGraph DocumentCodec::DecodeYaml(const std::string& text) {
    if (IsBlank(text)) {
        return TaskGraph();
    }

    YAML::Node root;
    json tree;
    try {
        root = YAML::Load(text);
        tree = YamlConverter::ToJson(root);
    } catch (const YAML::Exception& e) {
        throw ParseError(e.what());
    }

    if (auto graph = TryStrict(tree)) {
        return std::move(*graph);
    }
    return LegacyDocumentParser::Parse(root);
}

TaskGraph DocumentCodec::DecodeJson(const std::string& text) {
    if (IsBlank(text)) {
        return TaskGraph();
    }

    json tree;
    try {
        tree = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ParseError(e.what());
    }

    if (auto graph = TryStrict(tree)) {
        return std::move(*graph);
    }

    // JSON is a YAML subset, so the legacy decoders read it as well.
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw ParseError(e.what());
    }
    return LegacyDocumentParser::Parse(root);
}

// --- Blueprints ---

std::string DocumentCodec::EncodeBlueprint(const domain::BlueprintDocument& doc) {
    json nodes = json::array();
    for (const auto& node : doc.nodes) {
        nodes.push_back(NodeToJson(node));
    }

    json j;
    j["title"] = doc.title;
    j["author"] = doc.author ? json(*doc.author) : json(nullptr);
    j["version"] = doc.version;
    j["nodes"] = std::move(nodes);
    return YamlConverter::Emit(j);
}

domain::BlueprintDocument DocumentCodec::DecodeBlueprint(const std::string& text) {
    if (IsBlank(text)) {
        throw ParseError("empty blueprint");
    }

    json j;
    try {
        j = YamlConverter::ToJson(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw ParseError(e.what());
    }

    try {
        if (!j.is_object()) {
            throw ParseError("blueprint is not a mapping");
        }
        const json& nodesJson = j.at("nodes");
        if (!nodesJson.is_array() || nodesJson.empty()) {
            throw ParseError("blueprint has no nodes");
        }

        domain::BlueprintDocument doc;
        const std::size_t count = nodesJson.size();
        for (Handle i = 0; i < count; ++i) {
            doc.nodes.push_back(NodeFromJson(nodesJson[i], i, count));
        }

        const json& title = j.value("title", json(nullptr));
        doc.title = title.is_string() ? title.get<std::string>() : doc.nodes.front().getTitle();
        const json& author = j.value("author", json(nullptr));
        if (author.is_string()) {
            doc.author = author.get<std::string>();
        }
        doc.version = j.value("version", 0);
        return doc;
    } catch (const json::exception& e) {
        throw ParseError(e.what());
    }
}

} // namespace taskweave::infrastructure
