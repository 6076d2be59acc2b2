/**
 * @file LegacyDocumentParser.cpp
 * @brief Implementation of LegacyDocumentParser.
 */

#include "infrastructure/LegacyDocumentParser.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace taskweave::infrastructure {

using domain::CalendarDate;
using domain::Handle;
using domain::TaskGraph;
using domain::TaskNode;
using domain::TaskState;

namespace {

enum class RawKind { Task, Date, Pseudo, Auto };

/// Node as read from an old document, before the graph invariants are restored.
struct RawNode {
    std::string title;
    RawKind kind = RawKind::Task;
    TaskState state = TaskState::None;
    std::optional<CalendarDate> date;
    bool archived = false;
    std::optional<std::string> alias;
    std::vector<Handle> parents;
    std::vector<Handle> children;
};

struct RawGraph {
    std::vector<std::optional<RawNode>> nodes;
    std::optional<std::vector<Handle>> roots;
    std::vector<Handle> archived;
    std::map<std::string, Handle> dates;
    std::map<std::string, Handle> aliases;
};

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
    return text;
}

std::string ReadString(const YAML::Node& node, const std::string& fallback = "") {
    if (node && node.IsScalar()) return node.Scalar();
    return fallback;
}

bool ReadBool(const YAML::Node& node, bool fallback = false) {
    bool value = fallback;
    if (node && node.IsScalar() && YAML::convert<bool>::decode(node, value)) return value;
    return fallback;
}

std::optional<Handle> ReadHandle(const YAML::Node& node) {
    long long value = 0;
    if (!node || !node.IsScalar() || !YAML::convert<long long>::decode(node, value) || value < 0) {
        return std::nullopt;
    }
    return static_cast<Handle>(value);
}

std::vector<Handle> ReadHandleList(const YAML::Node& node) {
    std::vector<Handle> handles;
    if (!node || !node.IsSequence()) return handles;
    for (const auto& item : node) {
        if (auto h = ReadHandle(item)) handles.push_back(*h);
    }
    return handles;
}

std::map<std::string, Handle> ReadHandleMap(const YAML::Node& node) {
    std::map<std::string, Handle> entries;
    if (!node || !node.IsMap()) return entries;
    for (const auto& entry : node) {
        auto h = ReadHandle(entry.second);
        if (entry.first.IsScalar() && h) {
            entries[entry.first.Scalar()] = *h;
        }
    }
    return entries;
}

std::optional<std::string> ReadAlias(const YAML::Node& node) {
    if (!node || !node.IsScalar() || node.Scalar().empty()) return std::nullopt;
    return node.Scalar();
}

/// Reads a state name of any version; sets @p pseudo for the pseudo state.
TaskState ReadState(const YAML::Node& node, bool& pseudo) {
    std::string state = ToLower(ReadString(node, "none"));
    if (state == "pseudo") {
        pseudo = true;
        return TaskState::None;
    }
    if (state == "partial") return TaskState::Partial;
    if (state == "complete" || state == "completed" || state == "done") return TaskState::Done;
    return TaskState::None;
}

RawGraph ReadGraphTables(const YAML::Node& graphDoc) {
    RawGraph raw;
    if (graphDoc["roots"] && graphDoc["roots"].IsSequence()) {
        raw.roots = ReadHandleList(graphDoc["roots"]);
    }
    raw.archived = ReadHandleList(graphDoc["archived"]);
    raw.dates = ReadHandleMap(graphDoc["dates"]);
    raw.aliases = ReadHandleMap(graphDoc["aliases"]);
    return raw;
}

template <typename ReadNode>
void ReadNodes(const YAML::Node& graphDoc, RawGraph& raw, ReadNode readNode) {
    const YAML::Node nodes = graphDoc["nodes"];
    if (!nodes || !nodes.IsSequence()) return;
    for (const auto& nodeDoc : nodes) {
        if (!nodeDoc || nodeDoc.IsNull() || !nodeDoc.IsMap()) {
            raw.nodes.emplace_back(std::nullopt);
        } else {
            raw.nodes.emplace_back(readNode(nodeDoc));
        }
    }
}

bool Contains(const std::vector<Handle>& list, Handle h) {
    return std::find(list.begin(), list.end(), h) != list.end();
}

/// Restores every graph invariant on a raw graph and builds the engine graph.
TaskGraph Assemble(RawGraph raw) {
    const std::size_t count = raw.nodes.size();
    auto live = [&raw, count](Handle h) { return h < count && raw.nodes[h].has_value(); };

    // Date content: explicit date, then the dates table, then the title.
    std::map<Handle, std::string> keyOf;
    for (const auto& [key, h] : raw.dates) {
        if (live(h) && !keyOf.count(h)) keyOf[h] = key;
    }

    std::vector<TaskGraph::Slot> nodes(count);
    for (Handle h = 0; h < count; ++h) {
        if (!raw.nodes[h]) continue;
        RawNode& rn = *raw.nodes[h];

        domain::NodeContent content = domain::TaskData{rn.state};
        if (rn.kind == RawKind::Pseudo) {
            content = domain::PseudoData{};
        } else if (rn.kind == RawKind::Date || (rn.kind == RawKind::Auto && keyOf.count(h))) {
            std::optional<CalendarDate> date = rn.date;
            if (!date && keyOf.count(h)) date = CalendarDate::parse(keyOf[h]);
            if (!date) date = CalendarDate::parse(rn.title);
            if (date) {
                content = domain::DateData{*date};
            } else {
                std::cerr << "[LegacyDocumentParser] Date node " << h
                          << " has no readable date, loading it as a task" << std::endl;
            }
        }

        TaskNode node(rn.title, h, std::move(content));
        node.metadata().archived = rn.archived;
        node.metadata().alias = rn.alias;
        nodes[h] = std::move(node);
    }

    // Edges: drop dangling and duplicate references, then mirror one-sided ones.
    for (Handle h = 0; h < count; ++h) {
        if (!nodes[h]) continue;
        for (Handle p : raw.nodes[h]->parents) {
            if (live(p) && p != h && !Contains(nodes[h]->getMetadata().parents, p)) {
                nodes[h]->metadata().parents.push_back(p);
            }
        }
        for (Handle c : raw.nodes[h]->children) {
            if (live(c) && c != h && !Contains(nodes[h]->getMetadata().children, c)) {
                nodes[h]->metadata().children.push_back(c);
            }
        }
    }
    for (Handle h = 0; h < count; ++h) {
        if (!nodes[h]) continue;
        for (Handle c : nodes[h]->getMetadata().children) {
            if (!nodes[c]->hasParent(h)) nodes[c]->metadata().parents.push_back(h);
        }
        for (Handle p : nodes[h]->getMetadata().parents) {
            if (!nodes[p]->hasChild(h)) nodes[p]->metadata().children.push_back(h);
        }
    }

    // Dates: table entries that match their node, then unregistered date nodes.
    std::map<std::string, Handle> dates;
    for (const auto& [key, h] : raw.dates) {
        if (!live(h)) continue;
        const auto* content = nodes[h]->asDate();
        if (content && content->date.toKey() == key) dates.emplace(key, h);
    }
    for (Handle h = 0; h < count; ++h) {
        if (!nodes[h]) continue;
        if (const auto* content = nodes[h]->asDate()) {
            dates.emplace(content->date.toKey(), h);
        }
    }
    std::set<Handle> registered;
    for (const auto& entry : dates) registered.insert(entry.second);

    // Aliases: node-local values win, dangling entries are dropped.
    std::map<std::string, Handle> aliases;
    for (const auto& [alias, h] : raw.aliases) {
        if (live(h)) {
            aliases[alias] = h;
        } else {
            std::cerr << "[LegacyDocumentParser] Dropping alias '" << alias << "' of missing node " << h << std::endl;
        }
    }
    for (Handle h = 0; h < count; ++h) {
        if (nodes[h] && nodes[h]->getMetadata().alias) {
            aliases[*nodes[h]->getMetadata().alias] = h;
        }
    }
    for (auto it = aliases.begin(); it != aliases.end();) {
        auto& local = nodes[it->second]->metadata().alias;
        if (!local) {
            local = it->first;
        } else if (*local != it->first) {
            std::cerr << "[LegacyDocumentParser] Dropping stale alias '" << it->first << "'" << std::endl;
            it = aliases.erase(it);
            continue;
        }
        ++it;
    }

    // Archived: listed nodes are flagged, flagged nodes are listed.
    std::vector<Handle> archived;
    for (Handle h : raw.archived) {
        if (live(h) && !Contains(archived, h)) {
            archived.push_back(h);
            nodes[h]->metadata().archived = true;
        }
    }
    for (Handle h = 0; h < count; ++h) {
        if (nodes[h] && nodes[h]->getMetadata().archived && !Contains(archived, h)) {
            archived.push_back(h);
        }
    }

    // Roots: listed order first, then any parentless node that is not a date.
    auto isRoot = [&](Handle h) {
        return live(h) && nodes[h]->getMetadata().parents.empty() && !registered.count(h);
    };
    std::vector<Handle> roots;
    if (raw.roots) {
        for (Handle h : *raw.roots) {
            if (isRoot(h) && !Contains(roots, h)) roots.push_back(h);
        }
    }
    for (Handle h = 0; h < count; ++h) {
        if (isRoot(h) && !Contains(roots, h)) roots.push_back(h);
    }

    return TaskGraph::restore(std::move(nodes), std::move(roots), std::move(archived),
                              std::move(dates), std::move(aliases));
}

} // namespace

const std::map<int, LegacyDocumentParser::Decoder>& LegacyDocumentParser::Decoders() {
    static const std::map<int, Decoder> decoders = {
        {3, &LegacyDocumentParser::ParseV3},
        {4, &LegacyDocumentParser::ParseV4},
        {5, &LegacyDocumentParser::ParseV5},
    };
    return decoders;
}

TaskGraph LegacyDocumentParser::Parse(const YAML::Node& doc) {
    try {
        if (!doc || !doc.IsMap()) {
            throw ParseError("document is not a mapping");
        }
        long long version = 0;
        const YAML::Node versionNode = doc["version"];
        if (!versionNode || !versionNode.IsScalar() || !YAML::convert<long long>::decode(versionNode, version)) {
            throw ParseError("version field does not exist");
        }

        const auto& decoders = Decoders();
        auto it = decoders.find(static_cast<int>(version));
        if (it == decoders.end()) {
            throw ParseError("no decoder for document version " + std::to_string(version));
        }

        std::cerr << "[LegacyDocumentParser] Loading document version " << version << std::endl;
        return it->second(doc);
    } catch (const YAML::Exception& e) {
        throw ParseError(e.what());
    }
}

TaskGraph LegacyDocumentParser::ParseV3(const YAML::Node& doc) {
    const YAML::Node graphDoc = doc["graph"];
    RawGraph raw = ReadGraphTables(graphDoc);
    raw.archived.clear(); // not part of this version

    ReadNodes(graphDoc, raw, [](const YAML::Node& nodeDoc) {
        RawNode node;
        bool pseudo = false;
        node.title = ReadString(nodeDoc["message"]);
        node.state = ReadState(nodeDoc["state"], pseudo);
        node.kind = pseudo ? RawKind::Pseudo : RawKind::Auto;
        node.alias = ReadAlias(nodeDoc["alias"]);
        node.parents = ReadHandleList(nodeDoc["parents"]);
        node.children = ReadHandleList(nodeDoc["children"]);
        return node;
    });
    return Assemble(std::move(raw));
}

TaskGraph LegacyDocumentParser::ParseV4(const YAML::Node& doc) {
    const YAML::Node graphDoc = doc["graph"];
    RawGraph raw = ReadGraphTables(graphDoc);

    ReadNodes(graphDoc, raw, [](const YAML::Node& nodeDoc) {
        RawNode node;
        bool pseudo = false;
        node.title = ReadString(nodeDoc["message"]);
        node.state = ReadState(nodeDoc["state"], pseudo);

        std::string type = ToLower(ReadString(nodeDoc["type"], "normal"));
        if (pseudo || type == "pseudo") {
            node.kind = RawKind::Pseudo;
        } else if (type == "date") {
            node.kind = RawKind::Date;
        } else {
            node.kind = RawKind::Task;
        }

        node.archived = ReadBool(nodeDoc["archived"]);
        node.alias = ReadAlias(nodeDoc["alias"]);
        node.parents = ReadHandleList(nodeDoc["parents"]);
        node.children = ReadHandleList(nodeDoc["children"]);
        return node;
    });
    return Assemble(std::move(raw));
}

TaskGraph LegacyDocumentParser::ParseV5(const YAML::Node& doc) {
    const YAML::Node graphDoc = doc["graph"];
    RawGraph raw = ReadGraphTables(graphDoc);

    ReadNodes(graphDoc, raw, [](const YAML::Node& nodeDoc) {
        RawNode node;
        bool pseudo = false;
        node.title = ReadString(nodeDoc["title"], ReadString(nodeDoc["message"]));
        node.state = ReadState(nodeDoc["state"], pseudo);

        std::string type = ToLower(ReadString(nodeDoc["type"], "task"));
        node.kind = type == "date" ? RawKind::Date : RawKind::Task;
        if (pseudo || type == "pseudo") node.kind = RawKind::Pseudo;

        // Tagged content as written by earlier releases: `data: !Task {state: Done}`,
        // `data: !Date {date: ...}` or `data: Pseudo`.
        const YAML::Node data = nodeDoc["data"];
        if (data) {
            std::string tag = data.Tag();
            if (data.IsScalar() && ToLower(data.Scalar()) == "pseudo") {
                node.kind = RawKind::Pseudo;
            } else if (tag == "!Date" || (data.IsMap() && data["Date"])) {
                node.kind = RawKind::Date;
                const YAML::Node body = data.IsMap() && data["Date"] ? data["Date"] : data;
                node.date = CalendarDate::parse(ReadString(body["date"]));
            } else if (tag == "!Task" || (data.IsMap() && data["Task"])) {
                const YAML::Node body = data.IsMap() && data["Task"] ? data["Task"] : data;
                node.state = ReadState(body["state"], pseudo);
            }
        }
        if (nodeDoc["date"]) {
            node.date = CalendarDate::parse(ReadString(nodeDoc["date"]));
        }

        const YAML::Node meta = nodeDoc["metadata"] ? nodeDoc["metadata"] : nodeDoc;
        node.archived = ReadBool(meta["archived"]);
        node.alias = ReadAlias(meta["alias"]);
        node.parents = ReadHandleList(meta["parents"]);
        node.children = ReadHandleList(meta["children"]);
        return node;
    });
    return Assemble(std::move(raw));
}

} // namespace taskweave::infrastructure
