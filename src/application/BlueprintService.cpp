/**
 * @file BlueprintService.cpp
 * @brief Implementation of BlueprintService.
 */

#include "application/BlueprintService.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <vector>

namespace taskweave::application {

using domain::BlueprintDocument;
using domain::Handle;
using domain::TaskGraph;
using domain::TaskNode;

namespace {

// Preorder discovery; finished nodes are not walked again.
void Discover(const TaskGraph& graph,
              Handle root,
              Handle handle,
              std::map<Handle, Handle>& positions,
              std::vector<Handle>& order,
              std::vector<Handle>& path) {
    if (std::find(path.begin(), path.end(), handle) != path.end()) {
        throw domain::CycleDetectedError(root, handle);
    }
    if (positions.count(handle)) return;

    positions.emplace(handle, order.size());
    order.push_back(handle);

    path.push_back(handle);
    for (Handle child : graph.node(handle).getMetadata().children) {
        Discover(graph, root, child, positions, order, path);
    }
    path.pop_back();
}

std::vector<Handle> MapInside(const std::vector<Handle>& handles, const std::map<Handle, Handle>& positions) {
    std::vector<Handle> mapped;
    for (Handle h : handles) {
        auto it = positions.find(h);
        if (it != positions.end()) {
            mapped.push_back(it->second);
        }
    }
    return mapped;
}

} // namespace

BlueprintDocument BlueprintService::extractBlueprint(const TaskGraph& graph,
                                                     Handle root,
                                                     std::optional<std::string> author,
                                                     int version) const {
    graph.node(root);

    std::map<Handle, Handle> positions;
    std::vector<Handle> order;
    std::vector<Handle> path;
    Discover(graph, root, root, positions, order, path);

    BlueprintDocument doc;
    doc.title = graph.node(root).getTitle();
    doc.author = std::move(author);
    doc.version = version;
    doc.nodes.reserve(order.size());

    for (Handle original : order) {
        TaskNode clone = graph.node(original);
        TaskNode::Metadata& meta = clone.metadata();
        meta.index = doc.nodes.size();
        meta.alias.reset();
        meta.archived = false;
        meta.parents = MapInside(meta.parents, positions);
        meta.children = MapInside(meta.children, positions);
        doc.nodes.push_back(std::move(clone));
    }
    doc.nodes.front().metadata().parents.clear();

    return doc;
}

Handle BlueprintService::importBlueprint(TaskGraph& graph,
                                         const BlueprintDocument& doc,
                                         std::optional<Handle> targetParent,
                                         const std::optional<std::string>& title) const {
    Validate(doc);
    if (targetParent) {
        graph.node(*targetParent);
    }

    std::vector<Handle> created;
    created.reserve(doc.nodes.size());
    for (const TaskNode& node : doc.nodes) {
        const std::string& nodeTitle = (created.empty() && title) ? *title : node.getTitle();
        created.push_back(graph.insertRoot(nodeTitle, node.isPseudo()));
    }

    for (std::size_t i = 0; i < doc.nodes.size(); ++i) {
        for (Handle child : doc.nodes[i].getMetadata().children) {
            graph.link(created[i], created[child]);
        }
    }

    if (targetParent) {
        graph.link(*targetParent, created.front());
    }
    return created.front();
}

TaskGraph BlueprintService::toGraph(const BlueprintDocument& doc) const {
    TaskGraph graph;
    importBlueprint(graph, doc, std::nullopt);
    return graph;
}

void BlueprintService::Validate(const BlueprintDocument& doc) {
    if (doc.nodes.empty()) {
        throw std::invalid_argument("Blueprint has no nodes");
    }
    if (!doc.nodes.front().getMetadata().parents.empty()) {
        throw std::invalid_argument("Blueprint root must not have parents");
    }
    const std::size_t count = doc.nodes.size();
    for (std::size_t i = 0; i < count; ++i) {
        const auto& meta = doc.nodes[i].getMetadata();
        if (meta.index != i) {
            throw std::invalid_argument("Blueprint node " + std::to_string(i) + " has index " +
                                        std::to_string(meta.index));
        }
        for (Handle child : meta.children) {
            if (child >= count || child == 0) {
                throw std::invalid_argument("Blueprint node " + std::to_string(i) + " has invalid child " +
                                            std::to_string(child));
            }
        }
    }
}

} // namespace taskweave::application
