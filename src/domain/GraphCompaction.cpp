/**
 * @file GraphCompaction.cpp
 * @brief Compaction (clean) and depth-first traversal of TaskGraph.
 */

#include "domain/TaskGraph.hpp"

#include <algorithm>

namespace taskweave::domain {

void TaskGraph::clean() {
    std::map<std::string, Handle> aliases;
    std::map<std::string, Handle> dates;
    std::vector<Handle> archived;

    // 1. Node-local fields are the source of truth for every index.
    for (Handle h = 0; h < m_nodes.size(); ++h) {
        if (!m_nodes[h]) continue;
        const TaskNode& node = *m_nodes[h];
        if (node.getMetadata().alias) {
            aliases[*node.getMetadata().alias] = h;
        }
        if (const DateData* date = node.asDate()) {
            dates[date->date.toKey()] = h;
        }
        if (node.getMetadata().archived) {
            archived.push_back(h);
        }
    }

    // 2. Edges to tombstones.
    auto dangling = [this](Handle h) { return !isLive(h); };
    for (Slot& slot : m_nodes) {
        if (!slot) continue;
        auto& parents = slot->metadata().parents;
        auto& children = slot->metadata().children;
        parents.erase(std::remove_if(parents.begin(), parents.end(), dangling), parents.end());
        children.erase(std::remove_if(children.begin(), children.end(), dangling), children.end());
    }

    // 3. Roots: parentless nodes that are not registered dates.
    std::vector<Handle> roots;
    for (Handle h = 0; h < m_nodes.size(); ++h) {
        if (!m_nodes[h] || !m_nodes[h]->getMetadata().parents.empty()) continue;
        bool isDate = std::any_of(dates.begin(), dates.end(), [h](const auto& entry) { return entry.second == h; });
        if (!isDate) {
            roots.push_back(h);
        }
    }

    // 4. Dense, order-preserving remap.
    std::vector<std::optional<Handle>> remap(m_nodes.size());
    Handle next = 0;
    for (Handle h = 0; h < m_nodes.size(); ++h) {
        if (m_nodes[h]) {
            remap[h] = next++;
        }
    }
    auto mapAll = [&remap](std::vector<Handle>& handles) {
        for (Handle& h : handles) {
            h = *remap[h];
        }
    };

    // 5. Rewrite through the remap.
    std::vector<Slot> nodes;
    nodes.reserve(next);
    for (Slot& slot : m_nodes) {
        if (!slot) continue;
        TaskNode node = std::move(*slot);
        node.metadata().index = nodes.size();
        mapAll(node.metadata().parents);
        mapAll(node.metadata().children);
        nodes.emplace_back(std::move(node));
    }
    mapAll(roots);
    mapAll(archived);
    for (auto& entry : aliases) {
        entry.second = *remap[entry.second];
    }
    for (auto& entry : dates) {
        entry.second = *remap[entry.second];
    }

    // 6. Single replacement of the whole graph.
    *this = restore(std::move(nodes), std::move(roots), std::move(archived), std::move(dates), std::move(aliases));
}

std::vector<TraversalEntry> TaskGraph::traverse(const std::vector<Handle>& starts,
                                                bool includeArchived,
                                                std::size_t maxDepth) const {
    std::vector<TraversalEntry> out;
    for (Handle start : starts) {
        node(start);
        std::vector<Handle> path;
        walk({start}, start, includeArchived, maxDepth, 0, path, out);
    }
    return out;
}

void TaskGraph::walk(const std::vector<Handle>& handles,
                     Handle start,
                     bool includeArchived,
                     std::size_t maxDepth,
                     std::size_t depth,
                     std::vector<Handle>& path,
                     std::vector<TraversalEntry>& out) const {
    if (maxDepth != 0 && depth > maxDepth) return;

    for (Handle handle : handles) {
        if (std::find(path.begin(), path.end(), handle) != path.end()) {
            throw CycleDetectedError(start, handle);
        }

        const TaskNode& current = liveNode(handle);
        if (!includeArchived && current.getMetadata().archived) continue;

        out.push_back(TraversalEntry{handle, depth});

        path.push_back(handle);
        walk(current.getMetadata().children, start, includeArchived, maxDepth, depth + 1, path, out);
        path.pop_back();
    }
}

} // namespace taskweave::domain
