/**
 * @file TaskGraph.cpp
 * @brief Node store, edge and index maintenance of TaskGraph.
 */

#include "domain/TaskGraph.hpp"

#include <algorithm>
#include <stdexcept>

#include "domain/IdentifierResolver.hpp"

namespace taskweave::domain {

namespace {

void EraseValue(std::vector<Handle>& list, Handle value) {
    list.erase(std::remove(list.begin(), list.end(), value), list.end());
}

bool ContainsValue(const std::vector<Handle>& list, Handle value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

} // namespace

TaskGraph TaskGraph::restore(std::vector<Slot> nodes,
                             std::vector<Handle> roots,
                             std::vector<Handle> archived,
                             std::map<std::string, Handle> dates,
                             std::map<std::string, Handle> aliases) {
    TaskGraph graph;
    graph.m_nodes = std::move(nodes);
    graph.m_roots = std::move(roots);
    graph.m_archived = std::move(archived);
    graph.m_dates = std::move(dates);
    graph.m_aliases = std::move(aliases);
    return graph;
}

std::size_t TaskGraph::nodeCount() const {
    return static_cast<std::size_t>(
        std::count_if(m_nodes.begin(), m_nodes.end(), [](const Slot& slot) { return slot.has_value(); }));
}

const TaskNode& TaskGraph::node(Handle handle) const {
    if (!isLive(handle)) {
        throw InvalidHandleError(handle);
    }
    return *m_nodes[handle];
}

TaskNode& TaskGraph::mutableNode(Handle handle) {
    if (!isLive(handle)) {
        throw InvalidHandleError(handle);
    }
    return *m_nodes[handle];
}

const TaskNode& TaskGraph::liveNode(Handle handle) const {
    if (!isLive(handle)) {
        throw std::logic_error("Internal edge points at removed node " + std::to_string(handle));
    }
    return *m_nodes[handle];
}

TaskNode& TaskGraph::liveNode(Handle handle) {
    if (!isLive(handle)) {
        throw std::logic_error("Internal edge points at removed node " + std::to_string(handle));
    }
    return *m_nodes[handle];
}

std::optional<Handle> TaskGraph::findDate(const CalendarDate& date) const {
    auto it = m_dates.find(date.toKey());
    if (it == m_dates.end()) return std::nullopt;
    return it->second;
}

std::optional<Handle> TaskGraph::findAlias(const std::string& alias) const {
    auto it = m_aliases.find(alias);
    if (it == m_aliases.end()) return std::nullopt;
    return it->second;
}

Handle TaskGraph::resolve(const std::string& token) const {
    return IdentifierResolver(*this).resolve(token);
}

Handle TaskGraph::appendNode(const std::string& title, NodeContent content) {
    Handle handle = m_nodes.size();
    m_nodes.emplace_back(TaskNode(title, handle, std::move(content)));
    return handle;
}

Handle TaskGraph::insertRoot(const std::string& title, bool pseudo) {
    Handle handle = pseudo ? appendNode(title, PseudoData{}) : appendNode(title, TaskData{});
    m_roots.push_back(handle);
    return handle;
}

Handle TaskGraph::insertChild(const std::string& title, Handle parent, bool pseudo) {
    mutableNode(parent); // validate before allocating a slot

    Handle handle = pseudo ? appendNode(title, PseudoData{}) : appendNode(title, TaskData{});
    addEdge(parent, handle);
    dropRoot(handle);

    if (!pseudo) {
        recomputeAncestors({parent});
    }
    return handle;
}

Handle TaskGraph::insertDate(const CalendarDate& date) {
    return insertDate(date, date.toKey());
}

Handle TaskGraph::insertDate(const CalendarDate& date, const std::string& title) {
    std::string key = date.toKey();
    auto it = m_dates.find(key);
    if (it != m_dates.end()) {
        return it->second;
    }

    Handle handle = appendNode(title, DateData{date});
    m_dates.emplace(key, handle);
    return handle;
}

void TaskGraph::addEdge(Handle parent, Handle child) {
    TaskNode& parentNode = liveNode(parent);
    if (!parentNode.hasChild(child)) {
        parentNode.metadata().children.push_back(child);
    }
    TaskNode& childNode = liveNode(child);
    if (!childNode.hasParent(parent)) {
        childNode.metadata().parents.push_back(parent);
    }
}

void TaskGraph::removeEdge(Handle parent, Handle child) {
    EraseValue(liveNode(parent).metadata().children, child);
    EraseValue(liveNode(child).metadata().parents, parent);
}

void TaskGraph::link(Handle parent, Handle child) {
    mutableNode(parent);
    mutableNode(child);

    addEdge(parent, child);
    dropRoot(child);

    std::vector<Handle> parents = liveNode(child).getMetadata().parents;
    recomputeAncestors(parents);
}

void TaskGraph::unlink(Handle parent, Handle child) {
    mutableNode(parent);
    std::vector<Handle> parents = mutableNode(child).getMetadata().parents;

    removeEdge(parent, child);
    refreshRootStatus(child);

    recomputeAncestors(parents);
}

void TaskGraph::cleanParents(Handle target) {
    std::vector<Handle> parents = mutableNode(target).getMetadata().parents;
    for (Handle parent : parents) {
        removeEdge(parent, target);
    }
    refreshRootStatus(target);

    recomputeAncestors(parents);
}

void TaskGraph::reorderChild(Handle parent, Handle child, long delta) {
    mutableNode(child);
    std::vector<Handle>& children = mutableNode(parent).metadata().children;

    auto it = std::find(children.begin(), children.end(), child);
    if (it == children.end()) {
        throw InvalidHandleError(child);
    }

    long from = static_cast<long>(it - children.begin());
    long to = std::clamp(from + delta, 0L, static_cast<long>(children.size()) - 1);
    if (from == to) return;

    children.erase(it);
    children.insert(children.begin() + to, child);
}

void TaskGraph::remove(Handle target) {
    mutableNode(target);

    dropRoot(target);
    dropAlias(target);
    dropDate(target);
    dropArchived(target);

    std::vector<Handle> parents = liveNode(target).getMetadata().parents;
    for (Handle parent : parents) {
        EraseValue(liveNode(parent).metadata().children, target);
    }
    liveNode(target).metadata().parents.clear();
    recomputeAncestors(parents);

    std::vector<Handle> children = liveNode(target).getMetadata().children;
    for (Handle child : children) {
        EraseValue(liveNode(child).metadata().parents, target);
        refreshRootStatus(child);
    }

    m_nodes[target].reset();
}

void TaskGraph::removeChildrenRecursive(Handle target) {
    mutableNode(target);
    removeSubtree(target);
}

void TaskGraph::removeSubtree(Handle target) {
    // Shared descendants may already be gone when reached a second time.
    if (!isLive(target)) return;

    std::vector<Handle> parents = liveNode(target).getMetadata().parents;
    for (Handle parent : parents) {
        EraseValue(liveNode(parent).metadata().children, target);
    }
    liveNode(target).metadata().parents.clear();
    recomputeAncestors(parents);

    std::vector<Handle> children = liveNode(target).getMetadata().children;
    liveNode(target).metadata().children.clear();
    for (Handle child : children) {
        if (!isLive(child)) continue;
        EraseValue(liveNode(child).metadata().parents, target);
        removeSubtree(child);
    }

    dropRoot(target);
    dropAlias(target);
    dropDate(target);
    dropArchived(target);
    m_nodes[target].reset();
}

void TaskGraph::rename(Handle target, const std::string& title) {
    mutableNode(target).setTitle(title);
}

void TaskGraph::setArchived(Handle target, bool archived) {
    TaskNode& node = mutableNode(target);
    if (node.getMetadata().archived != archived) {
        if (archived) {
            m_archived.push_back(target);
        } else {
            dropArchived(target);
        }
    }
    node.metadata().archived = archived;
}

void TaskGraph::setAlias(Handle target, const std::string& alias) {
    if (alias.empty()) {
        throw InvalidAliasError(alias);
    }
    TaskNode& node = mutableNode(target);

    // Replacing the node's own previous alias; other owners are left alone.
    const auto& previous = node.getMetadata().alias;
    if (previous && *previous != alias) {
        auto it = m_aliases.find(*previous);
        if (it != m_aliases.end() && it->second == target) {
            m_aliases.erase(it);
        }
    }

    m_aliases[alias] = target;
    node.metadata().alias = alias;
}

void TaskGraph::unsetAlias(Handle target) {
    mutableNode(target);
    dropAlias(target);
}

bool TaskGraph::isRegisteredDate(Handle handle) const {
    for (const auto& [key, h] : m_dates) {
        if (h == handle) return true;
    }
    return false;
}

void TaskGraph::addRoot(Handle handle) {
    if (!ContainsValue(m_roots, handle)) {
        m_roots.push_back(handle);
    }
}

void TaskGraph::dropRoot(Handle handle) {
    EraseValue(m_roots, handle);
}

void TaskGraph::dropArchived(Handle handle) {
    EraseValue(m_archived, handle);
}

void TaskGraph::dropDate(Handle handle) {
    const DateData* date = liveNode(handle).asDate();
    if (!date) return;

    auto it = m_dates.find(date->date.toKey());
    if (it != m_dates.end() && it->second == handle) {
        m_dates.erase(it);
    }
}

void TaskGraph::dropAlias(Handle handle) {
    auto& alias = liveNode(handle).metadata().alias;
    if (!alias) return;

    auto it = m_aliases.find(*alias);
    if (it != m_aliases.end() && it->second == handle) {
        m_aliases.erase(it);
    }
    alias.reset();
}

void TaskGraph::refreshRootStatus(Handle handle) {
    if (liveNode(handle).getMetadata().parents.empty() && !isRegisteredDate(handle)) {
        addRoot(handle);
    }
}

bool TaskGraph::operator==(const TaskGraph& other) const {
    return m_nodes == other.m_nodes && m_roots == other.m_roots && m_archived == other.m_archived &&
           m_dates == other.m_dates && m_aliases == other.m_aliases;
}

} // namespace taskweave::domain
