/**
 * @file TaskService.cpp
 * @brief Implementation of TaskService.
 */

#include "application/TaskService.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>
#include <stdexcept>

#include "domain/IdentifierResolver.hpp"
#include "infrastructure/DocumentCodec.hpp"

namespace taskweave::application {

using domain::Handle;
using domain::TaskGraph;
using domain::TaskNode;
using domain::TaskState;

namespace {

bool IsNumeric(const std::string& text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
}

/// One node of a planned tree copy: the source and the plan index of its new parent.
struct CopyStep {
    Handle source;
    std::size_t parentStep;
};

void PlanCopy(const TaskGraph& graph,
              Handle root,
              Handle handle,
              std::size_t parentStep,
              std::vector<Handle>& path,
              std::vector<CopyStep>& plan) {
    if (std::find(path.begin(), path.end(), handle) != path.end()) {
        throw domain::CycleDetectedError(root, handle);
    }
    std::size_t step = plan.size();
    plan.push_back(CopyStep{handle, parentStep});

    path.push_back(handle);
    for (Handle child : graph.node(handle).getMetadata().children) {
        PlanCopy(graph, root, child, step, path, plan);
    }
    path.pop_back();
}

} // namespace

TaskService::TaskService(std::unique_ptr<domain::TaskGraphRepository> repo,
                         std::shared_ptr<infrastructure::BlueprintStore> blueprints,
                         domain::CalendarDate today)
    : m_repo(std::move(repo)), m_blueprints(std::move(blueprints)), m_today(today) {}

void TaskService::Load() {
    m_graph = m_repo->load();
}

void TaskService::Save() {
    m_repo->save(m_graph);
}

Handle TaskService::Resolve(const std::string& token, bool assumeDate) const {
    domain::IdentifierResolver resolver(m_graph, m_today);
    return assumeDate ? resolver.resolveDate(token) : resolver.resolve(token);
}

// --- Creation ---

Handle TaskService::AddRoot(const std::string& title, bool pseudo) {
    return m_graph.insertRoot(title, pseudo);
}

Handle TaskService::AddChild(const std::string& title, const std::string& parentToken, bool pseudo) {
    return m_graph.insertChild(title, Resolve(parentToken), pseudo);
}

Handle TaskService::AddDate(const std::string& dateToken, const std::string& title) {
    auto date = domain::CalendarDate::parseKeyword(dateToken, m_today);
    if (!date) {
        throw domain::MalformedDateError(dateToken);
    }
    return title.empty() ? m_graph.insertDate(*date) : m_graph.insertDate(*date, title);
}

// --- Edges ---

void TaskService::Link(const std::string& parentToken, const std::string& childToken) {
    m_graph.link(Resolve(parentToken), Resolve(childToken));
}

void TaskService::Unlink(const std::string& parentToken, const std::string& childToken) {
    m_graph.unlink(Resolve(parentToken), Resolve(childToken));
}

void TaskService::Move(const std::string& token, const std::string& parentToken) {
    Handle node = Resolve(token);
    Handle parent = Resolve(parentToken);
    m_graph.cleanParents(node);
    m_graph.link(parent, node);
}

Handle TaskService::CopyNode(Handle source, Handle parent) {
    const TaskNode& node = m_graph.node(source);
    std::string title = node.getTitle();
    bool pseudo = node.isPseudo();
    std::optional<TaskState> state;
    if (const auto* task = node.asTask()) {
        state = task->state;
    }

    Handle copy = m_graph.insertChild(title, parent, pseudo);
    if (state) {
        m_graph.setState(copy, *state, true);
    }
    return copy;
}

Handle TaskService::Copy(const std::string& token, const std::string& parentToken) {
    Handle source = Resolve(token);
    Handle parent = Resolve(parentToken);
    return CopyNode(source, parent);
}

Handle TaskService::CopyRecursive(const std::string& token, const std::string& parentToken) {
    Handle source = Resolve(token);
    Handle parent = Resolve(parentToken);

    // Plan first so copies placed inside the source subtree are not copied again.
    std::vector<CopyStep> plan;
    std::vector<Handle> path;
    PlanCopy(m_graph, source, source, 0, path, plan);

    std::vector<Handle> created;
    created.reserve(plan.size());
    for (std::size_t i = 0; i < plan.size(); ++i) {
        Handle target = i == 0 ? parent : created[plan[i].parentStep];
        created.push_back(CopyNode(plan[i].source, target));
    }
    return created.front();
}

void TaskService::Reorder(const std::string& token, long delta, const std::optional<std::string>& parentToken) {
    Handle node = Resolve(token);
    const auto& parents = m_graph.node(node).getMetadata().parents;

    Handle parent = 0;
    if (parentToken) {
        parent = Resolve(*parentToken);
        if (std::find(parents.begin(), parents.end(), parent) == parents.end()) {
            throw std::invalid_argument("Index " + std::to_string(parent) + " is not parent of " +
                                        std::to_string(node));
        }
    } else {
        if (parents.empty()) {
            throw std::invalid_argument("Node " + std::to_string(node) + " has no parent to reorder within");
        }
        parent = parents.front();
    }
    m_graph.reorderChild(parent, node, delta);
}

// --- Fields ---

void TaskService::SetState(const std::string& token, TaskState state, bool propagate) {
    m_graph.setState(Resolve(token), state, propagate);
}

void TaskService::Archive(const std::string& token, bool archived) {
    m_graph.setArchived(Resolve(token), archived);
}

void TaskService::Rename(const std::string& token, const std::string& title) {
    m_graph.rename(Resolve(token), title);
}

void TaskService::SetAlias(const std::string& token, const std::string& alias) {
    Handle target = Resolve(token);
    if (IsNumeric(alias)) {
        std::cerr << "[TaskService] Alias '" << alias
                  << "' is numeric and will resolve as a handle, not as this alias" << std::endl;
    }
    m_graph.setAlias(target, alias);
}

void TaskService::UnsetAlias(const std::string& token) {
    m_graph.unsetAlias(Resolve(token));
}

void TaskService::Remove(const std::string& token, bool recursive) {
    Handle target = Resolve(token);
    if (recursive) {
        m_graph.removeChildrenRecursive(target);
    } else {
        m_graph.remove(target);
    }
}

void TaskService::Clean() {
    m_graph.clean();
}

// --- Queries ---

GraphStats TaskService::Stats() const {
    GraphStats stats;
    stats.nodes = m_graph.nodeCount();
    stats.tombstones = m_graph.slotCount() - stats.nodes;
    stats.roots = m_graph.roots().size();
    stats.dates = m_graph.dates().size();
    stats.aliases = m_graph.aliases().size();
    stats.archived = m_graph.archived().size();

    for (const auto& slot : m_graph.nodes()) {
        if (!slot) continue;
        if (slot->isPseudo()) {
            ++stats.pseudo;
            continue;
        }
        if (!slot->isTask()) continue;
        switch (slot->getState()) {
            case TaskState::Done: ++stats.done; break;
            case TaskState::Partial: ++stats.partial; break;
            case TaskState::None: ++stats.pending; break;
        }
    }
    return stats;
}

NodeStats TaskService::Stats(const std::string& token) const {
    Handle handle = Resolve(token);
    const TaskNode& node = m_graph.node(handle);

    NodeStats stats;
    stats.handle = handle;
    stats.title = node.getTitle();
    stats.type = node.isDate() ? "date" : (node.isPseudo() ? "pseudo" : "task");
    stats.state = node.isPseudo() ? "pseudo" : domain::TaskStateToString(node.getState());
    stats.alias = node.getMetadata().alias;
    stats.archived = node.getMetadata().archived;
    stats.parents = node.getMetadata().parents;
    stats.children = node.getMetadata().children;

    std::set<Handle> below;
    for (const auto& entry : m_graph.traverse({handle}, true, 0)) {
        if (entry.handle != handle) below.insert(entry.handle);
    }
    stats.descendants = below.size();
    for (Handle h : below) {
        if (m_graph.node(h).isTask() && m_graph.node(h).getState() == TaskState::Done) {
            ++stats.doneDescendants;
        }
    }
    return stats;
}

std::vector<domain::TraversalEntry> TaskService::List(const std::optional<std::string>& token,
                                                      bool includeArchived,
                                                      std::size_t maxDepth) const {
    if (token) {
        return m_graph.traverse({Resolve(*token)}, includeArchived, maxDepth);
    }
    return m_graph.traverse(m_graph.roots(), includeArchived, maxDepth);
}

// --- Blueprints ---

void TaskService::SaveBlueprint(const std::string& token,
                                const std::string& name,
                                const std::optional<std::string>& author,
                                bool overwrite,
                                bool preserve) {
    Handle root = Resolve(token);
    domain::BlueprintDocument doc = m_blueprintService.extractBlueprint(
        m_graph, root, author, infrastructure::DocumentCodec::CurrentVersion);
    m_blueprints->save(name, doc, overwrite);

    if (!preserve) {
        m_graph.removeChildrenRecursive(root);
    }
}

Handle TaskService::LoadBlueprint(const std::string& name,
                                  const std::optional<std::string>& parentToken,
                                  const std::optional<std::string>& title) {
    domain::BlueprintDocument doc = m_blueprints->load(name);
    std::optional<Handle> parent;
    if (parentToken) {
        parent = Resolve(*parentToken);
    }
    return m_blueprintService.importBlueprint(m_graph, doc, parent, title);
}

std::vector<std::string> TaskService::ListBlueprints() const {
    return m_blueprints->list();
}

domain::BlueprintDocument TaskService::GetBlueprint(const std::string& name) const {
    return m_blueprints->load(name);
}

} // namespace taskweave::application
