/**
 * @file TaskGraph.hpp
 * @brief Aggregate Root for the multi-parent task graph.
 */

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "CalendarDate.hpp"
#include "GraphErrors.hpp"
#include "TaskNode.hpp"

namespace taskweave::domain {

/**
 * @struct TraversalEntry
 * @brief One visited node of a traversal and its nesting depth.
 */
struct TraversalEntry {
    Handle handle;      ///< Visited node.
    std::size_t depth;  ///< 0 for the start handles.
};

/**
 * @class TaskGraph
 * @brief Slot array of nodes plus the derived root, archive, date and alias indices.
 *
 * Nodes are addressed by handle (their slot). Removal leaves a tombstone in
 * the slot; handles only change when clean() compacts the graph.
 * Mutators taking handles throw InvalidHandleError for out-of-range or
 * removed handles.
 */
class TaskGraph {
public:
    using Slot = std::optional<TaskNode>;

    TaskGraph() = default;

    /**
     * @brief Rebuilds a graph from already validated parts.
     * @note Used by the document codec; no invariant checking is done here.
     */
    static TaskGraph restore(std::vector<Slot> nodes,
                             std::vector<Handle> roots,
                             std::vector<Handle> archived,
                             std::map<std::string, Handle> dates,
                             std::map<std::string, Handle> aliases);

    // --- Accessors ---

    /** @brief Number of slots, tombstones included. */
    std::size_t slotCount() const { return m_nodes.size(); }

    /** @brief Number of live nodes. */
    std::size_t nodeCount() const;

    bool isLive(Handle handle) const { return handle < m_nodes.size() && m_nodes[handle].has_value(); }

    /** @brief Live node at @p handle, or InvalidHandleError. */
    const TaskNode& node(Handle handle) const;

    const std::vector<Slot>& nodes() const { return m_nodes; }
    const std::vector<Handle>& roots() const { return m_roots; }
    const std::vector<Handle>& archived() const { return m_archived; }
    const std::map<std::string, Handle>& dates() const { return m_dates; }
    const std::map<std::string, Handle>& aliases() const { return m_aliases; }

    std::optional<Handle> findDate(const CalendarDate& date) const;
    std::optional<Handle> findAlias(const std::string& alias) const;

    /**
     * @brief Resolves a user token (date, relative date, handle or alias).
     * @see IdentifierResolver
     */
    Handle resolve(const std::string& token) const;

    // --- Node creation ---

    Handle insertRoot(const std::string& title, bool pseudo = false);

    /**
     * @brief Inserts a node as the last child of @p parent.
     *
     * Non-pseudo children trigger a state recomputation of the parent chain.
     */
    Handle insertChild(const std::string& title, Handle parent, bool pseudo = false);

    /**
     * @brief Inserts a date node titled with its key.
     * @return The new handle, or the existing one if the date is already registered.
     */
    Handle insertDate(const CalendarDate& date);
    Handle insertDate(const CalendarDate& date, const std::string& title);

    // --- Edges ---

    /** @brief Adds the edge parent -> child and recomputes the child's parents. */
    void link(Handle parent, Handle child);

    /** @brief Removes the edge parent -> child and recomputes the former parents. */
    void unlink(Handle parent, Handle child);

    /** @brief Detaches @p target from every parent, making it a root. */
    void cleanParents(Handle target);

    /**
     * @brief Moves @p child within the child list of @p parent.
     * @param delta Negative moves towards the front; clamped to the list bounds.
     */
    void reorderChild(Handle parent, Handle child, long delta);

    // --- Removal ---

    /** @brief Tombstones @p target, promoting orphaned children to roots. */
    void remove(Handle target);

    /** @brief Tombstones @p target and everything reachable below it. */
    void removeChildrenRecursive(Handle target);

    // --- Field mutation ---

    void rename(Handle target, const std::string& title);
    void setArchived(Handle target, bool archived);

    /**
     * @brief Points @p alias at @p target.
     * @note An existing owner of the same alias is not cleared.
     */
    void setAlias(Handle target, const std::string& alias);

    /** @brief Removes the alias of @p target; no-op when it has none. */
    void unsetAlias(Handle target);

    // --- State propagation (StatePropagation.cpp) ---

    /**
     * @brief Sets the completion state of a task node.
     * @param propagate If true, descendants take the same state (pseudo
     *        subtrees excepted) and every ancestor is recomputed.
     * @throws NotTaskNodeError for date and pseudo nodes.
     */
    void setState(Handle target, TaskState state, bool propagate);

    // --- Compaction and traversal (GraphCompaction.cpp) ---

    /**
     * @brief Resynchronizes the indices from node-local data and densely renumbers handles.
     */
    void clean();

    /**
     * @brief Depth-first listing below the given handles.
     * @param includeArchived If false, archived nodes and their subtrees are skipped.
     * @param maxDepth 0 for unlimited; otherwise entries have depth <= maxDepth.
     * @throws CycleDetectedError when a walk re-enters a handle on its own path.
     */
    std::vector<TraversalEntry> traverse(const std::vector<Handle>& starts,
                                         bool includeArchived,
                                         std::size_t maxDepth) const;

    bool operator==(const TaskGraph& other) const;
    bool operator!=(const TaskGraph& other) const { return !(*this == other); }

private:
    TaskNode& mutableNode(Handle handle);

    /** @brief Live node on an internal path; a tombstone here is a bug. */
    const TaskNode& liveNode(Handle handle) const;
    TaskNode& liveNode(Handle handle);

    Handle appendNode(const std::string& title, NodeContent content);

    void addEdge(Handle parent, Handle child);
    void removeEdge(Handle parent, Handle child);

    bool isRegisteredDate(Handle handle) const;
    void addRoot(Handle handle);
    void dropRoot(Handle handle);
    void dropArchived(Handle handle);
    void dropDate(Handle handle);
    void dropAlias(Handle handle);

    /** @brief Re-adds @p handle to the roots if it has no parent and is not a date. */
    void refreshRootStatus(Handle handle);

    void removeSubtree(Handle target);

    void propagateDown(const std::vector<Handle>& handles, TaskState state, std::vector<Handle>& path);
    void recomputeAncestors(const std::vector<Handle>& parents);
    void recomputeAncestors(const std::vector<Handle>& parents, std::vector<Handle>& path);
    void recomputeNode(Handle handle);

    void walk(const std::vector<Handle>& handles,
              Handle start,
              bool includeArchived,
              std::size_t maxDepth,
              std::size_t depth,
              std::vector<Handle>& path,
              std::vector<TraversalEntry>& out) const;

    std::vector<Slot> m_nodes; ///< Slot array; empty optional marks a tombstone.
    std::vector<Handle> m_roots; ///< Parentless non-date nodes.
    std::vector<Handle> m_archived; ///< Nodes flagged archived.
    std::map<std::string, Handle> m_dates; ///< "YYYY-MM-DD" -> date node.
    std::map<std::string, Handle> m_aliases; ///< Alias -> node.
};

} // namespace taskweave::domain
