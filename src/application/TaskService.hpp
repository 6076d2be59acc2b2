/**
 * @file TaskService.hpp
 * @brief Token-level operations on the persisted task graph.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/BlueprintService.hpp"
#include "domain/CalendarDate.hpp"
#include "domain/TaskGraph.hpp"
#include "domain/TaskGraphRepository.hpp"
#include "infrastructure/BlueprintStore.hpp"

namespace taskweave::application {

/**
 * @struct GraphStats
 * @brief Counts over the whole graph.
 */
struct GraphStats {
    std::size_t nodes = 0;      ///< Live nodes.
    std::size_t tombstones = 0; ///< Removed slots awaiting clean().
    std::size_t roots = 0;
    std::size_t dates = 0;
    std::size_t aliases = 0;
    std::size_t archived = 0;
    std::size_t pseudo = 0;
    std::size_t done = 0;       ///< Task nodes in TaskState::Done.
    std::size_t partial = 0;
    std::size_t pending = 0;    ///< Task nodes in TaskState::None.
};

/**
 * @struct NodeStats
 * @brief Summary of one node and the subtree below it.
 */
struct NodeStats {
    domain::Handle handle = 0;
    std::string title;
    std::string type;   ///< "task", "date" or "pseudo".
    std::string state;  ///< Persisted state name.
    std::optional<std::string> alias;
    bool archived = false;
    std::vector<domain::Handle> parents;
    std::vector<domain::Handle> children;
    std::size_t descendants = 0;     ///< Distinct nodes below, pseudo included.
    std::size_t doneDescendants = 0; ///< Of those, tasks in TaskState::Done.
};

/**
 * @class TaskService
 * @brief Resolves user tokens and applies graph operations.
 *
 * Holds the working copy of the graph between Load() and Save().
 */
class TaskService {
public:
    /**
     * @param repo Store of the graph document.
     * @param blueprints Store of saved blueprints.
     * @param today Reference day for relative date tokens.
     */
    TaskService(std::unique_ptr<domain::TaskGraphRepository> repo,
                std::shared_ptr<infrastructure::BlueprintStore> blueprints,
                domain::CalendarDate today = domain::CalendarDate::today());

    void Load();
    void Save();

    domain::TaskGraph& GetGraph() { return m_graph; }
    const domain::TaskGraph& GetGraph() const { return m_graph; }

    /**
     * @brief Resolves @p token to a handle.
     * @param assumeDate Read the token as a date only (month names allowed).
     */
    domain::Handle Resolve(const std::string& token, bool assumeDate = false) const;

    // --- Creation ---
    domain::Handle AddRoot(const std::string& title, bool pseudo = false);
    domain::Handle AddChild(const std::string& title, const std::string& parentToken, bool pseudo = false);

    /**
     * @brief Creates (or returns) the date node for a date keyword.
     * @throws domain::MalformedDateError if @p dateToken is no date.
     */
    domain::Handle AddDate(const std::string& dateToken, const std::string& title = "");

    // --- Edges ---
    void Link(const std::string& parentToken, const std::string& childToken);
    void Unlink(const std::string& parentToken, const std::string& childToken);

    /** @brief Detaches the node from every parent and links it under the new one. */
    void Move(const std::string& token, const std::string& parentToken);

    /** @brief Copies one node (title, type, state) under a parent. */
    domain::Handle Copy(const std::string& token, const std::string& parentToken);

    /**
     * @brief Copies a node and everything below it under a parent.
     *
     * Shared descendants are copied once per path, as a tree.
     * @throws domain::CycleDetectedError if the source subtree loops.
     */
    domain::Handle CopyRecursive(const std::string& token, const std::string& parentToken);

    /**
     * @brief Moves a node within its parent's child list.
     * @param parentToken Parent to reorder within; defaults to the first parent.
     * @throws std::invalid_argument if the node has no such parent.
     */
    void Reorder(const std::string& token, long delta, const std::optional<std::string>& parentToken = std::nullopt);

    // --- Fields ---
    void SetState(const std::string& token, domain::TaskState state, bool propagate);
    void Archive(const std::string& token, bool archived);
    void Rename(const std::string& token, const std::string& title);
    void SetAlias(const std::string& token, const std::string& alias);
    void UnsetAlias(const std::string& token);
    void Remove(const std::string& token, bool recursive);
    void Clean();

    // --- Queries ---
    GraphStats Stats() const;
    NodeStats Stats(const std::string& token) const;

    /**
     * @brief Tree listing below a node, or below every root when @p token is empty.
     */
    std::vector<domain::TraversalEntry> List(const std::optional<std::string>& token,
                                             bool includeArchived,
                                             std::size_t maxDepth) const;

    // --- Blueprints ---

    /**
     * @brief Saves the subtree at @p token as blueprint @p name.
     * @param preserve If false the subtree is removed from the graph afterwards.
     */
    void SaveBlueprint(const std::string& token,
                       const std::string& name,
                       const std::optional<std::string>& author,
                       bool overwrite,
                       bool preserve);

    /**
     * @brief Inserts a stored blueprint under @p parentToken, or as a root.
     * @return Handle of the inserted subtree root.
     */
    domain::Handle LoadBlueprint(const std::string& name,
                                 const std::optional<std::string>& parentToken,
                                 const std::optional<std::string>& title = std::nullopt);

    std::vector<std::string> ListBlueprints() const;
    domain::BlueprintDocument GetBlueprint(const std::string& name) const;

private:
    domain::Handle CopyNode(domain::Handle source, domain::Handle parent);

    std::unique_ptr<domain::TaskGraphRepository> m_repo;
    std::shared_ptr<infrastructure::BlueprintStore> m_blueprints;
    BlueprintService m_blueprintService;
    domain::CalendarDate m_today;
    domain::TaskGraph m_graph;
};

} // namespace taskweave::application
