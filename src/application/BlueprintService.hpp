/**
 * @file BlueprintService.hpp
 * @brief Extraction of subtrees into blueprints and their re-insertion.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/Blueprint.hpp"
#include "domain/TaskGraph.hpp"

namespace taskweave::application {

/**
 * @class BlueprintService
 * @brief Stateless conversions between graph subtrees and BlueprintDocument.
 */
class BlueprintService {
public:
    /**
     * @brief Copies the subtree reachable from @p root into a blueprint.
     *
     * Handles are assigned in preorder discovery order starting at 0 for
     * @p root. Shared descendants are cloned once; edges leaving the
     * extracted set are dropped and the root's parents are cleared. Aliases
     * and archive flags are not carried over.
     *
     * @throws domain::InvalidHandleError if @p root is not live.
     * @throws domain::CycleDetectedError if the subtree loops back on itself.
     */
    domain::BlueprintDocument extractBlueprint(const domain::TaskGraph& graph,
                                               domain::Handle root,
                                               std::optional<std::string> author,
                                               int version) const;

    /**
     * @brief Inserts fresh nodes for every blueprint node into @p graph.
     *
     * Date nodes come back as plain tasks, pseudo nodes stay pseudo and every
     * task starts in TaskState::None. The new root is linked under
     * @p targetParent, or registered as a root when none is given.
     *
     * @param title Replaces the root title when set.
     * @return Handle of the new subtree root.
     */
    domain::Handle importBlueprint(domain::TaskGraph& graph,
                                   const domain::BlueprintDocument& doc,
                                   std::optional<domain::Handle> targetParent,
                                   const std::optional<std::string>& title = std::nullopt) const;

    /** @brief Standalone graph holding only the blueprint (for previews). */
    domain::TaskGraph toGraph(const domain::BlueprintDocument& doc) const;

private:
    /** @throws std::invalid_argument when the node list breaks the blueprint invariants. */
    static void Validate(const domain::BlueprintDocument& doc);
};

} // namespace taskweave::application
