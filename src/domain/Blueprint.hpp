/**
 * @file Blueprint.hpp
 * @brief Portable, self-contained copy of a subtree.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "TaskNode.hpp"

namespace taskweave::domain {

/**
 * @struct BlueprintDocument
 * @brief A subtree renumbered from 0 so it can be re-inserted anywhere.
 *
 * nodes[0] is the subtree root and has no parents. Every edge stays inside
 * the node list and every node's index equals its position.
 */
struct BlueprintDocument {
    std::string title;                  ///< Title of the root at extraction time.
    std::optional<std::string> author;  ///< Free-form author tag.
    int version = 0;                    ///< Document version that wrote it.
    std::vector<TaskNode> nodes;        ///< Preorder discovery order.

    bool operator==(const BlueprintDocument& other) const {
        return title == other.title && author == other.author && version == other.version && nodes == other.nodes;
    }
};

} // namespace taskweave::domain
