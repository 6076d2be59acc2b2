/**
 * @file TaskGraphRepository.hpp
 * @brief Interface for loading and saving the task graph document.
 */

#pragma once

#include "TaskGraph.hpp"

namespace taskweave::domain {

/**
 * @class TaskGraphRepository
 * @brief Abstract persistent storage of a single task graph.
 */
class TaskGraphRepository {
public:
    virtual ~TaskGraphRepository() = default;

    /** @brief Loads the stored graph; an absent or empty store yields an empty graph. */
    virtual TaskGraph load() = 0;

    /** @brief Replaces the stored graph with @p graph. */
    virtual void save(const TaskGraph& graph) = 0;
};

} // namespace taskweave::domain
