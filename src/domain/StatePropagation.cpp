/**
 * @file StatePropagation.cpp
 * @brief Completion state propagation of TaskGraph.
 *
 * Downward propagation copies a state into every descendant except pseudo
 * subtrees. Upward recomputation derives a parent's state from its counted
 * (non-pseudo) children and continues through every parent chain.
 */

#include "domain/TaskGraph.hpp"

#include <algorithm>

namespace taskweave::domain {

namespace {

bool OnPath(const std::vector<Handle>& path, Handle handle) {
    return std::find(path.begin(), path.end(), handle) != path.end();
}

} // namespace

void TaskGraph::setState(Handle target, TaskState state, bool propagate) {
    TaskData* task = mutableNode(target).asTask();
    if (!task) {
        throw NotTaskNodeError(target);
    }
    task->state = state;

    if (!propagate) return;

    std::vector<Handle> path{target};
    std::vector<Handle> children = liveNode(target).getMetadata().children;
    propagateDown(children, state, path);

    std::vector<Handle> parents = liveNode(target).getMetadata().parents;
    recomputeAncestors(parents, path);
}

void TaskGraph::propagateDown(const std::vector<Handle>& handles, TaskState state, std::vector<Handle>& path) {
    for (Handle handle : handles) {
        if (OnPath(path, handle)) continue;

        TaskNode& node = liveNode(handle);
        if (node.isPseudo()) continue;
        if (TaskData* task = node.asTask()) {
            task->state = state;
        }

        path.push_back(handle);
        std::vector<Handle> children = node.getMetadata().children;
        propagateDown(children, state, path);

        std::vector<Handle> parents = liveNode(handle).getMetadata().parents;
        recomputeAncestors(parents, path);
        path.pop_back();
    }
}

void TaskGraph::recomputeAncestors(const std::vector<Handle>& parents) {
    std::vector<Handle> path;
    recomputeAncestors(parents, path);
}

void TaskGraph::recomputeAncestors(const std::vector<Handle>& parents, std::vector<Handle>& path) {
    for (Handle parent : parents) {
        if (OnPath(path, parent)) continue;

        // Pseudo parents keep their state and shield everything above them.
        if (liveNode(parent).isPseudo()) continue;

        recomputeNode(parent);

        path.push_back(parent);
        std::vector<Handle> grandParents = liveNode(parent).getMetadata().parents;
        recomputeAncestors(grandParents, path);
        path.pop_back();
    }
}

void TaskGraph::recomputeNode(Handle handle) {
    TaskNode& node = liveNode(handle);
    TaskData* task = node.asTask();
    if (!task) return; // date nodes carry no state

    std::size_t counted = 0;
    std::size_t done = 0;
    bool progressed = false;
    for (Handle child : node.getMetadata().children) {
        const TaskNode& childNode = liveNode(child);
        if (childNode.isPseudo()) continue;

        ++counted;
        TaskState childState = childNode.getState();
        if (childState == TaskState::Done) {
            ++done;
            progressed = true;
        } else if (childState == TaskState::Partial) {
            progressed = true;
        }
    }

    if (done > 0 && done == counted) {
        task->state = TaskState::Done;
    } else if (progressed) {
        task->state = TaskState::Partial;
    } else {
        task->state = TaskState::None;
    }
}

} // namespace taskweave::domain
