/**
 * @file TaskNode.hpp
 * @brief Domain entity representing one node of the task graph.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "CalendarDate.hpp"
#include "GraphErrors.hpp"

namespace taskweave::domain {

/**
 * @enum TaskState
 * @brief Completion state of a task node.
 */
enum class TaskState {
    None,     ///< Nothing done yet.
    Partial,  ///< Some counted children are done or partially done.
    Done      ///< Completed.
};

/** @brief Lowercase name used in persisted documents. */
inline std::string TaskStateToString(TaskState state) {
    switch (state) {
        case TaskState::None: return "none";
        case TaskState::Partial: return "partial";
        case TaskState::Done: return "done";
        default: return "none";
    }
}

/** @brief Parses a persisted state name, or nullopt if unknown. */
inline std::optional<TaskState> TaskStateFromString(const std::string& text) {
    if (text == "none") return TaskState::None;
    if (text == "partial") return TaskState::Partial;
    if (text == "done") return TaskState::Done;
    return std::nullopt;
}

/** @brief Content of an ordinary task. */
struct TaskData {
    TaskState state = TaskState::None;

    bool operator==(const TaskData& other) const { return state == other.state; }
};

/** @brief Content of a node addressed by calendar day. Carries no state. */
struct DateData {
    CalendarDate date;

    bool operator==(const DateData& other) const { return date == other.date; }
};

/** @brief Content of a node that never counts towards completion. */
struct PseudoData {
    bool operator==(const PseudoData&) const { return true; }
};

using NodeContent = std::variant<TaskData, DateData, PseudoData>;

/**
 * @class TaskNode
 * @brief A titled node with typed content and graph bookkeeping.
 */
class TaskNode {
public:
    /**
     * @struct Metadata
     * @brief Graph-level bookkeeping stored on the node itself.
     */
    struct Metadata {
        bool archived = false;              ///< Hidden from default listings.
        Handle index = 0;                   ///< Equal to the node's storage slot.
        std::optional<std::string> alias;   ///< Unique human-chosen name.
        std::vector<Handle> parents;        ///< Ordered, without duplicates.
        std::vector<Handle> children;       ///< Ordered, without duplicates.

        bool operator==(const Metadata& other) const {
            return archived == other.archived && index == other.index && alias == other.alias &&
                   parents == other.parents && children == other.children;
        }
    };

    TaskNode() = default;

    TaskNode(std::string title, Handle index, NodeContent content = TaskData{})
        : m_title(std::move(title)), m_content(std::move(content)) {
        m_metadata.index = index;
    }

    const std::string& getTitle() const { return m_title; }
    void setTitle(std::string title) { m_title = std::move(title); }

    const NodeContent& getContent() const { return m_content; }
    void setContent(NodeContent content) { m_content = std::move(content); }

    const Metadata& getMetadata() const { return m_metadata; }
    Metadata& metadata() { return m_metadata; }

    Handle getIndex() const { return m_metadata.index; }

    bool isTask() const { return std::holds_alternative<TaskData>(m_content); }
    bool isDate() const { return std::holds_alternative<DateData>(m_content); }
    bool isPseudo() const { return std::holds_alternative<PseudoData>(m_content); }

    /** @brief Task content, or nullptr for date and pseudo nodes. */
    const TaskData* asTask() const { return std::get_if<TaskData>(&m_content); }
    TaskData* asTask() { return std::get_if<TaskData>(&m_content); }

    /** @brief Date content, or nullptr for other node types. */
    const DateData* asDate() const { return std::get_if<DateData>(&m_content); }

    /** @brief Shorthand for task state; date and pseudo nodes report None. */
    TaskState getState() const {
        const TaskData* task = asTask();
        return task ? task->state : TaskState::None;
    }

    bool hasParent(Handle handle) const { return Contains(m_metadata.parents, handle); }
    bool hasChild(Handle handle) const { return Contains(m_metadata.children, handle); }

    bool operator==(const TaskNode& other) const {
        return m_title == other.m_title && m_content == other.m_content && m_metadata == other.m_metadata;
    }
    bool operator!=(const TaskNode& other) const { return !(*this == other); }

private:
    static bool Contains(const std::vector<Handle>& list, Handle handle) {
        for (Handle h : list) {
            if (h == handle) return true;
        }
        return false;
    }

    std::string m_title; ///< Human-readable title.
    NodeContent m_content; ///< Type-specific payload.
    Metadata m_metadata; ///< Index, alias, archival flag and edges.
};

} // namespace taskweave::domain
