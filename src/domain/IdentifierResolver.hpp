/**
 * @file IdentifierResolver.hpp
 * @brief Maps user tokens (dates, relative dates, handles, aliases) to handles.
 */

#pragma once

#include <string>

#include "CalendarDate.hpp"
#include "GraphErrors.hpp"

namespace taskweave::domain {

class TaskGraph;

/**
 * @class IdentifierResolver
 * @brief Resolves a token against a graph in a fixed order.
 *
 * Order: absolute date, relative date keyword, numeric handle, alias.
 * A purely numeric alias therefore cannot be reached by name.
 */
class IdentifierResolver {
public:
    /**
     * @param graph Graph to resolve against; must outlive the resolver.
     * @param today Reference day for relative keywords.
     */
    explicit IdentifierResolver(const TaskGraph& graph, CalendarDate today = CalendarDate::today());

    /**
     * @brief Resolves @p token to a live handle.
     * @throws InvalidDateError, MalformedDateError, InvalidHandleError,
     *         MalformedHandleError or InvalidAliasError.
     */
    Handle resolve(const std::string& token) const;

    /**
     * @brief Resolves @p token as a date only, accepting month names as well.
     * @throws MalformedDateError if the token is no date; InvalidDateError if
     *         no node is registered for it.
     */
    Handle resolveDate(const std::string& token) const;

private:
    Handle lookupDate(const CalendarDate& date) const;
    static bool ParseHandle(const std::string& token, Handle& out);

    const TaskGraph& m_graph;
    CalendarDate m_today;
};

} // namespace taskweave::domain
