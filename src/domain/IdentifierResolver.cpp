/**
 * @file IdentifierResolver.cpp
 * @brief Token resolution order: date, relative keyword, handle, alias.
 */

#include "domain/IdentifierResolver.hpp"

#include <cctype>
#include <limits>

#include "domain/TaskGraph.hpp"

namespace taskweave::domain {

IdentifierResolver::IdentifierResolver(const TaskGraph& graph, CalendarDate today)
    : m_graph(graph), m_today(today) {}

Handle IdentifierResolver::resolve(const std::string& token) const {
    if (token.empty()) {
        throw MalformedHandleError(token);
    }

    bool dateShaped = CalendarDate::matchesGrammar(token);
    if (dateShaped) {
        if (auto date = CalendarDate::parse(token)) {
            return lookupDate(*date);
        }
    }

    if (auto relative = CalendarDate::parseRelative(token, m_today)) {
        return lookupDate(*relative);
    }

    Handle handle = 0;
    if (ParseHandle(token, handle)) {
        m_graph.node(handle);
        return handle;
    }

    if (auto aliased = m_graph.findAlias(token)) {
        return *aliased;
    }
    if (dateShaped) {
        throw MalformedDateError(token);
    }
    throw InvalidAliasError(token);
}

Handle IdentifierResolver::resolveDate(const std::string& token) const {
    auto date = CalendarDate::parseKeyword(token, m_today);
    if (!date) {
        throw MalformedDateError(token);
    }
    return lookupDate(*date);
}

Handle IdentifierResolver::lookupDate(const CalendarDate& date) const {
    auto handle = m_graph.findDate(date);
    if (!handle) {
        throw InvalidDateError(date.toKey());
    }
    return *handle;
}

bool IdentifierResolver::ParseHandle(const std::string& token, Handle& out) {
    for (char c : token) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }

    const Handle max = std::numeric_limits<Handle>::max();
    Handle value = 0;
    for (char c : token) {
        Handle digit = static_cast<Handle>(c - '0');
        if (value > (max - digit) / 10) {
            throw MalformedHandleError(token);
        }
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

} // namespace taskweave::domain
