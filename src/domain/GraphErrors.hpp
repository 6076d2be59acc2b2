/**
 * @file GraphErrors.hpp
 * @brief Exceptions raised by task graph operations.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace taskweave::domain {

using Handle = std::size_t;

/**
 * @class GraphError
 * @brief Base class of every recoverable task graph failure.
 */
class GraphError : public std::runtime_error {
public:
    explicit GraphError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief Handle is out of range or refers to a removed node. */
class InvalidHandleError : public GraphError {
public:
    explicit InvalidHandleError(Handle handle)
        : GraphError("Invalid handle: '" + std::to_string(handle) + "'"), m_handle(handle) {}

    Handle handle() const { return m_handle; }

private:
    Handle m_handle;
};

/** @brief Token is neither a usable handle, alias nor date. */
class MalformedHandleError : public GraphError {
public:
    explicit MalformedHandleError(const std::string& token)
        : GraphError("Malformed handle: '" + token + "'"), m_token(token) {}

    const std::string& token() const { return m_token; }

private:
    std::string m_token;
};

class InvalidAliasError : public GraphError {
public:
    explicit InvalidAliasError(const std::string& alias)
        : GraphError("Invalid alias: '" + alias + "'"), m_alias(alias) {}

    const std::string& alias() const { return m_alias; }

private:
    std::string m_alias;
};

/** @brief Well-formed date without a registered date node. */
class InvalidDateError : public GraphError {
public:
    explicit InvalidDateError(const std::string& key)
        : GraphError("Invalid date: '" + key + "'"), m_key(key) {}

    const std::string& key() const { return m_key; }

private:
    std::string m_key;
};

class MalformedDateError : public GraphError {
public:
    explicit MalformedDateError(const std::string& token)
        : GraphError("Malformed date string: '" + token + "'"), m_token(token) {}

    const std::string& token() const { return m_token; }

private:
    std::string m_token;
};

/**
 * @class CycleDetectedError
 * @brief A walk starting at @c start came back to @c reentered.
 */
class CycleDetectedError : public GraphError {
public:
    CycleDetectedError(Handle start, Handle reentered)
        : GraphError("Graph looped back: " + std::to_string(start) + "->...->" +
                     std::to_string(reentered)),
          m_start(start), m_reentered(reentered) {}

    Handle start() const { return m_start; }
    Handle reentered() const { return m_reentered; }

private:
    Handle m_start;
    Handle m_reentered;
};

/** @brief State operation on a date or pseudo node. */
class NotTaskNodeError : public GraphError {
public:
    explicit NotTaskNodeError(Handle handle)
        : GraphError("Node is not a task node: " + std::to_string(handle)), m_handle(handle) {}

    Handle handle() const { return m_handle; }

private:
    Handle m_handle;
};

} // namespace taskweave::domain
