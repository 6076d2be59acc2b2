/**
 * @file DocumentErrors.hpp
 * @brief Exceptions raised while reading or writing persisted documents.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace taskweave::infrastructure {

class DocumentError : public std::runtime_error {
public:
    explicit DocumentError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief Payload could not be decoded by any known document version. */
class ParseError : public DocumentError {
public:
    explicit ParseError(const std::string& message) : DocumentError("Parse error: " + message) {}
};

/** @brief Reading or writing a file failed. */
class IOError : public DocumentError {
public:
    explicit IOError(const std::string& message) : DocumentError("I/O error: " + message) {}
};

} // namespace taskweave::infrastructure
