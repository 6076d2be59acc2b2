/**
 * @file PersistenceService.hpp
 * @brief Centralized service for atomic file I/O operations.
 */

#pragma once
#include <optional>
#include <string>

namespace taskweave::infrastructure {

/**
 * @class PersistenceService
 * @brief Reads whole files and replaces them atomically.
 *
 * A write goes to a temporary sibling file that is renamed over the target,
 * so readers only ever see the old or the new content.
 */
class PersistenceService {
public:
    /**
     * @brief Replaces the content of a file, creating parent directories as needed.
     * @param filename Path of the target file.
     * @param content The string content to write.
     * @throws IOError if any step fails; the target is left untouched.
     */
    void saveText(const std::string& filename, const std::string& content);

    /**
     * @brief Reads a whole file.
     * @return The content, or nullopt if the file does not exist.
     * @throws IOError if the file exists but cannot be read.
     */
    std::optional<std::string> loadText(const std::string& filename) const;

    /** @brief Deletes a file. @return False if it did not exist. */
    bool remove(const std::string& filename);

private:
    /**
     * @brief Performs the actual atomic write (temp -> rename).
     */
    void performAtomicWrite(const std::string& filename, const std::string& content);
};

} // namespace taskweave::infrastructure
