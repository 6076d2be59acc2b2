/**
 * @file BlueprintStore.hpp
 * @brief Directory of saved blueprint documents addressed by name.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "domain/Blueprint.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace taskweave::infrastructure {

/**
 * @class BlueprintStore
 * @brief Keeps each blueprint as `<directory>/<name>.yaml`.
 */
class BlueprintStore {
public:
    BlueprintStore(std::string directory, std::shared_ptr<PersistenceService> persistence);

    /**
     * @brief Writes a blueprint under @p name.
     * @throws IOError if @p name is not a plain file stem (empty, a path
     *         separator or ".."), if it exists and @p overwrite is false, or on
     *         write failure.
     */
    void save(const std::string& name, const domain::BlueprintDocument& doc, bool overwrite = false);

    /**
     * @brief Loads a blueprint by store name, or by file path when no such name exists.
     * @throws IOError if neither exists; ParseError if the file is malformed.
     */
    domain::BlueprintDocument load(const std::string& name) const;

    /** @brief Sorted names of the stored blueprints. */
    std::vector<std::string> list() const;

    /** @return False if no blueprint had that name. @throws IOError on an invalid name. */
    bool remove(const std::string& name);

    std::string pathFor(const std::string& name) const;

private:
    std::string m_directory;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace taskweave::infrastructure
