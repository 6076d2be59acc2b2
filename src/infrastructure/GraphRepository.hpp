/**
 * @file GraphRepository.hpp
 * @brief File-based implementation of the TaskGraphRepository.
 */

#pragma once
#include <memory>
#include <string>
#include "domain/TaskGraphRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace taskweave::infrastructure {

/**
 * @class GraphRepository
 * @brief Stores the graph as a YAML document at a fixed path.
 */
class GraphRepository : public domain::TaskGraphRepository {
public:
    /**
     * @param path Save file, resolved once by the caller.
     * @param persistence Shared file writer.
     */
    GraphRepository(std::string path, std::shared_ptr<PersistenceService> persistence);

    /** @brief A missing or empty file loads as an empty graph. @see DocumentCodec::DecodeYaml */
    domain::TaskGraph load() override;

    /** @brief Atomically rewrites the file in the current document version. */
    void save(const domain::TaskGraph& graph) override;

    const std::string& getPath() const { return m_path; }

private:
    std::string m_path; ///< Save file location.
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace taskweave::infrastructure
