/**
 * @file GraphRepository.cpp
 * @brief Implementation of GraphRepository.
 */

#include "infrastructure/GraphRepository.hpp"
#include <iostream>
#include "infrastructure/DocumentCodec.hpp"

namespace taskweave::infrastructure {

GraphRepository::GraphRepository(std::string path, std::shared_ptr<PersistenceService> persistence)
    : m_path(std::move(path)), m_persistence(std::move(persistence)) {}

domain::TaskGraph GraphRepository::load() {
    auto text = m_persistence->loadText(m_path);
    if (!text) {
        return domain::TaskGraph();
    }
    try {
        return DocumentCodec::DecodeYaml(*text);
    } catch (const ParseError& e) {
        std::cerr << "[GraphRepository] Cannot load " << m_path << ": " << e.what() << std::endl;
        throw;
    }
}

void GraphRepository::save(const domain::TaskGraph& graph) {
    m_persistence->saveText(m_path, DocumentCodec::EncodeYaml(graph));
}

} // namespace taskweave::infrastructure
