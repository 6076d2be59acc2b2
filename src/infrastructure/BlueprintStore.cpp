/**
 * @file BlueprintStore.cpp
 * @brief Implementation of BlueprintStore.
 */

#include "infrastructure/BlueprintStore.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <optional>
#include "infrastructure/DocumentCodec.hpp"

namespace fs = std::filesystem;

namespace taskweave::infrastructure {

namespace {

const char* kExtension = ".yaml";

// A store name is a single file stem inside the blueprint directory.
bool IsStoreName(const std::string& name) {
    return !name.empty() && name.find_first_of("/\\") == std::string::npos &&
           name.find("..") == std::string::npos;
}

void RequireStoreName(const std::string& name) {
    if (!IsStoreName(name)) {
        throw IOError("invalid blueprint name '" + name + "'");
    }
}

} // namespace

BlueprintStore::BlueprintStore(std::string directory, std::shared_ptr<PersistenceService> persistence)
    : m_directory(std::move(directory)), m_persistence(std::move(persistence)) {}

std::string BlueprintStore::pathFor(const std::string& name) const {
    return (fs::path(m_directory) / (name + kExtension)).string();
}

void BlueprintStore::save(const std::string& name, const domain::BlueprintDocument& doc, bool overwrite) {
    RequireStoreName(name);
    std::string path = pathFor(name);
    std::error_code ec;
    if (!overwrite && fs::exists(path, ec)) {
        throw IOError("blueprint file already exists at " + path);
    }
    m_persistence->saveText(path, DocumentCodec::EncodeBlueprint(doc));
}

domain::BlueprintDocument BlueprintStore::load(const std::string& name) const {
    std::optional<std::string> text;
    if (IsStoreName(name)) {
        text = m_persistence->loadText(pathFor(name));
    }
    if (!text) {
        // Fall back to treating the name as a path.
        text = m_persistence->loadText(name);
    }
    if (!text) {
        throw IOError("no blueprint named '" + name + "'");
    }
    return DocumentCodec::DecodeBlueprint(*text);
}

std::vector<std::string> BlueprintStore::list() const {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(m_directory, ec)) {
        return names;
    }

    try {
        for (const auto& entry : fs::directory_iterator(m_directory)) {
            if (entry.is_regular_file() && entry.path().extension() == kExtension) {
                names.push_back(entry.path().stem().string());
            }
        }
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[BlueprintStore] Error listing " << m_directory << ": " << e.what() << std::endl;
        throw IOError(e.what());
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool BlueprintStore::remove(const std::string& name) {
    RequireStoreName(name);
    return m_persistence->remove(pathFor(name));
}

} // namespace taskweave::infrastructure
