/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include "infrastructure/DocumentErrors.hpp"

namespace taskweave::infrastructure {

namespace fs = std::filesystem;

void PersistenceService::saveText(const std::string& filename, const std::string& content) {
    performAtomicWrite(filename, content);
}

std::optional<std::string> PersistenceService::loadText(const std::string& filename) const {
    std::error_code ec;
    if (!fs::exists(filename, ec)) {
        return std::nullopt;
    }
    if (fs::is_directory(filename, ec)) {
        throw IOError(filename + " is a directory");
    }

    std::ifstream ifs(filename, std::ios::binary);
    if (!ifs.is_open()) {
        throw IOError("failed to open " + filename);
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    if (ifs.bad()) {
        throw IOError("failed to read " + filename);
    }
    return buffer.str();
}

bool PersistenceService::remove(const std::string& filename) {
    std::error_code ec;
    bool removed = fs::remove(filename, ec);
    if (ec) {
        throw IOError("failed to remove " + filename + ": " + ec.message());
    }
    return removed;
}

void PersistenceService::performAtomicWrite(const std::string& filename, const std::string& content) {
    fs::path finalPath = filename;

    // Create unique temp path: filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        throw IOError(std::string("creating directories: ") + e.what());
    }

    // 2. Write to Temp
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw IOError("failed to open temp file " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            std::error_code ec;
            fs::remove(tempPath, ec);
            throw IOError("write failed for " + tempPath.string());
        }
    } // Close happens here automatically

    // 3. Atomic Rename
    try {
        fs::rename(tempPath, finalPath);
    } catch (const fs::filesystem_error& e) {
        std::error_code ec;
        fs::remove(tempPath, ec);
        std::cerr << "[PersistenceService] Rename failed: " << e.what() << std::endl;
        throw IOError(std::string("rename failed: ") + e.what());
    }
}

} // namespace taskweave::infrastructure
