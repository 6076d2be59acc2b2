/**
 * @file TaskWeaveApp.hpp
 * @brief Command line front end of TaskWeave.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "application/TaskService.hpp"
#include "infrastructure/BlueprintStore.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace taskweave::app {

/**
 * @class TaskWeaveApp
 * @brief Parses one command line, runs it against the graph and saves when it changed.
 */
class TaskWeaveApp {
public:
    /**
     * @brief Runs a single command.
     * @return Exit code (0 for success).
     */
    int Run(int argc, char** argv);

private:
    /**
     * @brief Loads the configuration and wires the services.
     * @param fileOverride Graph document path given with --file, or empty.
     */
    void Init(const std::string& fileOverride);

    /** @brief Picks the graph document: --file, then ./<save_file>, then the data directory. */
    std::string ResolveSavePath(const std::string& fileOverride) const;

    /** @return True if the graph was modified and must be saved. */
    bool Dispatch(const std::string& command, std::vector<std::string> args);

    /** @brief @p token as given, or the handle of its date when -D is set. */
    std::string Id(const std::string& token) const;

    /** @brief Resolves every token up front so that later changes cannot redirect them. */
    std::vector<domain::Handle> Ids(const std::vector<std::string>& tokens) const;

    bool RunBlueprint(std::vector<std::string> args);
    int RunConfig(const std::vector<std::string>& args);

    void PrintTree(const std::vector<domain::TraversalEntry>& entries) const;
    static void PrintTreeOf(const domain::TaskGraph& graph, const std::vector<domain::TraversalEntry>& entries);
    void PrintUsage() const;

    infrastructure::AppConfig m_config; ///< Effective settings.
    std::string m_savePath; ///< Graph document in use.
    bool m_assumeDate = false; ///< -D: read every id of the command as a date.
    std::shared_ptr<infrastructure::BlueprintStore> m_blueprints; ///< Shared with the service.
    std::unique_ptr<application::TaskService> m_service; ///< Created by Init().
};

} // namespace taskweave::app
