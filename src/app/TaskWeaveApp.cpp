/**
 * @file TaskWeaveApp.cpp
 * @brief Implementation of the TaskWeaveApp class.
 */
#include "app/TaskWeaveApp.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>

#include "infrastructure/DocumentCodec.hpp"
#include "infrastructure/GraphRepository.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace taskweave::app {

namespace fs = std::filesystem;

using domain::Handle;
using domain::TaskState;

namespace {

/// Removes @p flag from @p args. Returns whether it was present.
bool TakeFlag(std::vector<std::string>& args, const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end()) return false;
    args.erase(it);
    return true;
}

/// Removes `@p option VALUE` from @p args and returns VALUE.
std::optional<std::string> TakeOption(std::vector<std::string>& args, const std::string& option) {
    auto it = std::find(args.begin(), args.end(), option);
    if (it == args.end()) return std::nullopt;
    if (std::next(it) == args.end()) {
        throw std::invalid_argument("Option " + option + " needs a value");
    }
    std::string value = *std::next(it);
    args.erase(it, std::next(it, 2));
    return value;
}

void Expect(const std::vector<std::string>& args, std::size_t min, std::size_t max, const std::string& usage) {
    if (args.size() < min || args.size() > max) {
        throw std::invalid_argument("Usage: taskweave " + usage);
    }
}

/// Remaining words joined by spaces, so titles need no quoting.
std::string Join(const std::vector<std::string>& args, std::size_t from) {
    std::string out;
    for (std::size_t i = from; i < args.size(); ++i) {
        if (!out.empty()) out += ' ';
        out += args[i];
    }
    return out;
}

long ParseLong(const std::string& text) {
    std::size_t used = 0;
    long value = 0;
    try {
        value = std::stol(text, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Not a number: '" + text + "'");
    }
    if (used != text.size()) {
        throw std::invalid_argument("Not a number: '" + text + "'");
    }
    return value;
}

const char* StateMark(const domain::TaskNode& node) {
    if (node.isDate()) return "[@]";
    if (node.isPseudo()) return "[*]";
    switch (node.getState()) {
        case TaskState::Done: return "[x]";
        case TaskState::Partial: return "[~]";
        case TaskState::None: break;
    }
    return "[ ]";
}

std::string JoinHandles(const std::vector<Handle>& handles) {
    std::ostringstream out;
    for (std::size_t i = 0; i < handles.size(); ++i) {
        if (i) out << ", ";
        out << handles[i];
    }
    return out.str();
}

} // namespace

int TaskWeaveApp::Run(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args.front() == "help" || args.front() == "--help") {
        PrintUsage();
        return args.empty() ? 1 : 0;
    }

    try {
        std::string fileOverride = TakeOption(args, "--file").value_or("");
        if (args.empty()) {
            PrintUsage();
            return 1;
        }
        std::string command = args.front();
        args.erase(args.begin());

        if (command == "config") {
            return RunConfig(args);
        }

        Init(fileOverride);
        m_service->Load();
        if (Dispatch(command, std::move(args))) {
            m_service->Save();
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[Error] " << e.what() << std::endl;
        return 1;
    }
}

void TaskWeaveApp::Init(const std::string& fileOverride) {
    m_config = infrastructure::ConfigLoader::Load(infrastructure::PathUtils::GetAppConfigDir().string());
    m_savePath = ResolveSavePath(fileOverride);

    // Composition Root
    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    auto repo = std::make_unique<infrastructure::GraphRepository>(m_savePath, persistence);
    m_blueprints = std::make_shared<infrastructure::BlueprintStore>(m_config.blueprintDir, persistence);
    m_service = std::make_unique<application::TaskService>(std::move(repo), m_blueprints);
}

std::string TaskWeaveApp::ResolveSavePath(const std::string& fileOverride) const {
    if (!fileOverride.empty()) {
        return fileOverride;
    }
    fs::path local = fs::current_path() / m_config.saveFile;
    if (fs::exists(local)) {
        return local.string();
    }
    return (fs::path(m_config.dataDir) / m_config.saveFile).string();
}

std::string TaskWeaveApp::Id(const std::string& token) const {
    if (!m_assumeDate) return token;
    return std::to_string(m_service->Resolve(token, true));
}

std::vector<Handle> TaskWeaveApp::Ids(const std::vector<std::string>& tokens) const {
    std::vector<Handle> handles;
    handles.reserve(tokens.size());
    for (const auto& token : tokens) {
        handles.push_back(m_service->Resolve(token, m_assumeDate));
    }
    return handles;
}

bool TaskWeaveApp::Dispatch(const std::string& command, std::vector<std::string> args) {
    auto& service = *m_service;
    bool shortFlag = TakeFlag(args, "-D");
    bool longFlag = TakeFlag(args, "--assume-date");
    m_assumeDate = shortFlag || longFlag;

    if (command == "add") {
        bool pseudo = TakeFlag(args, "--pseudo");
        auto parent = TakeOption(args, "--parent");
        TakeFlag(args, "--root");
        Expect(args, 1, args.size(), "add [--root|--parent TOKEN] [--pseudo] TITLE...");
        std::string title = Join(args, 0);
        Handle created = parent ? service.AddChild(title, Id(*parent), pseudo) : service.AddRoot(title, pseudo);
        std::cout << created << std::endl;
        return true;
    }
    if (command == "date") {
        Expect(args, 1, args.size(), "date KEYWORD [TITLE...]");
        std::cout << service.AddDate(args[0], Join(args, 1)) << std::endl;
        return true;
    }
    if (command == "check" || command == "uncheck" || command == "partial") {
        bool noPropagate = TakeFlag(args, "--no-propagate");
        Expect(args, 1, args.size(), command + " [-D] [--no-propagate] TOKEN...");
        TaskState state = command == "check" ? TaskState::Done
                        : command == "partial" ? TaskState::Partial
                                               : TaskState::None;
        for (Handle handle : Ids(args)) {
            service.SetState(std::to_string(handle), state, m_config.propagate && !noPropagate);
        }
        return true;
    }
    if (command == "rm") {
        bool recursive = TakeFlag(args, "-r");
        Expect(args, 1, args.size(), "rm [-D] [-r] TOKEN...");
        for (Handle handle : Ids(args)) {
            // Already gone with an earlier subtree.
            if (!service.GetGraph().isLive(handle)) continue;
            service.Remove(std::to_string(handle), recursive);
        }
        return true;
    }
    if (command == "link" || command == "unlink") {
        Expect(args, 2, 2, command + " [-D] PARENT CHILD");
        if (command == "link") {
            service.Link(Id(args[0]), Id(args[1]));
        } else {
            service.Unlink(Id(args[0]), Id(args[1]));
        }
        return true;
    }
    if (command == "mv") {
        Expect(args, 2, 2, "mv [-D] TOKEN PARENT");
        service.Move(Id(args[0]), Id(args[1]));
        return true;
    }
    if (command == "cp") {
        bool recursive = TakeFlag(args, "-r");
        Expect(args, 2, 2, "cp [-D] [-r] TOKEN PARENT");
        Handle copy = recursive ? service.CopyRecursive(Id(args[0]), Id(args[1]))
                                : service.Copy(Id(args[0]), Id(args[1]));
        std::cout << copy << std::endl;
        return true;
    }
    if (command == "rename") {
        Expect(args, 2, args.size(), "rename [-D] TOKEN TITLE...");
        service.Rename(Id(args[0]), Join(args, 1));
        return true;
    }
    if (command == "alias") {
        Expect(args, 2, 2, "alias [-D] TOKEN NAME");
        service.SetAlias(Id(args[0]), args[1]);
        return true;
    }
    if (command == "unalias") {
        Expect(args, 1, 1, "unalias [-D] TOKEN");
        service.UnsetAlias(Id(args[0]));
        return true;
    }
    if (command == "aliases") {
        Expect(args, 0, 0, "aliases");
        const auto& graph = service.GetGraph();
        for (const auto& [alias, handle] : graph.aliases()) {
            std::cout << alias << "  " << handle << " " << graph.node(handle).getTitle() << std::endl;
        }
        return false;
    }
    if (command == "archive" || command == "unarchive") {
        Expect(args, 1, args.size(), command + " [-D] TOKEN...");
        for (Handle handle : Ids(args)) {
            service.Archive(std::to_string(handle), command == "archive");
        }
        return true;
    }
    if (command == "ord") {
        Expect(args, 2, 3, "ord [-D] TOKEN DELTA [PARENT]");
        std::optional<std::string> parent;
        if (args.size() == 3) parent = Id(args[2]);
        service.Reorder(Id(args[0]), ParseLong(args[1]), parent);
        return true;
    }
    if (command == "list") {
        bool archived = TakeFlag(args, "--archived") || m_config.showArchived;
        auto depth = TakeOption(args, "--depth");
        Expect(args, 0, 1, "list [-D] [--depth N] [--archived] [TOKEN]");
        std::size_t maxDepth = m_config.defaultDepth;
        if (depth) {
            long parsed = ParseLong(*depth);
            if (parsed < 0) throw std::invalid_argument("Depth must not be negative");
            maxDepth = static_cast<std::size_t>(parsed);
        }
        std::optional<std::string> token;
        if (!args.empty()) token = Id(args[0]);
        PrintTree(service.List(token, archived, maxDepth));
        return false;
    }
    if (command == "dates") {
        Expect(args, 0, 0, "dates");
        const auto& graph = service.GetGraph();
        for (const auto& [key, handle] : graph.dates()) {
            std::cout << key << "  " << handle << "  " << graph.node(handle).getMetadata().children.size()
                      << " item(s)" << std::endl;
        }
        return false;
    }
    if (command == "archived") {
        Expect(args, 0, 0, "archived");
        const auto& graph = service.GetGraph();
        for (Handle handle : graph.archived()) {
            std::cout << handle << " " << graph.node(handle).getTitle() << std::endl;
        }
        return false;
    }
    if (command == "stats") {
        Expect(args, 0, 1, "stats [-D] [TOKEN]");
        if (args.empty()) {
            application::GraphStats stats = service.Stats();
            std::cout << "nodes:      " << stats.nodes << "\n"
                      << "tombstones: " << stats.tombstones << "\n"
                      << "roots:      " << stats.roots << "\n"
                      << "dates:      " << stats.dates << "\n"
                      << "aliases:    " << stats.aliases << "\n"
                      << "archived:   " << stats.archived << "\n"
                      << "pseudo:     " << stats.pseudo << "\n"
                      << "done:       " << stats.done << "\n"
                      << "partial:    " << stats.partial << "\n"
                      << "pending:    " << stats.pending << std::endl;
        } else {
            application::NodeStats stats = service.Stats(Id(args[0]));
            std::cout << "handle:      " << stats.handle << "\n"
                      << "title:       " << stats.title << "\n"
                      << "type:        " << stats.type << "\n"
                      << "state:       " << stats.state << "\n"
                      << "alias:       " << stats.alias.value_or("-") << "\n"
                      << "archived:    " << (stats.archived ? "yes" : "no") << "\n"
                      << "parents:     " << JoinHandles(stats.parents) << "\n"
                      << "children:    " << JoinHandles(stats.children) << "\n"
                      << "descendants: " << stats.doneDescendants << "/" << stats.descendants << " done"
                      << std::endl;
        }
        return false;
    }
    if (command == "clean") {
        Expect(args, 0, 0, "clean");
        service.Clean();
        return true;
    }
    if (command == "export") {
        auto indent = TakeOption(args, "--indent");
        Expect(args, 0, 0, "export [--indent N]");
        int width = indent ? static_cast<int>(ParseLong(*indent)) : 2;
        std::cout << infrastructure::DocumentCodec::EncodeJson(service.GetGraph(), width) << std::endl;
        return false;
    }
    if (command == "import") {
        Expect(args, 0, 0, "import < document");
        std::string text((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
        service.GetGraph() = infrastructure::DocumentCodec::DecodeJson(text);
        return true;
    }
    if (command == "bp") {
        return RunBlueprint(std::move(args));
    }

    throw std::invalid_argument("Unknown command: '" + command + "'");
}

bool TaskWeaveApp::RunBlueprint(std::vector<std::string> args) {
    if (args.empty()) {
        throw std::invalid_argument("Usage: taskweave bp save|load|list|show|rm ...");
    }
    std::string sub = args.front();
    args.erase(args.begin());
    auto& service = *m_service;

    if (sub == "save") {
        bool overwrite = TakeFlag(args, "--overwrite");
        bool preserve = TakeFlag(args, "--preserve");
        auto author = TakeOption(args, "--author");
        Expect(args, 2, 2, "bp save [-D] [--author A] [--overwrite] [--preserve] TOKEN NAME");
        service.SaveBlueprint(Id(args[0]), args[1], author, overwrite, preserve);
        std::cout << "Saved blueprint '" << args[1] << "' to " << m_blueprints->pathFor(args[1]) << std::endl;
        return true;
    }
    if (sub == "load") {
        auto parent = TakeOption(args, "--parent");
        auto title = TakeOption(args, "--title");
        Expect(args, 1, 1, "bp load [-D] [--parent TOKEN] [--title TITLE] NAME");
        if (parent) parent = Id(*parent);
        std::cout << service.LoadBlueprint(args[0], parent, title) << std::endl;
        return true;
    }
    if (sub == "list") {
        Expect(args, 0, 0, "bp list");
        for (const auto& name : service.ListBlueprints()) {
            std::cout << name << std::endl;
        }
        return false;
    }
    if (sub == "show") {
        Expect(args, 1, 1, "bp show NAME");
        domain::BlueprintDocument doc = service.GetBlueprint(args[0]);
        std::cout << doc.title;
        if (doc.author) std::cout << " (by " << *doc.author << ")";
        std::cout << ", version " << doc.version << std::endl;
        application::BlueprintService blueprints;
        domain::TaskGraph preview = blueprints.toGraph(doc);
        PrintTreeOf(preview, preview.traverse({0}, true, 0));
        return false;
    }
    if (sub == "rm") {
        Expect(args, 1, 1, "bp rm NAME");
        if (!m_blueprints->remove(args[0])) {
            throw std::invalid_argument("No blueprint named '" + args[0] + "'");
        }
        return false;
    }
    throw std::invalid_argument("Unknown blueprint command: '" + sub + "'");
}

int TaskWeaveApp::RunConfig(const std::vector<std::string>& args) {
    std::string configDir = infrastructure::PathUtils::GetAppConfigDir().string();
    infrastructure::AppConfig config = infrastructure::ConfigLoader::Load(configDir);

    if (!args.empty() && args.front() == "--init") {
        if (!infrastructure::ConfigLoader::Save(configDir, config)) {
            std::cerr << "[Error] Could not write " << configDir << "/settings.json" << std::endl;
            return 1;
        }
        std::cout << "Wrote " << configDir << "/settings.json" << std::endl;
        return 0;
    }
    if (!args.empty()) {
        std::cerr << "[Error] Usage: taskweave config [--init]" << std::endl;
        return 1;
    }

    std::cout << "config_dir:    " << configDir << "\n"
              << "save_file:     " << config.saveFile << "\n"
              << "data_dir:      " << config.dataDir << "\n"
              << "blueprint_dir: " << config.blueprintDir << "\n"
              << "default_depth: " << config.defaultDepth << "\n"
              << "show_archived: " << (config.showArchived ? "true" : "false") << "\n"
              << "propagate:     " << (config.propagate ? "true" : "false") << std::endl;
    return 0;
}

void TaskWeaveApp::PrintTree(const std::vector<domain::TraversalEntry>& entries) const {
    PrintTreeOf(m_service->GetGraph(), entries);
}

void TaskWeaveApp::PrintTreeOf(const domain::TaskGraph& graph, const std::vector<domain::TraversalEntry>& entries) {
    for (const auto& entry : entries) {
        const auto& node = graph.node(entry.handle);
        std::cout << std::string(entry.depth * 2, ' ') << StateMark(node) << ' ' << entry.handle << ' '
                  << node.getTitle();
        if (node.getMetadata().alias) {
            std::cout << " (" << *node.getMetadata().alias << ")";
        }
        if (node.getMetadata().archived) {
            std::cout << " [archived]";
        }
        std::cout << '\n';
    }
    std::cout.flush();
}

void TaskWeaveApp::PrintUsage() const {
    std::cout << "Usage: taskweave [--file PATH] <command> [args]\n"
                 "\n"
                 "  add [--root|--parent TOKEN] [--pseudo] TITLE   create a node\n"
                 "  date KEYWORD [TITLE]                          create a date node\n"
                 "  check|uncheck|partial [--no-propagate] TOKEN...\n"
                 "                                                set completion state\n"
                 "  rm [-r] TOKEN...                              remove nodes\n"
                 "  link|unlink PARENT CHILD                      add or drop an edge\n"
                 "  mv TOKEN PARENT                               reparent a node\n"
                 "  cp [-r] TOKEN PARENT                          copy a node or subtree\n"
                 "  rename TOKEN TITLE                            change a title\n"
                 "  alias TOKEN NAME | unalias TOKEN              manage aliases\n"
                 "  aliases                                       list aliases\n"
                 "  archive|unarchive TOKEN...                    toggle archive flag\n"
                 "  ord TOKEN DELTA [PARENT]                      reorder among siblings\n"
                 "  list [--depth N] [--archived] [TOKEN]         print the tree, N levels\n"
                 "                                                below the start (0 = all)\n"
                 "  dates | archived                              list date or archived nodes\n"
                 "  stats [TOKEN]                                 graph or node summary\n"
                 "  clean                                         compact handles\n"
                 "  export [--indent N] | import                  JSON on stdout / stdin\n"
                 "  bp save|load|list|show|rm ...                 blueprints\n"
                 "  config [--init]                               show or write settings\n"
                 "\n"
                 "TOKEN is a handle, alias, YYYY-MM-DD date or today/tomorrow/yesterday.\n"
                 "-D, --assume-date reads every TOKEN of a command as a date, month names\n"
                 "included."
              << std::endl;
}

} // namespace taskweave::app
