//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Entry point for the `lspvisorctl` command-line supervisor.
///
/// This tool manages the persisted server registry, discovers server
/// executables, and runs one-shot diagnostic queries against a registered
/// server (start, query, print, stop).
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Client/LspClient.h"
#include "lspvisor/Manager/ConfigStore.h"
#include "lspvisor/Manager/ServerManager.h"
#include "lspvisor/Support/Logging.h"
#include "lspvisor/Version.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdlib>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace
{

/// @brief Checks whether a command token is implemented by `lspvisorctl`.
///
/// @param[in] command Command token from argv.
/// @return `true` if the command is one of the supported subcommands.
bool isKnownCommand(llvm::StringRef command)
{
    return command == "list" || command == "discover" || command == "register" || command == "unregister" ||
           command == "errors" || command == "analyze" || command == "file-errors";
}

bool isHelpToken(llvm::StringRef arg)
{
    return arg == "--help" || arg == "-h";
}

/// @brief Prints compact usage guidance for invalid CLI invocations.
void printUsage()
{
    llvm::errs() << "Usage: lspvisorctl [--config-dir <dir>] "
                    "<list|discover|register|unregister|errors|analyze|file-errors> [args]\n"
                 << "Try: lspvisorctl --help\n";
}

/// @brief Prints the full help text.
void printHelp()
{
    llvm::errs() << "NAME\n"
                 << "  lspvisorctl - language server registry and diagnostic query tool\n\n"
                 << "SYNOPSIS\n"
                 << "  lspvisorctl [--config-dir <dir>] <command> [args]\n"
                 << "  lspvisorctl --version\n\n"
                 << "COMMANDS\n"
                 << "  list                       Print every registered server and its status.\n"
                 << "  discover [dir...]          Print candidate configurations for server executables.\n"
                 << "  register <config.json>     Register (or replace) a server configuration.\n"
                 << "  unregister <name>          Remove a server configuration.\n"
                 << "  errors <name>              Start the server, print the workspace error summary, stop it.\n"
                 << "  analyze <name> <root>      Start the server, analyze a codebase, print the summary.\n"
                 << "  file-errors <name> <path>  Start the server, print the findings of one file.\n\n"
                 << "OPTIONS\n"
                 << "  --config-dir <dir>\n"
                 << "      Configuration directory (default: $LSPVISOR_CONFIG_DIR or ~/.lspvisor/servers).\n"
                 << "  --version, -V\n"
                 << "      Print the tool version.\n\n"
                 << "ENVIRONMENT\n"
                 << "  LSPVISOR_LOG_LEVEL   off, error, warning (default), info, or debug.\n";
}

void printJson(llvm::json::Value value)
{
    llvm::outs() << llvm::formatv("{0:2}", value) << "\n";
}

/// @brief Starts a registered server, runs `query` against its client, and stops it.
int withRunningServer(lspvisor::ServerManager&                                   manager,
                      llvm::StringRef                                            name,
                      const std::function<bool(lspvisor::LspClient& client)>& query)
{
    if (!manager.serverInfo(name))
    {
        llvm::errs() << "[lspvisorctl] unknown server '" << name << "'\n";
        return 1;
    }
    if (!manager.start(name))
    {
        const auto info = manager.serverInfo(name);
        llvm::errs() << "[lspvisorctl] failed to start '" << name
                     << "': " << (info && info->errorMessage ? *info->errorMessage : std::string("unknown error"))
                     << "\n";
        return 1;
    }
    const auto client = manager.client(name);
    const bool ok     = client && query(*client);
    manager.stop(name);
    return ok ? 0 : 1;
}

template <typename T>
bool reportFailure(llvm::Expected<T>& result)
{
    if (result)
    {
        return false;
    }
    llvm::errs() << "[lspvisorctl] " << llvm::toString(result.takeError()) << "\n";
    return true;
}

}  // namespace

int main(int argc, char** argv)
{
    llvm::InitLLVM y(argc, argv);

    if (const char* level = std::getenv("LSPVISOR_LOG_LEVEL"))
    {
        if (const auto parsed = lspvisor::parseLogLevel(level))
        {
            lspvisor::setLogLevel(*parsed);
        }
        else
        {
            llvm::errs() << "[lspvisorctl] ignoring unknown LSPVISOR_LOG_LEVEL '" << level << "'\n";
        }
    }

    std::string              configDir;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i)
    {
        const llvm::StringRef arg(argv[i]);
        if (arg == "--version" || arg == "-V")
        {
            llvm::outs() << "lspvisorctl " << lspvisor::kVersionString << "\n";
            return 0;
        }
        if (isHelpToken(arg))
        {
            printHelp();
            return 0;
        }
        if (arg == "--config-dir")
        {
            if (i + 1 >= argc)
            {
                llvm::errs() << "[lspvisorctl] --config-dir requires a value\n";
                return 1;
            }
            configDir = argv[++i];
            continue;
        }
        positional.emplace_back(arg.str());
    }

    if (positional.empty() || !isKnownCommand(positional.front()))
    {
        printUsage();
        return 1;
    }
    const std::string command = positional.front();
    const std::vector<std::string> args(positional.begin() + 1, positional.end());

    if (command == "discover")
    {
        llvm::json::Array candidates;
        for (const auto& config : lspvisor::ServerManager::discover(args))
        {
            candidates.push_back(lspvisor::toJson(config));
        }
        printJson(llvm::json::Value(std::move(candidates)));
        return 0;
    }

    lspvisor::ManagerOptions options;
    options.configDirectory = configDir;
    lspvisor::ServerManager manager(std::move(options));

    if (command == "list")
    {
        llvm::json::Array servers;
        for (const auto& info : manager.allServers())
        {
            servers.push_back(lspvisor::toJson(info));
        }
        printJson(llvm::json::Value(std::move(servers)));
        return 0;
    }

    if (command == "register")
    {
        if (args.size() != 1)
        {
            printUsage();
            return 1;
        }
        auto config = lspvisor::ConfigStore::loadFile(args.front());
        if (reportFailure(config))
        {
            return 1;
        }
        const std::string name = config->name;
        if (!manager.registerServer(std::move(*config)))
        {
            llvm::errs() << "[lspvisorctl] failed to register '" << name << "'\n";
            return 1;
        }
        llvm::outs() << "registered " << name << "\n";
        return 0;
    }

    if (command == "unregister")
    {
        if (args.size() != 1)
        {
            printUsage();
            return 1;
        }
        return manager.unregisterServer(args.front()) ? 0 : 1;
    }

    if (command == "errors")
    {
        if (args.size() != 1)
        {
            printUsage();
            return 1;
        }
        return withRunningServer(manager, args.front(), [](lspvisor::LspClient& client) {
            auto errors = client.getComprehensiveErrors();
            if (reportFailure(errors))
            {
                return false;
            }
            printJson(llvm::json::Value(errors->summary()));
            return true;
        });
    }

    if (command == "analyze")
    {
        if (args.size() != 2)
        {
            printUsage();
            return 1;
        }
        const std::string root = args[1];
        return withRunningServer(manager, args.front(), [&root](lspvisor::LspClient& client) {
            auto errors = client.analyzeCodebase(root);
            if (reportFailure(errors))
            {
                return false;
            }
            printJson(llvm::json::Value(errors->summary()));
            return true;
        });
    }

    // file-errors
    if (args.size() != 2)
    {
        printUsage();
        return 1;
    }
    const std::string path = args[1];
    return withRunningServer(manager, args.front(), [&path](lspvisor::LspClient& client) {
        auto errors = client.getFileErrors(path);
        if (reportFailure(errors))
        {
            return false;
        }
        for (const auto& error : *errors)
        {
            llvm::outs() << error.displayText() << "\n";
        }
        return true;
    });
}
