//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements configuration persistence.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Manager/ConfigStore.h"

#include "lspvisor/Support/Error.h"
#include "lspvisor/Support/Logging.h"

#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace lspvisor
{

ConfigStore::ConfigStore(std::string directory)
    : directory_(std::move(directory))
{
}

std::string ConfigStore::defaultDirectory()
{
    if (const char* configured = std::getenv("LSPVISOR_CONFIG_DIR"); configured && *configured)
    {
        return configured;
    }
    const char*                 home = std::getenv("HOME");
    const std::filesystem::path base = (home && *home) ? std::filesystem::path(home) : std::filesystem::current_path();
    return (base / ".lspvisor" / "servers").lexically_normal().string();
}

std::string ConfigStore::pathFor(const llvm::StringRef name) const
{
    return (std::filesystem::path(directory_) / (name.str() + ".json")).string();
}

llvm::Error ConfigStore::save(const ServerConfig& config) const
{
    if (config.name.empty() || config.name.find('/') != std::string::npos)
    {
        return makeProtocolError("invalid server name '" + config.name + "'");
    }

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec)
    {
        return makeConnectionError("cannot create " + directory_ + ": " + ec.message());
    }

    std::string              rendered;
    llvm::raw_string_ostream stream(rendered);
    stream << llvm::formatv("{0:2}", toJson(config));
    stream << '\n';
    stream.flush();

    const std::filesystem::path target(pathFor(config.name));
    const std::filesystem::path tmpPath = target.string() + ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
        if (!out.good())
        {
            return makeConnectionError("cannot write " + tmpPath.string());
        }
        out.write(rendered.data(), static_cast<std::streamsize>(rendered.size()));
        out.flush();
        if (!out.good())
        {
            std::filesystem::remove(tmpPath, ec);
            return makeConnectionError("cannot write " + tmpPath.string());
        }
    }

    std::filesystem::rename(tmpPath, target, ec);
    if (ec)
    {
        const std::string reason = ec.message();
        std::filesystem::remove(tmpPath, ec);
        return makeConnectionError("cannot replace " + target.string() + ": " + reason);
    }
    logDebug("config", "saved " + target.string());
    return llvm::Error::success();
}

llvm::Error ConfigStore::remove(const llvm::StringRef name) const
{
    std::error_code ec;
    const std::string path = pathFor(name);
    std::filesystem::remove(path, ec);
    if (ec)
    {
        return makeConnectionError("cannot remove " + path + ": " + ec.message());
    }
    return llvm::Error::success();
}

std::vector<ServerConfig> ConfigStore::loadAll() const
{
    std::vector<ServerConfig> configs;

    std::error_code ec;
    if (!std::filesystem::is_directory(directory_, ec))
    {
        return configs;
    }

    std::vector<std::filesystem::path> files;
    for (std::filesystem::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec))
    {
        if (it->path().extension() == ".json" && it->is_regular_file(ec))
        {
            files.push_back(it->path());
        }
    }
    if (ec)
    {
        logError("config", "cannot list " + directory_ + ": " + ec.message());
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files)
    {
        auto config = loadFile(file.string());
        if (!config)
        {
            logError("config", "skipping " + file.string() + ": " + llvm::toString(config.takeError()));
            continue;
        }
        // Records are addressed by file name, so a mismatched record could never be removed.
        if (file.stem().string() != config->name)
        {
            logWarning("config", "skipping " + file.string() + ": record name '" + config->name +
                                     "' does not match the file name");
            continue;
        }
        logDebug("config", "loaded server configuration " + config->name);
        configs.push_back(std::move(*config));
    }
    return configs;
}

llvm::Expected<ServerConfig> ConfigStore::loadFile(const llvm::StringRef path)
{
    std::ifstream in(path.str(), std::ios::binary);
    if (!in.good())
    {
        return makeConnectionError("cannot read " + path);
    }
    const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse(text);
    if (!parsed)
    {
        return makeProtocolError("invalid JSON: " + llvm::toString(parsed.takeError()));
    }
    return parseServerConfig(*parsed);
}

}  // namespace lspvisor
