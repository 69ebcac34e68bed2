//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements extension request builders and capability maps.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Protocol/Extensions.h"

#include "lspvisor/Support/Uri.h"

namespace lspvisor
{
namespace
{

llvm::json::Array toJsonArray(const std::vector<std::string>& values)
{
    llvm::json::Array array;
    for (const auto& value : values)
    {
        array.push_back(value);
    }
    return array;
}

}  // namespace

llvm::json::Object comprehensiveErrorsParams(const ComprehensiveQuery& query)
{
    llvm::json::Object params{
        {"includeContext", query.includeContext},
        {"includeSuggestions", query.includeSuggestions},
    };
    if (query.maxErrors)
    {
        params["maxErrors"] = *query.maxErrors;
    }
    if (!query.severityFilter.empty())
    {
        params["severityFilter"] = toJsonArray(query.severityFilter);
    }
    return params;
}

llvm::json::Object fileErrorsParams(const llvm::StringRef path)
{
    return llvm::json::Object{{"uri", pathToUri(path)}};
}

llvm::json::Object analyzeCodebaseParams(const llvm::StringRef                 rootPath,
                                         const std::vector<std::string>& includePatterns,
                                         const std::vector<std::string>& excludePatterns)
{
    llvm::json::Object params{{"rootUri", pathToUri(rootPath)}};
    if (!includePatterns.empty())
    {
        params["includePatterns"] = toJsonArray(includePatterns);
    }
    if (!excludePatterns.empty())
    {
        params["excludePatterns"] = toJsonArray(excludePatterns);
    }
    return params;
}

llvm::json::Object analyzeFileParams(const llvm::StringRef path, const std::optional<std::string>& content)
{
    llvm::json::Object params{{"uri", pathToUri(path)}};
    if (content)
    {
        params["content"] = *content;
    }
    return params;
}

llvm::json::Object clientCapabilities()
{
    return llvm::json::Object{
        {"textDocument",
         llvm::json::Object{
             {"publishDiagnostics",
              llvm::json::Object{
                  {"relatedInformation", true},
                  {"versionSupport", true},
                  {"codeDescriptionSupport", true},
                  {"dataSupport", true},
              }},
             {"synchronization",
              llvm::json::Object{
                  {"dynamicRegistration", true},
                  {"willSave", true},
                  {"willSaveWaitUntil", true},
                  {"didSave", true},
              }},
         }},
        {"workspace", llvm::json::Object{{"workspaceFolders", true}, {"configuration", true}}},
        {"experimental", llvm::json::Object{{"serenaExtensions", true}}},
    };
}

llvm::json::Object initializeParams(const ClientIdentity& identity)
{
    return llvm::json::Object{
        {"processId", nullptr},
        {"clientInfo", llvm::json::Object{{"name", identity.name}, {"version", identity.version}}},
        {"capabilities", clientCapabilities()},
        {"workspaceFolders", nullptr},
    };
}

bool supportsExtensions(const llvm::json::Object& serverCapabilities)
{
    const auto* experimental = serverCapabilities.getObject("experimental");
    if (!experimental)
    {
        return true;
    }
    const auto flag = experimental->getBoolean("serenaExtensions");
    return !flag || *flag;
}

}  // namespace lspvisor
