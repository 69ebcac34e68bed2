//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Method names, request parameter builders, and capability maps for the
/// analysis-server protocol extensions.
///
//===----------------------------------------------------------------------===//
#ifndef LSPVISOR_PROTOCOL_EXTENSIONS_H
#define LSPVISOR_PROTOCOL_EXTENSIONS_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lspvisor::methods
{

inline constexpr llvm::StringLiteral Initialize             = "initialize";
inline constexpr llvm::StringLiteral Initialized            = "initialized";
inline constexpr llvm::StringLiteral Shutdown               = "shutdown";
inline constexpr llvm::StringLiteral Exit                   = "exit";
inline constexpr llvm::StringLiteral Ping                   = "$/ping";
inline constexpr llvm::StringLiteral PublishDiagnostics     = "textDocument/publishDiagnostics";
inline constexpr llvm::StringLiteral WorkspaceConfiguration = "workspace/configuration";

inline constexpr llvm::StringLiteral GetComprehensiveErrors = "serena/getComprehensiveErrors";
inline constexpr llvm::StringLiteral GetErrors              = "serena/getErrors";
inline constexpr llvm::StringLiteral AnalyzeCodebase        = "serena/analyzeCodebase";
inline constexpr llvm::StringLiteral AnalyzeFile            = "serena/analyzeFile";
inline constexpr llvm::StringLiteral RefreshAnalysis        = "serena/refreshAnalysis";
inline constexpr llvm::StringLiteral ErrorUpdated           = "serena/errorUpdated";

}  // namespace lspvisor::methods

namespace lspvisor
{

/// @brief Options of the whole-workspace error query.
struct ComprehensiveQuery final
{
    /// @brief Ask the server to attach context to each diagnostic.
    bool includeContext{true};

    /// @brief Ask the server to attach fix suggestions.
    bool includeSuggestions{true};

    /// @brief Upper bound on returned diagnostics.
    std::optional<std::int64_t> maxErrors;

    /// @brief Severity names to keep (`"error"`, `"warning"`, ...).
    std::vector<std::string> severityFilter;
};

/// @brief Builds `{includeContext, includeSuggestions, maxErrors?, severityFilter?}`.
[[nodiscard]] llvm::json::Object comprehensiveErrorsParams(const ComprehensiveQuery& query);

/// @brief Builds `{uri}` for a single-file error query.
[[nodiscard]] llvm::json::Object fileErrorsParams(llvm::StringRef path);

/// @brief Builds `{rootUri, includePatterns?, excludePatterns?}`.
[[nodiscard]] llvm::json::Object analyzeCodebaseParams(llvm::StringRef                 rootPath,
                                                       const std::vector<std::string>& includePatterns,
                                                       const std::vector<std::string>& excludePatterns);

/// @brief Builds `{uri, content?}`.
[[nodiscard]] llvm::json::Object analyzeFileParams(llvm::StringRef path, const std::optional<std::string>& content);

/// @brief Client name and version reported in `initialize`.
struct ClientIdentity final
{
    std::string name{"lspvisor"};
    std::string version;
};

/// @brief Returns the capability map offered by this client.
[[nodiscard]] llvm::json::Object clientCapabilities();

/// @brief Builds the `initialize` request parameters.
[[nodiscard]] llvm::json::Object initializeParams(const ClientIdentity& identity);

/// @brief Returns whether the server accepts the extension methods.
///
/// Only an explicit `experimental.serenaExtensions: false` refuses them;
/// servers that do not advertise the flag are assumed to accept.
[[nodiscard]] bool supportsExtensions(const llvm::json::Object& serverCapabilities);

}  // namespace lspvisor

#endif  // LSPVISOR_PROTOCOL_EXTENSIONS_H
