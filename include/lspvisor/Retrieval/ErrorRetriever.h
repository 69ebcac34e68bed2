//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Diagnostic retrieval, normalization, and per-file caching.
///
/// Pulled results (queries issued through the request sender) and pushed
/// results (diagnostic notifications) share one path: normalize into
/// `CodeError` values, replace the cache entry of every touched file, then
/// notify listeners.
///
//===----------------------------------------------------------------------===//
#ifndef LSPVISOR_RETRIEVAL_ERROR_RETRIEVER_H
#define LSPVISOR_RETRIEVAL_ERROR_RETRIEVER_H

#include "lspvisor/Protocol/Extensions.h"
#include "lspvisor/Retrieval/CodeError.h"
#include "lspvisor/Retrieval/ErrorList.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lspvisor
{

/// @brief Issues one request and waits for its result.
using RequestSender = std::function<llvm::Expected<llvm::json::Value>(llvm::StringRef method, llvm::json::Value params)>;

/// @brief Listener receiving the findings of each retrieval or push.
using ErrorListener = std::function<void(const std::vector<CodeError>& errors)>;

/// @brief Retrieves and caches normalized findings.
class ErrorRetriever final
{
public:
    /// @brief Creates a retriever.
    /// @param[in] sender Request sender used for queries.
    explicit ErrorRetriever(RequestSender sender);

    ErrorRetriever(const ErrorRetriever&)            = delete;
    ErrorRetriever& operator=(const ErrorRetriever&) = delete;

    /// @brief Runs the whole-workspace query.
    /// @return Findings; an empty list with its duration recorded when the query fails.
    [[nodiscard]] ComprehensiveErrorList getComprehensiveErrors(const ComprehensiveQuery& query);

    /// @brief Runs the single-file query and replaces that file's cache entry.
    /// @return Findings, or the request failure.
    [[nodiscard]] llvm::Expected<std::vector<CodeError>> getFileErrors(llvm::StringRef filePath);

    /// @brief Runs a bulk codebase analysis.
    /// @return Findings; an empty list with its duration recorded when the request fails.
    [[nodiscard]] ComprehensiveErrorList analyzeCodebase(llvm::StringRef                 rootPath,
                                                         const std::vector<std::string>& includePatterns,
                                                         const std::vector<std::string>& excludePatterns);

    /// @brief Ingests a pushed `{uri, diagnostics}` notification.
    void handleDiagnosticsNotification(const llvm::json::Value& params);

    /// @brief Registers a listener.
    /// @return Handle for `removeErrorListener`.
    std::uint64_t addErrorListener(ErrorListener listener);

    /// @brief Removes a listener.
    /// @return `true` when the handle was registered.
    bool removeErrorListener(std::uint64_t handle);

    /// @brief Returns cached findings of one file, or of every file ordered by path.
    [[nodiscard]] std::vector<CodeError> getCachedErrors(std::optional<llvm::StringRef> filePath = std::nullopt) const;

    /// @brief Returns whether the cache has an entry (possibly empty) for the file.
    [[nodiscard]] bool hasCachedFile(llvm::StringRef filePath) const;

    /// @brief Drops the cache entry of one file, or every entry.
    void clearCache(std::optional<llvm::StringRef> filePath = std::nullopt);

    /// @brief Time of the last successful bulk retrieval, in seconds since the Unix epoch.
    [[nodiscard]] std::optional<double> lastRetrieval() const;

private:
    using FileErrors = std::map<std::string, std::vector<CodeError>>;

    ComprehensiveErrorList runBulkQuery(llvm::StringRef method, llvm::json::Object params);
    void                   replaceCached(FileErrors files, bool bulkRetrieval);
    void                   notifyListeners(const std::vector<CodeError>& errors);

    RequestSender sender_;

    mutable std::mutex    cacheMutex_;
    FileErrors            cache_;
    std::optional<double> lastRetrieval_;

    std::mutex                                           listenerMutex_;
    std::uint64_t                                        nextListener_{1};
    std::vector<std::pair<std::uint64_t, ErrorListener>> listeners_;
};

/// @brief Normalizes a `{uri: [diagnostic, ...]}` object into per-file findings.
///
/// Every uri key appears in the result, including those with no diagnostics.
[[nodiscard]] std::map<std::string, std::vector<CodeError>> normalizeDiagnosticMap(const llvm::json::Object& byUri);

/// @brief Normalizes a diagnostic array belonging to one file.
[[nodiscard]] std::vector<CodeError> normalizeDiagnostics(const llvm::json::Array& diagnostics, llvm::StringRef filePath);

}  // namespace lspvisor

#endif  // LSPVISOR_RETRIEVAL_ERROR_RETRIEVER_H
