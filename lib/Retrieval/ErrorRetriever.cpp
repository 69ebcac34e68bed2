//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements diagnostic retrieval and the per-file cache.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Retrieval/ErrorRetriever.h"

#include "lspvisor/Support/Logging.h"
#include "lspvisor/Support/Uri.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

namespace lspvisor
{
namespace
{

double secondsSince(const std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

std::vector<CodeError> flatten(const std::map<std::string, std::vector<CodeError>>& files)
{
    std::vector<CodeError> all;
    for (const auto& [_, errors] : files)
    {
        all.insert(all.end(), errors.begin(), errors.end());
    }
    return all;
}

}  // namespace

std::vector<CodeError> normalizeDiagnostics(const llvm::json::Array& diagnostics, const llvm::StringRef filePath)
{
    std::vector<CodeError> errors;
    errors.reserve(diagnostics.size());
    for (const auto& diagnostic : diagnostics)
    {
        const auto* object = diagnostic.getAsObject();
        if (!object)
        {
            logWarning("retriever", "skipping malformed diagnostic for " + filePath);
            continue;
        }
        errors.push_back(CodeError::fromDiagnostic(*object, filePath));
    }
    return errors;
}

std::map<std::string, std::vector<CodeError>> normalizeDiagnosticMap(const llvm::json::Object& byUri)
{
    std::map<std::string, std::vector<CodeError>> files;
    for (const auto& [uri, value] : byUri)
    {
        const std::string path = uriToPath(uri);
        if (const auto* diagnostics = value.getAsArray())
        {
            files[path] = normalizeDiagnostics(*diagnostics, path);
        }
        else
        {
            logWarning("retriever", "diagnostics for " + path + " are not an array");
            files[path];
        }
    }
    return files;
}

ErrorRetriever::ErrorRetriever(RequestSender sender)
    : sender_(std::move(sender))
{
}

ComprehensiveErrorList ErrorRetriever::getComprehensiveErrors(const ComprehensiveQuery& query)
{
    return runBulkQuery(methods::GetComprehensiveErrors, comprehensiveErrorsParams(query));
}

ComprehensiveErrorList ErrorRetriever::analyzeCodebase(const llvm::StringRef                 rootPath,
                                                       const std::vector<std::string>& includePatterns,
                                                       const std::vector<std::string>& excludePatterns)
{
    return runBulkQuery(methods::AnalyzeCodebase, analyzeCodebaseParams(rootPath, includePatterns, excludePatterns));
}

ComprehensiveErrorList ErrorRetriever::runBulkQuery(const llvm::StringRef method, llvm::json::Object params)
{
    const auto start = std::chrono::steady_clock::now();

    auto result = sender_(method, llvm::json::Value(std::move(params)));
    if (!result)
    {
        logError("retriever", method + " failed: " + llvm::toString(result.takeError()));
        ComprehensiveErrorList empty;
        empty.setAnalysisDuration(secondsSince(start));
        return empty;
    }

    FileErrors files;
    if (const auto* object = result->getAsObject())
    {
        if (const auto* byUri = object->getObject("diagnostics"))
        {
            files = normalizeDiagnosticMap(*byUri);
        }
    }

    ComprehensiveErrorList list(flatten(files));
    list.setAnalysisDuration(secondsSince(start));
    replaceCached(std::move(files), true);
    notifyListeners(list.errors());
    return list;
}

llvm::Expected<std::vector<CodeError>> ErrorRetriever::getFileErrors(const llvm::StringRef filePath)
{
    auto result = sender_(methods::GetErrors, llvm::json::Value(fileErrorsParams(filePath)));
    if (!result)
    {
        return result.takeError();
    }

    std::vector<CodeError> errors;
    if (const auto* object = result->getAsObject())
    {
        if (const auto* diagnostics = object->getArray("diagnostics"))
        {
            errors = normalizeDiagnostics(*diagnostics, filePath);
        }
    }

    FileErrors files;
    files[filePath.str()] = errors;
    replaceCached(std::move(files), false);
    notifyListeners(errors);
    return errors;
}

void ErrorRetriever::handleDiagnosticsNotification(const llvm::json::Value& params)
{
    const auto* object = params.getAsObject();
    if (!object)
    {
        logWarning("retriever", "diagnostics notification without parameters");
        return;
    }
    const auto uri = object->getString("uri");
    if (!uri)
    {
        logWarning("retriever", "diagnostics notification without uri");
        return;
    }

    const std::string      path = uriToPath(*uri);
    std::vector<CodeError> errors;
    if (const auto* diagnostics = object->getArray("diagnostics"))
    {
        errors = normalizeDiagnostics(*diagnostics, path);
    }

    FileErrors files;
    files[path] = errors;
    replaceCached(std::move(files), false);
    notifyListeners(errors);
}

void ErrorRetriever::replaceCached(FileErrors files, const bool bulkRetrieval)
{
    std::lock_guard<std::mutex> lock(cacheMutex_);
    for (auto& [path, errors] : files)
    {
        cache_[path] = std::move(errors);
    }
    if (bulkRetrieval)
    {
        lastRetrieval_ = unixNow();
    }
}

void ErrorRetriever::notifyListeners(const std::vector<CodeError>& errors)
{
    std::vector<ErrorListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        for (const auto& [_, listener] : listeners_)
        {
            listeners.push_back(listener);
        }
    }
    for (const auto& listener : listeners)
    {
        try
        {
            listener(errors);
        } catch (const std::exception& ex)
        {
            logError("retriever", llvm::Twine("error listener failed: ") + ex.what());
        } catch (...)
        {
            logError("retriever", "error listener failed: unknown exception");
        }
    }
}

std::uint64_t ErrorRetriever::addErrorListener(ErrorListener listener)
{
    std::lock_guard<std::mutex> lock(listenerMutex_);
    const std::uint64_t         handle = nextListener_++;
    listeners_.emplace_back(handle, std::move(listener));
    return handle;
}

bool ErrorRetriever::removeErrorListener(const std::uint64_t handle)
{
    std::lock_guard<std::mutex> lock(listenerMutex_);
    const auto it = std::find_if(listeners_.begin(), listeners_.end(), [handle](const auto& entry) {
        return entry.first == handle;
    });
    if (it == listeners_.end())
    {
        return false;
    }
    listeners_.erase(it);
    return true;
}

std::vector<CodeError> ErrorRetriever::getCachedErrors(const std::optional<llvm::StringRef> filePath) const
{
    std::lock_guard<std::mutex> lock(cacheMutex_);
    if (filePath)
    {
        const auto it = cache_.find(filePath->str());
        return it == cache_.end() ? std::vector<CodeError>() : it->second;
    }
    return flatten(cache_);
}

bool ErrorRetriever::hasCachedFile(const llvm::StringRef filePath) const
{
    std::lock_guard<std::mutex> lock(cacheMutex_);
    return cache_.count(filePath.str()) != 0U;
}

void ErrorRetriever::clearCache(const std::optional<llvm::StringRef> filePath)
{
    std::lock_guard<std::mutex> lock(cacheMutex_);
    if (filePath)
    {
        cache_.erase(filePath->str());
        return;
    }
    cache_.clear();
}

std::optional<double> ErrorRetriever::lastRetrieval() const
{
    std::lock_guard<std::mutex> lock(cacheMutex_);
    return lastRetrieval_;
}

}  // namespace lspvisor
