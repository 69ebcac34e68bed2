//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Validates query normalization, cache replacement and push ingestion of
/// the error retriever against a scripted request sender.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Protocol/Extensions.h"
#include "lspvisor/Retrieval/ErrorRetriever.h"
#include "lspvisor/Support/Error.h"
#include "lspvisor/Support/Logging.h"

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

llvm::json::Value diagnostic(int line, int character, const char* message, int severity = 1)
{
    return llvm::json::Object{
        {"range", llvm::json::Object{{"start", llvm::json::Object{{"line", line}, {"character", character}}}}},
        {"severity", severity},
        {"message", message},
    };
}

/// Sender answering from a programmable reply, recording the last request.
struct ScriptedSender
{
    std::string       lastMethod;
    llvm::json::Value lastParams{nullptr};
    llvm::json::Value reply{nullptr};
    bool              fail{false};

    lspvisor::RequestSender bind()
    {
        return [this](llvm::StringRef method, llvm::json::Value params) -> llvm::Expected<llvm::json::Value> {
            lastMethod = method.str();
            lastParams = std::move(params);
            if (fail)
            {
                return lspvisor::makeTimeoutError("request " + method + " timed out after 10 ms");
            }
            return reply;
        };
    }
};

bool runBulkQueryTests()
{
    ScriptedSender           sender;
    lspvisor::ErrorRetriever retriever(sender.bind());

    std::vector<std::size_t> notified;
    retriever.addErrorListener([&notified](const std::vector<lspvisor::CodeError>& errors) {
        notified.push_back(errors.size());
    });

    sender.reply = llvm::json::Object{
        {"diagnostics",
         llvm::json::Object{
             {"file:///w/a.py", llvm::json::Array{diagnostic(0, 0, "syntax error"), diagnostic(3, 1, "unused", 2)}},
             {"file:///w/b.py", llvm::json::Array{}},
         }},
    };
    lspvisor::ComprehensiveQuery query;
    query.maxErrors = 10;
    const lspvisor::ComprehensiveErrorList list = retriever.getComprehensiveErrors(query);
    if (sender.lastMethod != lspvisor::methods::GetComprehensiveErrors)
    {
        std::cerr << "unexpected bulk query method: " << sender.lastMethod << "\n";
        return false;
    }
    if (list.totalCount() != 2U || list.criticalCount() != 1U || list.warningCount() != 1U)
    {
        std::cerr << "unexpected bulk query counts\n";
        return false;
    }
    if (!retriever.hasCachedFile("/w/b.py") || !retriever.getCachedErrors(llvm::StringRef("/w/b.py")).empty())
    {
        std::cerr << "files with no findings must still be cached as empty\n";
        return false;
    }
    if (!retriever.lastRetrieval() || notified.size() != 1U || notified.front() != 2U)
    {
        std::cerr << "bulk query must record the retrieval and notify listeners once\n";
        return false;
    }

    // A failed bulk query degrades to an empty list and leaves the cache alone.
    sender.fail = true;
    const lspvisor::ComprehensiveErrorList degraded = retriever.analyzeCodebase("/w", {"*.py"}, {"build/*"});
    if (degraded.totalCount() != 0U || sender.lastMethod != lspvisor::methods::AnalyzeCodebase)
    {
        std::cerr << "failed analyzeCodebase must return an empty list\n";
        return false;
    }
    if (retriever.getCachedErrors().size() != 2U || notified.size() != 1U)
    {
        std::cerr << "failed query must not touch cache or listeners\n";
        return false;
    }

    // A result without diagnostics is an empty success.
    sender.fail  = false;
    sender.reply = llvm::json::Object{{"status", "ok"}};
    if (retriever.getComprehensiveErrors({}).totalCount() != 0U)
    {
        std::cerr << "result without diagnostics must be empty\n";
        return false;
    }
    return true;
}

bool runFileQueryTests()
{
    ScriptedSender           sender;
    lspvisor::ErrorRetriever retriever(sender.bind());

    sender.reply = llvm::json::Object{{"diagnostics", llvm::json::Array{diagnostic(1, 4, "bad"), diagnostic(2, 0, "worse")}}};
    auto first   = retriever.getFileErrors("/w/a.py");
    if (!first || first->size() != 2U)
    {
        if (!first)
        {
            llvm::consumeError(first.takeError());
        }
        std::cerr << "expected two findings for the file\n";
        return false;
    }
    const auto* params = sender.lastParams.getAsObject();
    if (sender.lastMethod != lspvisor::methods::GetErrors || !params ||
        params->getString("uri") != llvm::StringRef("file:///w/a.py"))
    {
        std::cerr << "single-file query must send the file uri\n";
        return false;
    }

    // A new answer replaces the entry instead of merging.
    sender.reply = llvm::json::Object{{"diagnostics", llvm::json::Array{diagnostic(7, 0, "only")}}};
    auto second  = retriever.getFileErrors("/w/a.py");
    if (!second)
    {
        llvm::consumeError(second.takeError());
        std::cerr << "second file query failed\n";
        return false;
    }
    const auto cached = retriever.getCachedErrors(llvm::StringRef("/w/a.py"));
    if (cached.size() != 1U || cached.front().message() != "only")
    {
        std::cerr << "file cache entry must be replaced\n";
        return false;
    }
    if (retriever.lastRetrieval())
    {
        std::cerr << "single-file queries must not count as bulk retrievals\n";
        return false;
    }

    // Failures propagate for single-file queries.
    sender.fail = true;
    auto failed = retriever.getFileErrors("/w/a.py");
    if (failed)
    {
        std::cerr << "expected single-file failure to propagate\n";
        return false;
    }
    if (lspvisor::classifyError(failed.takeError()).kind != lspvisor::ErrorKind::Timeout)
    {
        std::cerr << "expected timeout error from the sender\n";
        return false;
    }
    if (retriever.getCachedErrors(llvm::StringRef("/w/a.py")).size() != 1U)
    {
        std::cerr << "failed query must keep the previous cache entry\n";
        return false;
    }

    retriever.clearCache(llvm::StringRef("/w/a.py"));
    if (retriever.hasCachedFile("/w/a.py"))
    {
        std::cerr << "clearCache must drop the file entry\n";
        return false;
    }
    return true;
}

bool runPushTests()
{
    ScriptedSender           sender;
    lspvisor::ErrorRetriever retriever(sender.bind());

    int                 healthyCalls = 0;
    const std::uint64_t throwing     = retriever.addErrorListener([](const std::vector<lspvisor::CodeError>&) {
        throw std::runtime_error("listener exploded");
    });
    retriever.addErrorListener([&healthyCalls](const std::vector<lspvisor::CodeError>&) { ++healthyCalls; });

    retriever.handleDiagnosticsNotification(llvm::json::Object{
        {"uri", "file:///w/c.py"},
        {"diagnostics", llvm::json::Array{diagnostic(5, 2, "undefined name")}},
    });
    const auto cached = retriever.getCachedErrors(llvm::StringRef("/w/c.py"));
    if (cached.size() != 1U || cached.front().location().line != 6 || cached.front().location().column != 3)
    {
        std::cerr << "pushed diagnostics must be normalized into the cache\n";
        return false;
    }
    if (healthyCalls != 1)
    {
        std::cerr << "a throwing listener must not block the others\n";
        return false;
    }

    // An empty push clears the file.
    retriever.handleDiagnosticsNotification(
        llvm::json::Object{{"uri", "file:///w/c.py"}, {"diagnostics", llvm::json::Array{}}});
    if (!retriever.getCachedErrors(llvm::StringRef("/w/c.py")).empty() || !retriever.hasCachedFile("/w/c.py"))
    {
        std::cerr << "empty push must replace the entry with nothing\n";
        return false;
    }

    // Malformed pushes are ignored.
    retriever.handleDiagnosticsNotification(llvm::json::Value(nullptr));
    retriever.handleDiagnosticsNotification(llvm::json::Object{{"diagnostics", llvm::json::Array{}}});
    if (healthyCalls != 2)
    {
        std::cerr << "malformed pushes must not notify listeners\n";
        return false;
    }

    if (!retriever.removeErrorListener(throwing) || retriever.removeErrorListener(throwing))
    {
        std::cerr << "listener removal mismatch\n";
        return false;
    }

    retriever.clearCache();
    if (!retriever.getCachedErrors().empty())
    {
        std::cerr << "clearCache without a path must drop everything\n";
        return false;
    }
    return true;
}

}  // namespace

bool runErrorRetrieverTests()
{
    const lspvisor::LogLevel previousLevel = lspvisor::logLevel();
    lspvisor::setLogLevel(lspvisor::LogLevel::Off);

    bool ok = true;
    ok      = runBulkQueryTests() && ok;
    ok      = runFileQueryTests() && ok;
    ok      = runPushTests() && ok;

    lspvisor::setLogLevel(previousLevel);
    return ok;
}
