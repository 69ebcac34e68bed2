//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements leveled logging and sink forwarding.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Support/Logging.h"

#include "llvm/Support/raw_ostream.h"

#include <atomic>
#include <mutex>
#include <utility>

namespace lspvisor
{
namespace
{

std::atomic<LogLevel> gThreshold{LogLevel::Warning};

std::mutex& sinkMutex()
{
    static std::mutex mutex;
    return mutex;
}

LogSink& sinkSlot()
{
    static LogSink sink;
    return sink;
}

llvm::StringRef levelTag(const LogLevel level)
{
    switch (level)
    {
    case LogLevel::Error:
        return "error";
    case LogLevel::Warning:
        return "warning";
    case LogLevel::Info:
        return "info";
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Off:
        break;
    }
    return "off";
}

}  // namespace

void setLogLevel(const LogLevel level)
{
    gThreshold.store(level, std::memory_order_relaxed);
}

LogLevel logLevel()
{
    return gThreshold.load(std::memory_order_relaxed);
}

void setLogSink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(sinkMutex());
    sinkSlot() = std::move(sink);
}

std::optional<LogLevel> parseLogLevel(const llvm::StringRef text)
{
    const std::string lowered = text.trim().lower();
    if (lowered == "off")
    {
        return LogLevel::Off;
    }
    if (lowered == "error")
    {
        return LogLevel::Error;
    }
    if (lowered == "warning" || lowered == "warn")
    {
        return LogLevel::Warning;
    }
    if (lowered == "info")
    {
        return LogLevel::Info;
    }
    if (lowered == "debug")
    {
        return LogLevel::Debug;
    }
    return std::nullopt;
}

void log(const LogLevel level, const llvm::StringRef component, const llvm::Twine& message)
{
    if (level == LogLevel::Off || static_cast<int>(level) > static_cast<int>(logLevel()))
    {
        return;
    }

    LogRecord record{level, component.str(), message.str()};

    std::lock_guard<std::mutex> lock(sinkMutex());
    if (sinkSlot())
    {
        sinkSlot()(record);
        return;
    }
    llvm::errs() << "[lspvisor][" << record.component << "] " << levelTag(level) << ": " << record.message << "\n";
    llvm::errs().flush();
}

}  // namespace lspvisor
