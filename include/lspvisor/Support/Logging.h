//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Leveled diagnostic logging for the client and server-manager subsystems.
///
/// Records are written to `llvm::errs()` as `[lspvisor][component] message`
/// lines. A sink callback can replace the stream writer, which is how tests
/// capture records.
///
//===----------------------------------------------------------------------===//
#ifndef LSPVISOR_SUPPORT_LOGGING_H
#define LSPVISOR_SUPPORT_LOGGING_H

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"

#include <functional>
#include <optional>
#include <string>

namespace lspvisor
{

/// @brief Log verbosity, ordered from least to most verbose.
enum class LogLevel
{
    /// @brief Disable all output.
    Off,

    /// @brief Failures that lose data or abandon an operation.
    Error,

    /// @brief Recoverable failures.
    Warning,

    /// @brief Lifecycle events.
    Info,

    /// @brief Per-message tracing.
    Debug,
};

/// @brief One emitted log record.
struct LogRecord final
{
    /// @brief Record severity.
    LogLevel level{LogLevel::Info};

    /// @brief Emitting component, e.g. `"client"`.
    std::string component;

    /// @brief Formatted message text.
    std::string message;
};

/// @brief Sink callback receiving every record at or above the threshold.
using LogSink = std::function<void(const LogRecord&)>;

/// @brief Sets the process-wide log threshold.
/// @param[in] level Most verbose level that is still emitted.
void setLogLevel(LogLevel level);

/// @brief Returns the current log threshold.
[[nodiscard]] LogLevel logLevel();

/// @brief Replaces the record writer. An empty sink restores `llvm::errs()` output.
/// @param[in] sink Sink callback.
void setLogSink(LogSink sink);

/// @brief Parses a level name (`off`, `error`, `warning`, `info`, `debug`).
/// @param[in] text Level name, case-insensitive.
/// @return Parsed level, or `std::nullopt` for unknown names.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(llvm::StringRef text);

/// @brief Emits one record when `level` passes the threshold.
/// @param[in] level Record severity.
/// @param[in] component Emitting component.
/// @param[in] message Message text.
void log(LogLevel level, llvm::StringRef component, const llvm::Twine& message);

inline void logError(llvm::StringRef component, const llvm::Twine& message)
{
    log(LogLevel::Error, component, message);
}

inline void logWarning(llvm::StringRef component, const llvm::Twine& message)
{
    log(LogLevel::Warning, component, message);
}

inline void logInfo(llvm::StringRef component, const llvm::Twine& message)
{
    log(LogLevel::Info, component, message);
}

inline void logDebug(llvm::StringRef component, const llvm::Twine& message)
{
    log(LogLevel::Debug, component, message);
}

}  // namespace lspvisor

#endif  // LSPVISOR_SUPPORT_LOGGING_H
