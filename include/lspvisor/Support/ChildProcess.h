//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// POSIX child process with piped standard streams.
///
/// Language servers launched over stdio are owned through this type. The
/// child's stdin and stdout are pipes held by the parent; stderr is inherited.
///
//===----------------------------------------------------------------------===//
#ifndef LSPVISOR_SUPPORT_CHILD_PROCESS_H
#define LSPVISOR_SUPPORT_CHILD_PROCESS_H

#include "llvm/Support/Error.h"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace lspvisor
{

/// @brief Launch parameters for a child process.
struct ProcessOptions final
{
    /// @brief Program followed by its arguments. The program is resolved through `PATH`.
    std::vector<std::string> command;

    /// @brief Working directory for the child, or empty to inherit.
    std::string workingDirectory;

    /// @brief Variables added to (or overriding) the inherited environment.
    std::map<std::string, std::string> environment;
};

/// @brief Running child process owning its stdin and stdout pipe ends.
class ChildProcess final
{
public:
    /// @brief Spawns a child process.
    /// @param[in] options Launch parameters.
    /// @return Child handle, or an error when the pipes, fork, chdir, or exec fail.
    [[nodiscard]] static llvm::Expected<std::unique_ptr<ChildProcess>> spawn(const ProcessOptions& options);

    /// @brief Kills and reaps the child if it is still running.
    ~ChildProcess();

    ChildProcess(const ChildProcess&)            = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /// @brief Returns the child pid.
    [[nodiscard]] pid_t pid() const
    {
        return pid_;
    }

    /// @brief Returns the parent's write end of the child's stdin, or -1 once closed.
    [[nodiscard]] int stdinFd() const
    {
        return stdinFd_;
    }

    /// @brief Returns the parent's read end of the child's stdout, or -1 once closed.
    [[nodiscard]] int stdoutFd() const
    {
        return stdoutFd_;
    }

    /// @brief Closes the parent's write end of the child's stdin.
    void closeStdin();

    /// @brief Closes both parent pipe ends.
    void closePipes();

    /// @brief Returns whether the child has not yet exited. Reaps it when it has.
    [[nodiscard]] bool isRunning();

    /// @brief Returns the raw wait status once the child has been reaped.
    [[nodiscard]] std::optional<int> waitStatus() const
    {
        return waitStatus_;
    }

    /// @brief Waits for the child to exit.
    /// @param[in] timeout Maximum wait.
    /// @return `true` when the child exited within `timeout`.
    [[nodiscard]] bool waitFor(std::chrono::milliseconds timeout);

    /// @brief Sends SIGTERM, waits up to `grace`, then sends SIGKILL.
    /// @param[in] grace Grace period before the forced kill.
    /// @return `true` when the child exited within the grace period.
    bool terminate(std::chrono::milliseconds grace);

    /// @brief Sends SIGKILL and reaps the child.
    void kill();

private:
    ChildProcess(pid_t pid, int stdinFd, int stdoutFd);

    bool reap(bool block);

    pid_t              pid_{-1};
    int                stdinFd_{-1};
    int                stdoutFd_{-1};
    std::optional<int> waitStatus_;
};

}  // namespace lspvisor

#endif  // LSPVISOR_SUPPORT_CHILD_PROCESS_H
