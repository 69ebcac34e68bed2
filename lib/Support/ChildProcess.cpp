//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements fork/exec child processes with piped standard streams.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Support/ChildProcess.h"

#include "lspvisor/Support/Logging.h"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lspvisor
{
namespace
{

void closeFd(int& fd)
{
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

llvm::Error errnoError(const int code, const llvm::Twine& what)
{
    return llvm::createStringError(std::error_code(code, std::generic_category()),
                                   what + ": " + std::strerror(code));
}

/// Writes are to pipes whose reader may die at any time; report EPIPE instead of dying.
void ignoreSigPipe()
{
    static std::once_flag once;
    std::call_once(once, []() { ::signal(SIGPIPE, SIG_IGN); });
}

[[noreturn]] void failChild(const int reportFd, const int code)
{
    const ssize_t ignored = ::write(reportFd, &code, sizeof(code));
    (void) ignored;
    ::_exit(127);
}

}  // namespace

llvm::Expected<std::unique_ptr<ChildProcess>> ChildProcess::spawn(const ProcessOptions& options)
{
    if (options.command.empty() || options.command.front().empty())
    {
        return llvm::createStringError(std::make_error_code(std::errc::invalid_argument),
                                       "empty process command");
    }
    ignoreSigPipe();

    // Argument and environment storage is prepared before fork.
    std::vector<std::string> args = options.command;
    std::vector<char*>       argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args)
    {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    int inPipe[2]{-1, -1};
    int outPipe[2]{-1, -1};
    int reportPipe[2]{-1, -1};
    if (::pipe2(inPipe, O_CLOEXEC) != 0)
    {
        return errnoError(errno, "pipe() failed for child stdin");
    }
    if (::pipe2(outPipe, O_CLOEXEC) != 0)
    {
        const int code = errno;
        closeFd(inPipe[0]);
        closeFd(inPipe[1]);
        return errnoError(code, "pipe() failed for child stdout");
    }
    if (::pipe2(reportPipe, O_CLOEXEC) != 0)
    {
        const int code = errno;
        closeFd(inPipe[0]);
        closeFd(inPipe[1]);
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return errnoError(code, "pipe() failed for exec report");
    }

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        const int code = errno;
        for (int* fd : {&inPipe[0], &inPipe[1], &outPipe[0], &outPipe[1], &reportPipe[0], &reportPipe[1]})
        {
            closeFd(*fd);
        }
        return errnoError(code, "fork() failed");
    }

    if (pid == 0)
    {
        ::close(reportPipe[0]);
        if (::dup2(inPipe[0], STDIN_FILENO) < 0 || ::dup2(outPipe[1], STDOUT_FILENO) < 0)
        {
            failChild(reportPipe[1], errno);
        }
        if (!options.workingDirectory.empty() && ::chdir(options.workingDirectory.c_str()) != 0)
        {
            failChild(reportPipe[1], errno);
        }
        for (const auto& [key, value] : options.environment)
        {
            ::setenv(key.c_str(), value.c_str(), 1);
        }
        ::signal(SIGPIPE, SIG_DFL);
        ::execvp(argv[0], argv.data());
        failChild(reportPipe[1], errno);
    }

    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(reportPipe[1]);

    // The report pipe closes on successful exec; a payload means the child failed before it.
    int     childErrno = 0;
    ssize_t got        = -1;
    do
    {
        got = ::read(reportPipe[0], &childErrno, sizeof(childErrno));
    } while (got < 0 && errno == EINTR);
    closeFd(reportPipe[0]);

    if (got == static_cast<ssize_t>(sizeof(childErrno)))
    {
        closeFd(inPipe[1]);
        closeFd(outPipe[0]);
        int status = 0;
        ::waitpid(pid, &status, 0);
        return errnoError(childErrno, "failed to launch '" + options.command.front() + "'");
    }

    logDebug("process", "spawned '" + options.command.front() + "' as pid " + llvm::Twine(pid));
    return std::unique_ptr<ChildProcess>(new ChildProcess(pid, inPipe[1], outPipe[0]));
}

ChildProcess::ChildProcess(const pid_t pid, const int stdinFd, const int stdoutFd)
    : pid_(pid)
    , stdinFd_(stdinFd)
    , stdoutFd_(stdoutFd)
{
}

ChildProcess::~ChildProcess()
{
    closePipes();
    if (isRunning())
    {
        kill();
    }
}

void ChildProcess::closeStdin()
{
    closeFd(stdinFd_);
}

void ChildProcess::closePipes()
{
    closeFd(stdinFd_);
    closeFd(stdoutFd_);
}

bool ChildProcess::reap(const bool block)
{
    if (waitStatus_)
    {
        return true;
    }
    int   status = 0;
    pid_t done   = -1;
    do
    {
        done = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (done < 0 && errno == EINTR);

    if (done == pid_)
    {
        waitStatus_ = status;
        return true;
    }
    if (done < 0)
    {
        // ECHILD: reaped elsewhere.
        waitStatus_ = 0;
        return true;
    }
    return false;
}

bool ChildProcess::isRunning()
{
    return !reap(false);
}

bool ChildProcess::waitFor(const std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!reap(false))
    {
        if (std::chrono::steady_clock::now() >= deadline)
        {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return true;
}

bool ChildProcess::terminate(const std::chrono::milliseconds grace)
{
    if (!isRunning())
    {
        return true;
    }
    ::kill(pid_, SIGTERM);
    if (waitFor(grace))
    {
        return true;
    }
    logWarning("process", "pid " + llvm::Twine(pid_) + " ignored SIGTERM; killing");
    kill();
    return false;
}

void ChildProcess::kill()
{
    if (waitStatus_)
    {
        return;
    }
    ::kill(pid_, SIGKILL);
    reap(true);
}

}  // namespace lspvisor
