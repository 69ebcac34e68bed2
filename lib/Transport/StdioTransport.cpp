//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the subprocess standard-stream transport.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Transport/StdioTransport.h"

#include "lspvisor/Support/Error.h"
#include "lspvisor/Support/Logging.h"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace lspvisor
{
namespace
{

/// Time a server gets to exit on its own after stdin closes.
constexpr std::chrono::milliseconds kExitWait{500};

/// Time between SIGTERM and SIGKILL on disconnect.
constexpr std::chrono::milliseconds kDisconnectGrace{2000};

}  // namespace

StdioTransport::StdioTransport(TransportOptions options)
    : options_(std::move(options))
    , reader_(*this)
{
}

StdioTransport::~StdioTransport()
{
    disconnect();
}

llvm::Error StdioTransport::connect()
{
    std::lock_guard<std::mutex> lock(processMutex_);
    if (process_)
    {
        return makeConnectionError("stdio transport is already connected");
    }

    int wake[2]{-1, -1};
    if (::pipe2(wake, O_CLOEXEC) != 0)
    {
        return makeConnectionError(llvm::Twine("failed to create wake pipe: ") + std::strerror(errno));
    }

    ProcessOptions processOptions;
    processOptions.command          = options_.command;
    processOptions.workingDirectory = options_.workingDirectory;
    processOptions.environment      = options_.environment;

    auto spawned = ChildProcess::spawn(processOptions);
    if (!spawned)
    {
        ::close(wake[0]);
        ::close(wake[1]);
        return makeConnectionError("failed to start server process: " + llvm::toString(spawned.takeError()));
    }

    process_ = std::move(*spawned);
    wakeRead_  = wake[0];
    wakeWrite_ = wake[1];
    interrupted_.store(false);
    reader_.reset();
    logInfo("stdio", "started server process pid " + llvm::Twine(process_->pid()));
    return llvm::Error::success();
}

llvm::Expected<std::optional<std::string>> StdioTransport::send(const llvm::StringRef payload)
{
    const std::string frame = encodeFrame(payload);

    std::lock_guard<std::mutex> lock(writeMutex_);
    if (!process_ || process_->stdinFd() < 0)
    {
        return makeConnectionError("stdio transport is not connected");
    }
    const int   fd      = process_->stdinFd();
    std::size_t written = 0;
    while (written < frame.size())
    {
        const ssize_t n = ::write(fd, frame.data() + written, frame.size() - written);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return makeConnectionError(llvm::Twine("write to server stdin failed: ") + std::strerror(errno));
        }
        written += static_cast<std::size_t>(n);
    }
    return std::optional<std::string>();
}

llvm::Expected<std::size_t> StdioTransport::readSome(char* buffer, const std::size_t capacity)
{
    const int fd = process_ ? process_->stdoutFd() : -1;
    if (fd < 0)
    {
        return 0U;
    }

    pollfd fds[2]{{fd, POLLIN, 0}, {wakeRead_, POLLIN, 0}};
    while (true)
    {
        if (interrupted_.load())
        {
            return 0U;
        }
        const int ready = ::poll(fds, 2, -1);
        if (ready < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return makeConnectionError(llvm::Twine("poll on server stdout failed: ") + std::strerror(errno));
        }
        if ((fds[1].revents & POLLIN) != 0)
        {
            return 0U;
        }
        if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) != 0)
        {
            break;
        }
    }

    while (true)
    {
        const ssize_t n = ::read(fd, buffer, capacity);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return makeConnectionError(llvm::Twine("read from server stdout failed: ") + std::strerror(errno));
        }
        return static_cast<std::size_t>(n);
    }
}

llvm::Expected<std::optional<std::string>> StdioTransport::receive()
{
    if (!process_)
    {
        return makeConnectionError("stdio transport is not connected");
    }
    auto frame = reader_.readFrame();
    if (interrupted_.load())
    {
        if (!frame)
        {
            llvm::consumeError(frame.takeError());
        }
        return std::optional<std::string>();
    }
    return frame;
}

void StdioTransport::interrupt()
{
    interrupted_.store(true);
    if (wakeWrite_ >= 0)
    {
        const char    byte = 1;
        const ssize_t n    = ::write(wakeWrite_, &byte, 1);
        (void) n;
    }
}

void StdioTransport::closeWakePipe()
{
    if (wakeRead_ >= 0)
    {
        ::close(wakeRead_);
        wakeRead_ = -1;
    }
    if (wakeWrite_ >= 0)
    {
        ::close(wakeWrite_);
        wakeWrite_ = -1;
    }
}

void StdioTransport::disconnect()
{
    std::lock_guard<std::mutex> processLock(processMutex_);
    if (!process_)
    {
        return;
    }

    {
        // A writer stuck on a full pipe keeps the lock; killing the server unblocks it.
        std::unique_lock<std::mutex> writeLock(writeMutex_, std::try_to_lock);
        if (writeLock.owns_lock())
        {
            process_->closeStdin();
        }
    }
    if (!process_->waitFor(kExitWait))
    {
        process_->terminate(kDisconnectGrace);
    }

    std::lock_guard<std::mutex> writeLock(writeMutex_);
    process_->closePipes();
    process_.reset();
    closeWakePipe();
    reader_.reset();
    logDebug("stdio", "transport released");
}

bool StdioTransport::isAlive()
{
    std::lock_guard<std::mutex> lock(processMutex_);
    return process_ && process_->stdinFd() >= 0 && process_->isRunning();
}

std::optional<int> StdioTransport::processId() const
{
    std::lock_guard<std::mutex> lock(processMutex_);
    if (!process_)
    {
        return std::nullopt;
    }
    return static_cast<int>(process_->pid());
}

bool StdioTransport::terminate(const std::chrono::milliseconds grace)
{
    bool exitedInGrace = true;
    {
        std::lock_guard<std::mutex> lock(processMutex_);
        if (process_)
        {
            exitedInGrace = process_->terminate(grace);
        }
    }
    disconnect();
    return exitedInGrace;
}

}  // namespace lspvisor
