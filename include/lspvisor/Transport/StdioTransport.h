//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Transport over the standard streams of a spawned server process.
///
//===----------------------------------------------------------------------===//
#ifndef LSPVISOR_TRANSPORT_STDIO_TRANSPORT_H
#define LSPVISOR_TRANSPORT_STDIO_TRANSPORT_H

#include "lspvisor/Support/ChildProcess.h"
#include "lspvisor/Transport/MessageFraming.h"
#include "lspvisor/Transport/Transport.h"

#include <atomic>
#include <memory>
#include <mutex>

namespace lspvisor
{

/// @brief `Content-Length` framed transport over a child's stdin and stdout.
class StdioTransport final : public Transport, private ByteSource
{
public:
    /// @brief Creates an unconnected transport.
    /// @param[in] options Launch options; `command`, `workingDirectory` and `environment` are used.
    explicit StdioTransport(TransportOptions options);
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&)            = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    [[nodiscard]] ConnectionKind kind() const override
    {
        return ConnectionKind::Stdio;
    }

    [[nodiscard]] llvm::Error connect() override;
    [[nodiscard]] llvm::Expected<std::optional<std::string>> send(llvm::StringRef payload) override;
    [[nodiscard]] llvm::Expected<std::optional<std::string>> receive() override;
    void                                                      interrupt() override;
    void                                                      disconnect() override;
    [[nodiscard]] bool                                        isAlive() override;
    [[nodiscard]] std::optional<int>                          processId() const override;
    bool terminate(std::chrono::milliseconds grace) override;

private:
    llvm::Expected<std::size_t> readSome(char* buffer, std::size_t capacity) override;
    void                        closeWakePipe();

    TransportOptions              options_;
    std::unique_ptr<ChildProcess> process_;
    FrameReader                   reader_;
    std::mutex                    writeMutex_;
    mutable std::mutex            processMutex_;
    std::atomic_bool              interrupted_{false};
    int                           wakeRead_{-1};
    int                           wakeWrite_{-1};
};

}  // namespace lspvisor

#endif  // LSPVISOR_TRANSPORT_STDIO_TRANSPORT_H
