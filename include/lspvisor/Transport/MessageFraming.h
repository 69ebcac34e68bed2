//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// `Content-Length` framing for stream transports.
///
/// Frames are `Content-Length: <n>\r\n\r\n` followed by exactly `n` payload
/// bytes. The reader tolerates bare `\n` line endings and additional headers.
///
//===----------------------------------------------------------------------===//
#ifndef LSPVISOR_TRANSPORT_MESSAGE_FRAMING_H
#define LSPVISOR_TRANSPORT_MESSAGE_FRAMING_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <optional>
#include <string>

namespace lspvisor
{

/// @brief Prepends the `Content-Length` header block to a payload.
[[nodiscard]] std::string encodeFrame(llvm::StringRef payload);

/// @brief Blocking source of raw bytes.
class ByteSource
{
public:
    virtual ~ByteSource() = default;

    /// @brief Reads at least one byte unless the stream ended.
    /// @param[out] buffer Destination.
    /// @param[in] capacity Destination size.
    /// @return Number of bytes read; zero at end of stream.
    [[nodiscard]] virtual llvm::Expected<std::size_t> readSome(char* buffer, std::size_t capacity) = 0;
};

/// @brief Incremental frame decoder over a byte source.
class FrameReader final
{
public:
    /// @brief Creates a reader.
    /// @param[in] source Byte source. Must outlive the reader.
    explicit FrameReader(ByteSource& source);

    /// @brief Reads one complete frame, looping over partial reads.
    /// @return Payload, `std::nullopt` on a clean end of stream between frames,
    ///         or a protocol error for malformed headers and a connection error
    ///         for a stream ending mid-frame.
    [[nodiscard]] llvm::Expected<std::optional<std::string>> readFrame();

    /// @brief Drops any buffered bytes.
    void reset();

private:
    llvm::Expected<bool> fill();
    llvm::Expected<std::optional<std::string>> readLine();

    ByteSource& source_;
    std::string buffer_;
};

/// @brief Parses a `Content-Length:` header line.
/// @param[in] line Header line without its terminator.
/// @return Declared length, or `std::nullopt` if the line is not a valid `Content-Length` header.
[[nodiscard]] std::optional<std::size_t> parseContentLengthHeader(llvm::StringRef line);

}  // namespace lspvisor

#endif  // LSPVISOR_TRANSPORT_MESSAGE_FRAMING_H
