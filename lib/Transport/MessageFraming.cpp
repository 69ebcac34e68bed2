//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements `Content-Length` frame encoding and incremental decoding.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Transport/MessageFraming.h"

#include "lspvisor/Support/Error.h"

#include <array>
#include <limits>

namespace lspvisor
{
namespace
{

constexpr std::size_t kReadChunk = 4096;

}  // namespace

std::string encodeFrame(const llvm::StringRef payload)
{
    std::string frame = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
    frame.append(payload.data(), payload.size());
    return frame;
}

std::optional<std::size_t> parseContentLengthHeader(const llvm::StringRef line)
{
    static constexpr llvm::StringRef Prefix = "Content-Length:";
    llvm::StringRef                  header = line;
    if (!header.consume_front_insensitive(Prefix))
    {
        return std::nullopt;
    }
    header = header.trim();
    if (header.empty())
    {
        return std::nullopt;
    }
    std::size_t value = 0;
    for (const char ch : header)
    {
        if (ch < '0' || ch > '9')
        {
            return std::nullopt;
        }
        const auto digit = static_cast<std::size_t>(ch - '0');
        if (value > (std::numeric_limits<std::size_t>::max() - digit) / 10U)
        {
            return std::nullopt;
        }
        value = value * 10U + digit;
    }
    return value;
}

FrameReader::FrameReader(ByteSource& source)
    : source_(source)
{
}

void FrameReader::reset()
{
    buffer_.clear();
}

llvm::Expected<bool> FrameReader::fill()
{
    std::array<char, kReadChunk> chunk{};
    auto                         got = source_.readSome(chunk.data(), chunk.size());
    if (!got)
    {
        return got.takeError();
    }
    if (*got == 0U)
    {
        return false;
    }
    buffer_.append(chunk.data(), *got);
    return true;
}

llvm::Expected<std::optional<std::string>> FrameReader::readLine()
{
    while (true)
    {
        const std::size_t newline = buffer_.find('\n');
        if (newline != std::string::npos)
        {
            std::string line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }
            return std::optional<std::string>(std::move(line));
        }
        auto filled = fill();
        if (!filled)
        {
            return filled.takeError();
        }
        if (!*filled)
        {
            return std::optional<std::string>();
        }
    }
}

llvm::Expected<std::optional<std::string>> FrameReader::readFrame()
{
    std::optional<std::size_t> contentLength;
    bool                       hasHeaders = false;
    while (true)
    {
        auto line = readLine();
        if (!line)
        {
            return line.takeError();
        }
        if (!*line)
        {
            if (!hasHeaders && buffer_.empty())
            {
                return std::optional<std::string>();
            }
            return makeConnectionError("stream ended inside a frame header");
        }
        if ((*line)->empty())
        {
            if (!hasHeaders)
            {
                // Stray separator between frames.
                continue;
            }
            break;
        }

        hasHeaders = true;
        if (const auto parsed = parseContentLengthHeader(**line))
        {
            contentLength = parsed;
        }
    }

    if (!contentLength)
    {
        return makeProtocolError("missing Content-Length header");
    }

    while (buffer_.size() < *contentLength)
    {
        auto filled = fill();
        if (!filled)
        {
            return filled.takeError();
        }
        if (!*filled)
        {
            return makeConnectionError("truncated JSON-RPC payload");
        }
    }

    std::string payload = buffer_.substr(0, *contentLength);
    buffer_.erase(0, *contentLength);
    return std::optional<std::string>(std::move(payload));
}

}  // namespace lspvisor
