//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Validates Content-Length framing over fragmented and malformed streams.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Support/Error.h"
#include "lspvisor/Transport/MessageFraming.h"

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>

namespace
{

/// Hands out at most `step` bytes per read.
class StringSource final : public lspvisor::ByteSource
{
public:
    StringSource(std::string data, std::size_t step)
        : data_(std::move(data))
        , step_(step)
    {
    }

    llvm::Expected<std::size_t> readSome(char* buffer, std::size_t capacity) override
    {
        const std::size_t count = std::min({step_, capacity, data_.size() - offset_});
        std::copy_n(data_.data() + offset_, count, buffer);
        offset_ += count;
        return count;
    }

private:
    std::string data_;
    std::size_t step_;
    std::size_t offset_{0};
};

/// Reads one frame and classifies the failure, if any.
struct FrameOutcome
{
    std::optional<std::string>         payload;
    bool                               endOfStream{false};
    std::optional<lspvisor::ErrorKind> errorKind;
    std::string                        errorMessage;
};

FrameOutcome readOne(lspvisor::FrameReader& reader)
{
    FrameOutcome outcome;
    auto         frame = reader.readFrame();
    if (!frame)
    {
        const auto consumed  = lspvisor::classifyError(frame.takeError());
        outcome.errorKind    = consumed.kind;
        outcome.errorMessage = consumed.message;
        return outcome;
    }
    if (!*frame)
    {
        outcome.endOfStream = true;
        return outcome;
    }
    outcome.payload = std::move(**frame);
    return outcome;
}

}  // namespace

bool runMessageFramingTests()
{
    {
        const std::string first  = R"({"jsonrpc":"2.0","id":1,"result":null})";
        const std::string second = R"({"jsonrpc":"2.0","method":"window/logMessage","params":{"message":"é"}})";
        StringSource      source(lspvisor::encodeFrame(first) + lspvisor::encodeFrame(second), 1);
        lspvisor::FrameReader reader(source);

        const auto a = readOne(reader);
        const auto b = readOne(reader);
        const auto c = readOne(reader);
        if (!a.payload || *a.payload != first || !b.payload || *b.payload != second)
        {
            std::cerr << "byte-at-a-time stream did not yield both frames intact\n";
            return false;
        }
        if (!c.endOfStream || c.errorKind)
        {
            std::cerr << "expected clean end of stream after the last frame\n";
            return false;
        }
    }

    {
        // Header names are case-insensitive; unknown headers are skipped.
        StringSource source("content-length: 2\r\nContent-Type: application/vscode-jsonrpc\r\n\r\n{}", 3);
        lspvisor::FrameReader reader(source);
        const auto outcome = readOne(reader);
        if (!outcome.payload || *outcome.payload != "{}")
        {
            std::cerr << "expected case-insensitive Content-Length to be accepted\n";
            return false;
        }
    }

    {
        StringSource          source("Header: value\r\n\r\n{}", 64);
        lspvisor::FrameReader reader(source);
        const auto            outcome = readOne(reader);
        if (outcome.errorKind != lspvisor::ErrorKind::Protocol || outcome.errorMessage != "missing Content-Length header")
        {
            std::cerr << "expected missing Content-Length protocol error\n";
            return false;
        }
    }

    {
        StringSource          source("Content-Length: 10\r\n\r\n{}", 64);
        lspvisor::FrameReader reader(source);
        const auto            outcome = readOne(reader);
        if (outcome.errorKind != lspvisor::ErrorKind::Connection || outcome.errorMessage != "truncated JSON-RPC payload")
        {
            std::cerr << "expected truncated payload connection error\n";
            return false;
        }
    }

    {
        StringSource          source("Content-Len", 64);
        lspvisor::FrameReader reader(source);
        const auto            outcome = readOne(reader);
        if (outcome.errorKind != lspvisor::ErrorKind::Connection)
        {
            std::cerr << "expected stream ending inside a header to be a connection error\n";
            return false;
        }
    }

    {
        StringSource          source("", 64);
        lspvisor::FrameReader reader(source);
        if (!readOne(reader).endOfStream)
        {
            std::cerr << "expected empty stream to be a clean end of stream\n";
            return false;
        }
    }

    if (lspvisor::parseContentLengthHeader("Content-Length: abc") ||
        lspvisor::parseContentLengthHeader("Content-Length:") ||
        lspvisor::parseContentLengthHeader("Content-Length: 99999999999999999999999999") ||
        lspvisor::parseContentLengthHeader("CONTENT-LENGTH:  17 ") != std::optional<std::size_t>(17))
    {
        std::cerr << "Content-Length header parsing mismatch\n";
        return false;
    }

    if (lspvisor::encodeFrame("{}") != "Content-Length: 2\r\n\r\n{}")
    {
        std::cerr << "encodeFrame emitted unexpected frame\n";
        return false;
    }
    return true;
}
