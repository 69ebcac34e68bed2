//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the client fault payload and its helpers.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Support/Error.h"

#include "llvm/Support/raw_ostream.h"

#include <system_error>
#include <utility>

namespace lspvisor
{

char ClientError::ID = 0;

llvm::StringRef errorKindName(const ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Connection:
        return "connection";
    case ErrorKind::Timeout:
        return "timeout";
    case ErrorKind::Protocol:
        return "protocol";
    }
    return "unknown";
}

ClientError::ClientError(const ErrorKind kind, std::string message, const std::optional<std::int64_t> rpcCode)
    : kind_(kind)
    , message_(std::move(message))
    , rpcCode_(rpcCode)
{
}

void ClientError::log(llvm::raw_ostream& os) const
{
    os << errorKindName(kind_) << " error: " << message_;
    if (rpcCode_)
    {
        os << " (code " << *rpcCode_ << ")";
    }
}

std::error_code ClientError::convertToErrorCode() const
{
    switch (kind_)
    {
    case ErrorKind::Connection:
        return std::make_error_code(std::errc::not_connected);
    case ErrorKind::Timeout:
        return std::make_error_code(std::errc::timed_out);
    case ErrorKind::Protocol:
        return std::make_error_code(std::errc::protocol_error);
    }
    return llvm::inconvertibleErrorCode();
}

llvm::Error makeConnectionError(const llvm::Twine& message)
{
    return llvm::make_error<ClientError>(ErrorKind::Connection, message.str());
}

llvm::Error makeTimeoutError(const llvm::Twine& message)
{
    return llvm::make_error<ClientError>(ErrorKind::Timeout, message.str());
}

llvm::Error makeProtocolError(const llvm::Twine& message, const std::optional<std::int64_t> rpcCode)
{
    return llvm::make_error<ClientError>(ErrorKind::Protocol, message.str(), rpcCode);
}

ConsumedError classifyError(llvm::Error error)
{
    ConsumedError result;
    llvm::handleAllErrors(
        std::move(error),
        [&result](const ClientError& clientError) {
            if (!result.kind)
            {
                result.kind = clientError.kind();
            }
            if (!result.message.empty())
            {
                result.message += "; ";
            }
            result.message += clientError.detail();
        },
        [&result](const llvm::ErrorInfoBase& other) {
            if (!result.message.empty())
            {
                result.message += "; ";
            }
            result.message += other.message();
        });
    return result;
}

std::string errorToString(llvm::Error error)
{
    return llvm::toString(std::move(error));
}

}  // namespace lspvisor
