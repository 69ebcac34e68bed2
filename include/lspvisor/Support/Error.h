//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Fault taxonomy for the language-server client stack.
///
/// Faults are carried as `llvm::Error` payloads so they compose with
/// `llvm::Expected` return values. Findings about analyzed source code are not
/// faults and are never represented here.
///
//===----------------------------------------------------------------------===//
#ifndef LSPVISOR_SUPPORT_ERROR_H
#define LSPVISOR_SUPPORT_ERROR_H

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <optional>
#include <string>

namespace lspvisor
{

/// @brief Category of a client-side fault.
enum class ErrorKind
{
    /// @brief Transport was never established or has been lost.
    Connection,

    /// @brief No matching response arrived within the allowed time.
    Timeout,

    /// @brief Malformed or unexpected message, or a server-reported error.
    Protocol,
};

/// @brief Returns a stable lowercase name for an error kind.
/// @param[in] kind Error kind.
/// @return Name such as `"connection"`.
[[nodiscard]] llvm::StringRef errorKindName(ErrorKind kind);

/// @brief `llvm::Error` payload describing a client-side fault.
class ClientError final : public llvm::ErrorInfo<ClientError>
{
public:
    static char ID;

    /// @brief Creates a fault payload.
    /// @param[in] kind Fault category.
    /// @param[in] message Human-readable description.
    /// @param[in] rpcCode JSON-RPC error code when the server reported one.
    ClientError(ErrorKind kind, std::string message, std::optional<std::int64_t> rpcCode = std::nullopt);

    void            log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;

    [[nodiscard]] ErrorKind kind() const
    {
        return kind_;
    }

    [[nodiscard]] const std::string& detail() const
    {
        return message_;
    }

    [[nodiscard]] std::optional<std::int64_t> rpcCode() const
    {
        return rpcCode_;
    }

private:
    ErrorKind                   kind_;
    std::string                 message_;
    std::optional<std::int64_t> rpcCode_;
};

/// @brief Creates a connection fault.
[[nodiscard]] llvm::Error makeConnectionError(const llvm::Twine& message);

/// @brief Creates a timeout fault.
[[nodiscard]] llvm::Error makeTimeoutError(const llvm::Twine& message);

/// @brief Creates a protocol fault.
/// @param[in] message Description.
/// @param[in] rpcCode Optional JSON-RPC error code reported by the server.
[[nodiscard]] llvm::Error makeProtocolError(const llvm::Twine&          message,
                                            std::optional<std::int64_t> rpcCode = std::nullopt);

/// @brief Result of classifying and consuming an error.
struct ConsumedError final
{
    /// @brief Kind of the first client fault, or `std::nullopt` for foreign errors.
    std::optional<ErrorKind> kind;

    /// @brief Concatenated messages of every payload.
    std::string message;
};

/// @brief Classifies an error and consumes it.
/// @param[in] error Error to consume. A success value yields an empty result.
/// @return Kind and message of the consumed error.
ConsumedError classifyError(llvm::Error error);

/// @brief Converts an error into its message text and consumes it.
/// @param[in] error Error to consume.
/// @return Message text.
std::string errorToString(llvm::Error error);

}  // namespace lspvisor

#endif  // LSPVISOR_SUPPORT_ERROR_H
