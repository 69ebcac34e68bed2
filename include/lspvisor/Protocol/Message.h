//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// JSON-RPC 2.0 message model.
///
/// A message is a request (id and method), a response (id and either a result
/// or an error object), or a notification (method without id).
///
//===----------------------------------------------------------------------===//
#ifndef LSPVISOR_PROTOCOL_MESSAGE_H
#define LSPVISOR_PROTOCOL_MESSAGE_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace lspvisor
{

/// @brief JSON-RPC error codes used by this client.
namespace rpc_error
{
inline constexpr std::int64_t ParseError     = -32700;
inline constexpr std::int64_t InvalidRequest = -32600;
inline constexpr std::int64_t MethodNotFound = -32601;
inline constexpr std::int64_t InternalError  = -32603;
}  // namespace rpc_error

/// @brief Outbound or server-originated request.
struct Request final
{
    /// @brief Request id as it appears on the wire (string or integer).
    llvm::json::Value id{nullptr};

    /// @brief Method name.
    std::string method;

    /// @brief Parameters; absent when the request carries none.
    std::optional<llvm::json::Value> params;
};

/// @brief Error object of a failed response.
struct ResponseError final
{
    std::int64_t                     code{rpc_error::InternalError};
    std::string                      message;
    std::optional<llvm::json::Value> data;
};

/// @brief Response to a request.
struct Response final
{
    /// @brief Id of the request being answered; `null` when the server could not read it.
    llvm::json::Value id{nullptr};

    /// @brief Result value; meaningful only when `error` is absent.
    llvm::json::Value result{nullptr};

    /// @brief Error object for failed requests.
    std::optional<ResponseError> error;
};

/// @brief One-way message.
struct Notification final
{
    std::string                      method;
    std::optional<llvm::json::Value> params;
};

/// @brief Any JSON-RPC message.
using Message = std::variant<Request, Response, Notification>;

/// @brief Returns the correlation key of an id: strings verbatim, integers as decimal text.
/// @return Key, or an empty string for ids of any other type.
[[nodiscard]] std::string idKey(const llvm::json::Value& id);

/// @brief Parses and validates one message.
/// @param[in] value Decoded JSON payload.
/// @return Message, or a protocol error for a non-object body, a missing or
///         wrong `jsonrpc` version, or a shape matching no message kind.
[[nodiscard]] llvm::Expected<Message> parseMessage(const llvm::json::Value& value);

/// @brief Decodes and validates one message from JSON text.
[[nodiscard]] llvm::Expected<Message> parseMessageText(llvm::StringRef text);

/// @brief Converts a message to its wire JSON object, including `"jsonrpc":"2.0"`.
[[nodiscard]] llvm::json::Value toJson(const Message& message);

/// @brief Serializes a message to compact JSON text.
[[nodiscard]] std::string serializeMessage(const Message& message);

/// @brief Returns the method of a request or notification, or an empty string for responses.
[[nodiscard]] llvm::StringRef methodOf(const Message& message);

}  // namespace lspvisor

#endif  // LSPVISOR_PROTOCOL_MESSAGE_H
