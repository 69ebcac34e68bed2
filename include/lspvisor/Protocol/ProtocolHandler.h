//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Request correlation and inbound message dispatch.
///
/// The handler allocates request ids, keeps the pending-request table, routes
/// responses to their waiting callers, fans notifications out to registered
/// handlers, and produces replies to requests the server sends.
///
//===----------------------------------------------------------------------===//
#ifndef LSPVISOR_PROTOCOL_PROTOCOL_HANDLER_H
#define LSPVISOR_PROTOCOL_PROTOCOL_HANDLER_H

#include "lspvisor/Protocol/Message.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lspvisor
{

/// @brief Resolution of one pending request.
struct CallOutcome final
{
    /// @brief How the request was resolved.
    enum class Status
    {
        /// @brief The server answered with a result.
        Result,

        /// @brief The server answered with an error object.
        ServerError,

        /// @brief The connection was lost before an answer arrived.
        ConnectionLost,
    };

    Status            status{Status::Result};
    llvm::json::Value result{nullptr};
    ResponseError     error;
    std::string       reason;
};

/// @brief Notification handler callback receiving the `params` value (or `null`).
using NotificationHandler = std::function<void(const llvm::json::Value& params)>;

/// @brief Correlates requests with responses and dispatches notifications.
class ProtocolHandler final
{
public:
    /// @brief Creates a handler.
    /// @param[in] idPrefix Prefix of generated request ids.
    explicit ProtocolHandler(std::string idPrefix = "lspvisor");

    ProtocolHandler(const ProtocolHandler&)            = delete;
    ProtocolHandler& operator=(const ProtocolHandler&) = delete;

    /// @brief Creates a request with a fresh id `<prefix>-<n>`.
    /// @param[in] method Method name.
    /// @param[in] params Optional parameters.
    [[nodiscard]] Request createRequest(llvm::StringRef method, std::optional<llvm::json::Value> params = std::nullopt);

    /// @brief Creates a notification.
    [[nodiscard]] Notification createNotification(llvm::StringRef                  method,
                                                  std::optional<llvm::json::Value> params = std::nullopt);

    /// @brief Registers a pending slot for the request.
    /// @return Future resolved exactly once, or a protocol error when the id is already pending.
    [[nodiscard]] llvm::Expected<std::future<CallOutcome>> trackRequest(const Request& request);

    /// @brief Removes a pending slot without resolving it.
    /// @return `true` when the id was pending.
    bool cancelRequest(llvm::StringRef id);

    /// @brief Processes one inbound message.
    ///
    /// Responses resolve and remove their pending slot; unknown ids are
    /// discarded. Notifications are delivered to every handler registered for
    /// the method; a throwing handler is logged and skipped. Server requests
    /// produce the reply the caller must send.
    ///
    /// @return Reply for a server request, otherwise `std::nullopt`.
    [[nodiscard]] std::optional<Response> handleMessage(const Message& message);

    /// @brief Registers a notification handler.
    /// @return Handle for `removeNotificationHandler`.
    std::uint64_t registerNotificationHandler(llvm::StringRef method, NotificationHandler handler);

    /// @brief Removes a notification handler.
    /// @return `true` when the handle was registered.
    bool removeNotificationHandler(std::uint64_t handle);

    /// @brief Returns the ids of every pending request.
    [[nodiscard]] std::vector<std::string> pendingRequestIds() const;

    /// @brief Returns whether the id is pending.
    [[nodiscard]] bool isPending(llvm::StringRef id) const;

    /// @brief Resolves every pending request as lost.
    /// @param[in] reason Description passed to the waiting callers.
    /// @return Number of released requests.
    std::size_t failAllPending(llvm::StringRef reason);

private:
    struct PendingEntry final
    {
        std::string                           method;
        std::promise<CallOutcome>             promise;
        std::chrono::steady_clock::time_point created;
    };

    struct HandlerEntry final
    {
        std::uint64_t       handle{0};
        std::string         method;
        NotificationHandler handler;
    };

    void                    resolve(const Response& response);
    void                    dispatch(const Notification& notification);
    [[nodiscard]] Response  answerServerRequest(const Request& request) const;

    std::string                                   idPrefix_;
    mutable std::mutex                            mutex_;
    std::uint64_t                                 nextId_{1};
    std::uint64_t                                 nextHandle_{1};
    std::unordered_map<std::string, PendingEntry> pending_;
    std::vector<HandlerEntry>                     handlers_;
};

}  // namespace lspvisor

#endif  // LSPVISOR_PROTOCOL_PROTOCOL_HANDLER_H
