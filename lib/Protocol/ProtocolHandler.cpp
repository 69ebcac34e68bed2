//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements request correlation and notification dispatch.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Protocol/ProtocolHandler.h"

#include "lspvisor/Protocol/Extensions.h"
#include "lspvisor/Support/Error.h"
#include "lspvisor/Support/Logging.h"

#include <algorithm>
#include <exception>
#include <utility>

namespace lspvisor
{

ProtocolHandler::ProtocolHandler(std::string idPrefix)
    : idPrefix_(std::move(idPrefix))
{
}

Request ProtocolHandler::createRequest(const llvm::StringRef method, std::optional<llvm::json::Value> params)
{
    std::uint64_t sequence = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sequence = nextId_++;
    }
    Request request;
    request.id     = idPrefix_ + "-" + std::to_string(sequence);
    request.method = method.str();
    request.params = std::move(params);
    return request;
}

Notification ProtocolHandler::createNotification(const llvm::StringRef method, std::optional<llvm::json::Value> params)
{
    Notification notification;
    notification.method = method.str();
    notification.params = std::move(params);
    return notification;
}

llvm::Expected<std::future<CallOutcome>> ProtocolHandler::trackRequest(const Request& request)
{
    const std::string key = idKey(request.id);
    if (key.empty())
    {
        return makeProtocolError("request id is not trackable");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.count(key) != 0U)
    {
        return makeProtocolError("request id '" + key + "' is already pending");
    }
    PendingEntry entry;
    entry.method  = request.method;
    entry.created = std::chrono::steady_clock::now();
    std::future<CallOutcome> future = entry.promise.get_future();
    pending_.emplace(key, std::move(entry));
    return future;
}

bool ProtocolHandler::cancelRequest(const llvm::StringRef id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.erase(id.str()) != 0U;
}

std::optional<Response> ProtocolHandler::handleMessage(const Message& message)
{
    if (const auto* response = std::get_if<Response>(&message))
    {
        resolve(*response);
        return std::nullopt;
    }
    if (const auto* notification = std::get_if<Notification>(&message))
    {
        dispatch(*notification);
        return std::nullopt;
    }
    return answerServerRequest(std::get<Request>(message));
}

void ProtocolHandler::resolve(const Response& response)
{
    const std::string key = idKey(response.id);
    PendingEntry      entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto                  it = pending_.find(key);
        if (it == pending_.end())
        {
            logDebug("protocol", "discarding response for unknown or expired id '" + key + "'");
            return;
        }
        entry = std::move(it->second);
        pending_.erase(it);
    }

    const auto elapsed =
        std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - entry.created);
    logDebug("protocol", entry.method + " [" + key + "] answered after " + std::to_string(elapsed.count()) + "us");

    CallOutcome outcome;
    if (response.error)
    {
        outcome.status = CallOutcome::Status::ServerError;
        outcome.error  = *response.error;
        outcome.reason = response.error->message;
    }
    else
    {
        outcome.status = CallOutcome::Status::Result;
        outcome.result = response.result;
    }
    entry.promise.set_value(std::move(outcome));
}

void ProtocolHandler::dispatch(const Notification& notification)
{
    std::vector<NotificationHandler> matching;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : handlers_)
        {
            if (entry.method == notification.method)
            {
                matching.push_back(entry.handler);
            }
        }
    }
    if (matching.empty())
    {
        logDebug("protocol", "no handler for notification " + notification.method);
        return;
    }

    const llvm::json::Value params = notification.params ? *notification.params : llvm::json::Value(nullptr);
    for (const auto& handler : matching)
    {
        try
        {
            handler(params);
        } catch (const std::exception& ex)
        {
            logError("protocol", "handler for " + notification.method + " failed: " + ex.what());
        } catch (...)
        {
            logError("protocol", "handler for " + notification.method + " failed: unknown exception");
        }
    }
}

Response ProtocolHandler::answerServerRequest(const Request& request) const
{
    Response response;
    response.id = request.id;

    if (request.method == methods::WorkspaceConfiguration)
    {
        std::size_t items = 0;
        if (request.params)
        {
            if (const auto* params = request.params->getAsObject())
            {
                if (const auto* requested = params->getArray("items"))
                {
                    items = requested->size();
                }
            }
        }
        llvm::json::Array result;
        for (std::size_t index = 0; index < items; ++index)
        {
            result.push_back(nullptr);
        }
        response.result = std::move(result);
        return response;
    }

    logDebug("protocol", "rejecting server request " + request.method);
    response.error = ResponseError{rpc_error::MethodNotFound, "Method not found: " + request.method, std::nullopt};
    return response;
}

std::uint64_t ProtocolHandler::registerNotificationHandler(const llvm::StringRef method, NotificationHandler handler)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const std::uint64_t         handle = nextHandle_++;
    handlers_.push_back(HandlerEntry{handle, method.str(), std::move(handler)});
    return handle;
}

bool ProtocolHandler::removeNotificationHandler(const std::uint64_t handle)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = std::find_if(handlers_.begin(), handlers_.end(), [handle](const HandlerEntry& entry) {
        return entry.handle == handle;
    });
    if (it == handlers_.end())
    {
        return false;
    }
    handlers_.erase(it);
    return true;
}

std::vector<std::string> ProtocolHandler::pendingRequestIds() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string>    ids;
    ids.reserve(pending_.size());
    for (const auto& [id, _] : pending_)
    {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

bool ProtocolHandler::isPending(const llvm::StringRef id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(id.str()) != 0U;
}

std::size_t ProtocolHandler::failAllPending(const llvm::StringRef reason)
{
    std::unordered_map<std::string, PendingEntry> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released.swap(pending_);
    }
    for (auto& [id, entry] : released)
    {
        CallOutcome outcome;
        outcome.status = CallOutcome::Status::ConnectionLost;
        outcome.reason = reason.str();
        entry.promise.set_value(std::move(outcome));
    }
    if (!released.empty())
    {
        logWarning("protocol", "released " + std::to_string(released.size()) + " pending request(s): " + reason);
    }
    return released.size();
}

}  // namespace lspvisor
