//===----------------------------------------------------------------------===//
//
// Part of the lspvisor project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements JSON-RPC message validation and serialization.
///
//===----------------------------------------------------------------------===//

#include "lspvisor/Protocol/Message.h"

#include "lspvisor/Support/Error.h"

#include "llvm/Support/raw_ostream.h"

namespace lspvisor
{
namespace
{

constexpr llvm::StringLiteral kJsonRpcVersion = "2.0";

bool isValidId(const llvm::json::Value& id)
{
    return id.kind() == llvm::json::Value::String || id.kind() == llvm::json::Value::Number ||
           id.kind() == llvm::json::Value::Null;
}

llvm::Expected<ResponseError> parseResponseError(const llvm::json::Value& value)
{
    const auto* object = value.getAsObject();
    if (!object)
    {
        return makeProtocolError("response error is not an object");
    }
    ResponseError error;
    if (const auto code = object->getInteger("code"))
    {
        error.code = *code;
    }
    else
    {
        return makeProtocolError("response error has no integer code");
    }
    if (const auto message = object->getString("message"))
    {
        error.message = message->str();
    }
    if (const auto* data = object->get("data"))
    {
        error.data = *data;
    }
    return error;
}

struct JsonEncoder final
{
    llvm::json::Object object;

    void operator()(const Request& request)
    {
        object["id"]     = request.id;
        object["method"] = request.method;
        if (request.params)
        {
            object["params"] = *request.params;
        }
    }

    void operator()(const Response& response)
    {
        object["id"] = response.id;
        if (response.error)
        {
            llvm::json::Object error{{"code", response.error->code}, {"message", response.error->message}};
            if (response.error->data)
            {
                error["data"] = *response.error->data;
            }
            object["error"] = std::move(error);
            return;
        }
        object["result"] = response.result;
    }

    void operator()(const Notification& notification)
    {
        object["method"] = notification.method;
        if (notification.params)
        {
            object["params"] = *notification.params;
        }
    }
};

}  // namespace

std::string idKey(const llvm::json::Value& id)
{
    if (const auto text = id.getAsString())
    {
        return text->str();
    }
    if (const auto number = id.getAsInteger())
    {
        return std::to_string(*number);
    }
    return std::string();
}

llvm::Expected<Message> parseMessage(const llvm::json::Value& value)
{
    const auto* object = value.getAsObject();
    if (!object)
    {
        return makeProtocolError("message is not a JSON object");
    }

    const auto version = object->getString("jsonrpc");
    if (!version || *version != kJsonRpcVersion)
    {
        return makeProtocolError("message is not JSON-RPC 2.0");
    }

    const llvm::json::Value* id     = object->get("id");
    const auto               method = object->getString("method");
    const llvm::json::Value* params = object->get("params");

    if (id && !isValidId(*id))
    {
        return makeProtocolError("message id must be a string or an integer");
    }

    if (method)
    {
        if (id && id->kind() != llvm::json::Value::Null)
        {
            Request request;
            request.id     = *id;
            request.method = method->str();
            if (params)
            {
                request.params = *params;
            }
            return Message(std::move(request));
        }
        Notification notification;
        notification.method = method->str();
        if (params)
        {
            notification.params = *params;
        }
        return Message(std::move(notification));
    }

    if (object->get("method"))
    {
        return makeProtocolError("message method is not a string");
    }

    if (!id)
    {
        return makeProtocolError("notification has no method");
    }

    const llvm::json::Value* result = object->get("result");
    const llvm::json::Value* error  = object->get("error");
    if (!result && !error)
    {
        return makeProtocolError("response has neither result nor error");
    }

    Response response;
    response.id = *id;
    if (error)
    {
        auto parsedError = parseResponseError(*error);
        if (!parsedError)
        {
            return parsedError.takeError();
        }
        response.error = std::move(*parsedError);
    }
    else
    {
        response.result = *result;
    }
    return Message(std::move(response));
}

llvm::Expected<Message> parseMessageText(const llvm::StringRef text)
{
    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse(text);
    if (!parsed)
    {
        return makeProtocolError("invalid JSON payload: " + llvm::toString(parsed.takeError()));
    }
    return parseMessage(*parsed);
}

llvm::json::Value toJson(const Message& message)
{
    JsonEncoder encoder;
    encoder.object["jsonrpc"] = kJsonRpcVersion;
    std::visit(encoder, message);
    return llvm::json::Value(std::move(encoder.object));
}

std::string serializeMessage(const Message& message)
{
    std::string              payload;
    llvm::raw_string_ostream payloadStream(payload);
    payloadStream << toJson(message);
    payloadStream.flush();
    return payload;
}

llvm::StringRef methodOf(const Message& message)
{
    if (const auto* request = std::get_if<Request>(&message))
    {
        return request->method;
    }
    if (const auto* notification = std::get_if<Notification>(&message))
    {
        return notification->method;
    }
    return llvm::StringRef();
}

}  // namespace lspvisor
