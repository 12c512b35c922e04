#include "spotifymcp/mcp/handler.hpp"

#include "spotifymcp/exceptions.hpp"
#include "spotifymcp/util/log.hpp"

namespace spotifymcp::mcp
{

Json jsonrpc_result(const Json& id, Json result)
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

Json jsonrpc_error(const Json& id, int code, const std::string& message)
{
    return Json{{"jsonrpc", "2.0"},
                {"id", id.is_null() ? Json() : id},
                {"error", Json{{"code", code}, {"message", message}}}};
}

static Json initialize_result(const ServerInfo& info)
{
    Json result = {
        {"protocolVersion", PROTOCOL_VERSION},
        {"capabilities", Json{{"tools", Json{{"listChanged", false}}}}},
        {"serverInfo", Json{{"name", info.name}, {"version", info.version}}},
    };
    if (!info.instructions.empty())
        result["instructions"] = info.instructions;
    return result;
}

Json make_call_tool_result(const ResultEnvelope& envelope)
{
    Json structured = envelope.to_json();
    return Json{
        {"content", Json::array({Json{{"type", "text"}, {"text", structured.dump(-1, ' ', false, Json::error_handler_t::replace)}}})},
        {"structuredContent", structured},
        {"isError", !envelope.success()},
    };
}

static Json handle_tools_call(const Dispatcher& dispatcher, const Json& id, const Json& params)
{
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string())
        return jsonrpc_error(id, INVALID_PARAMS, "Missing tool name");

    CallRequest request;
    request.name = params["name"].get<std::string>();
    request.arguments = params.value("arguments", Json::object());
    if (!request.arguments.is_null() && !request.arguments.is_object())
        return jsonrpc_error(id, INVALID_PARAMS, "Tool arguments must be an object");

    return jsonrpc_result(id, make_call_tool_result(dispatcher.dispatch(request)));
}

Json handle_message(const ServerInfo& info, const Dispatcher& dispatcher, const Json& message)
{
    if (!message.is_object())
        return jsonrpc_error(Json(), INVALID_REQUEST, "Request must be a JSON object");

    const bool is_notification = !message.contains("id");
    const Json id = is_notification ? Json() : message.at("id");
    if (!message.contains("method") || !message["method"].is_string())
    {
        if (is_notification)
            return Json();
        return jsonrpc_error(id, INVALID_REQUEST, "Missing method");
    }
    const std::string method = message["method"].get<std::string>();
    const Json params = message.value("params", Json::object());

    try
    {
        if (is_notification)
            return Json();

        if (method == "initialize")
            return jsonrpc_result(id, initialize_result(info));

        if (method == "ping")
            return jsonrpc_result(id, Json::object());

        if (method == "tools/list")
            return jsonrpc_result(id, Json{{"tools", dispatcher.list_tools()}});

        if (method == "tools/call")
            return handle_tools_call(dispatcher, id, params);

        return jsonrpc_error(id, METHOD_NOT_FOUND, "Method '" + method + "' not found");
    }
    catch (const std::exception& e)
    {
        util::log::error("error handling " + method + ": " + e.what());
        return jsonrpc_error(id, INTERNAL_ERROR, e.what());
    }
}

std::function<Json(const Json&)> make_mcp_handler(ServerInfo info, const Dispatcher& dispatcher)
{
    return [info = std::move(info), &dispatcher](const Json& message) -> Json
    { return handle_message(info, dispatcher, message); };
}

const char* to_string(SessionState state)
{
    switch (state)
    {
    case SessionState::Uninitialized:
        return "uninitialized";
    case SessionState::Ready:
        return "ready";
    case SessionState::Serving:
        return "serving";
    case SessionState::Closed:
        return "closed";
    }
    return "closed";
}

Json StreamSession::handle(const Json& message)
{
    if (state_ == SessionState::Closed)
        throw TransportError("session is closed");

    if (!message.is_object() || !message.contains("method") || !message["method"].is_string())
        return handle_message(info_, dispatcher_, message);

    const std::string method = message["method"].get<std::string>();
    const bool is_notification = !message.contains("id");

    if (method == "initialize")
    {
        if (state_ != SessionState::Uninitialized)
        {
            if (is_notification)
                return Json();
            return jsonrpc_error(message["id"], INVALID_REQUEST, "Session already initialized");
        }
        Json response = handle_message(info_, dispatcher_, message);
        if (!is_notification)
        {
            state_ = SessionState::Ready;
            util::log::debug("session ready");
        }
        return response;
    }

    if (method == "notifications/initialized")
    {
        if (state_ == SessionState::Ready)
        {
            state_ = SessionState::Serving;
            util::log::debug("session serving");
        }
        return Json();
    }

    if (method == "tools/list" || method == "tools/call")
    {
        if (state_ == SessionState::Uninitialized)
        {
            if (is_notification)
                return Json();
            return jsonrpc_error(message["id"], SERVER_NOT_INITIALIZED, "Server not initialized");
        }
        if (state_ == SessionState::Ready)
            state_ = SessionState::Serving;
    }

    return handle_message(info_, dispatcher_, message);
}

} // namespace spotifymcp::mcp
