#include "spotifymcp/server/http_routes.hpp"

#include "spotifymcp/util/json.hpp"

namespace spotifymcp::server::routes
{

namespace
{
HttpReply transport_error(int status, const std::string& message)
{
    return HttpReply{status, Json{{"error", message}}};
}

HttpReply not_initialized()
{
    return transport_error(503, "registry not initialized");
}
} // namespace

HttpReply root(const mcp::ServerInfo& info)
{
    return HttpReply{200, Json{{"name", info.name},
                               {"version", info.version},
                               {"description", info.description},
                               {"status", "running"},
                               {"endpoints", Json{{"health", "/health"},
                                                  {"tools", "/tools"},
                                                  {"call_tool", "/call_tool"},
                                                  {"mcp", "/mcp"}}}}};
}

HttpReply health(const mcp::ServerInfo& info)
{
    return HttpReply{
        200, Json{{"status", "healthy"}, {"server", info.name}, {"version", info.version}}};
}

HttpReply list_tools(const mcp::Dispatcher* dispatcher)
{
    if (!dispatcher)
        return not_initialized();
    Json tools = dispatcher->list_tools();
    size_t count = tools.size();
    return HttpReply{200, Json{{"tools", std::move(tools)}, {"count", count}}};
}

HttpReply call_tool(const mcp::Dispatcher* dispatcher, const std::string& body)
{
    if (!dispatcher)
        return not_initialized();

    Json payload = util::json::try_parse(body);
    if (payload.is_discarded())
        return transport_error(400, "request body is not valid JSON");
    if (!payload.is_object())
        return transport_error(400, "request body must be a JSON object");
    if (!payload.contains("name") || !payload["name"].is_string())
        return transport_error(400, "field 'name' must be a string");

    mcp::CallRequest request;
    request.name = payload["name"].get<std::string>();
    if (payload.contains("arguments") && !payload["arguments"].is_null())
    {
        if (!payload["arguments"].is_object())
            return transport_error(400, "field 'arguments' must be an object");
        request.arguments = payload["arguments"];
    }

    return HttpReply{200, dispatcher->dispatch(request).to_json()};
}

HttpReply mcp_message(const mcp::ServerInfo& info, const mcp::Dispatcher* dispatcher,
                      const std::string& body)
{
    if (!dispatcher)
        return not_initialized();

    Json message = util::json::try_parse(body);
    if (message.is_discarded())
        return HttpReply{400, mcp::jsonrpc_error(Json(), mcp::PARSE_ERROR, "Parse error")};

    Json response = mcp::handle_message(info, *dispatcher, message);
    if (response.is_null())
        return HttpReply{202, Json()};
    return HttpReply{200, std::move(response)};
}

} // namespace spotifymcp::server::routes
