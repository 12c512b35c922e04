#pragma once
#include "spotifymcp/mcp/dispatcher.hpp"
#include "spotifymcp/mcp/handler.hpp"
#include "spotifymcp/types.hpp"

#include <string>

namespace spotifymcp::server::routes
{

// Route logic of the request/response binding, independent of the HTTP library.
//
// Once a CallRequest has been formed the status is always 200 and success/failure
// travels in the envelope. Only problems that prevent forming a request are
// reported through the status: 400 for a malformed body, 503 while no dispatcher
// is attached. A null dispatcher pointer means "registry not initialized".

struct HttpReply
{
    int status{200};
    Json body; ///< null means empty body
};

/// GET /
HttpReply root(const mcp::ServerInfo& info);

/// GET /health
HttpReply health(const mcp::ServerInfo& info);

/// GET /tools
HttpReply list_tools(const mcp::Dispatcher* dispatcher);

/// POST /call_tool with {"name": string, "arguments": object?}
HttpReply call_tool(const mcp::Dispatcher* dispatcher, const std::string& body);

/// POST /mcp with one JSON-RPC message; stateless, no initialize handshake required.
HttpReply mcp_message(const mcp::ServerInfo& info, const mcp::Dispatcher* dispatcher,
                      const std::string& body);

} // namespace spotifymcp::server::routes
