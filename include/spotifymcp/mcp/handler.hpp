#pragma once
#include "spotifymcp/mcp/dispatcher.hpp"
#include "spotifymcp/types.hpp"

#include <functional>
#include <string>

namespace spotifymcp::mcp
{

constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// JSON-RPC error codes
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;
constexpr int SERVER_NOT_INITIALIZED = -32002;

struct ServerInfo
{
    std::string name{"spotify-mcp-server"};
    std::string version{"1.0.0"};
    std::string description;
    std::string instructions;
};

Json jsonrpc_result(const Json& id, Json result);
Json jsonrpc_error(const Json& id, int code, const std::string& message);

/// MCP tools/call result carrying the envelope both as text content and as
/// structuredContent, with isError mirroring !success.
Json make_call_tool_result(const ResultEnvelope& envelope);

/// Stateless handling of one JSON-RPC message (initialize, ping, tools/list, tools/call).
/// Returns a null Json for notifications, which get no response.
Json handle_message(const ServerInfo& info, const Dispatcher& dispatcher, const Json& message);

// Factory in the shape expected by the transports: request in, response out.
std::function<Json(const Json&)> make_mcp_handler(ServerInfo info, const Dispatcher& dispatcher);

enum class SessionState
{
    Uninitialized,
    Ready,
    Serving,
    Closed
};

const char* to_string(SessionState state);

/**
 * One stream connection's view of the protocol.
 *
 * Uninitialized -> Ready once initialize has been answered, Ready -> Serving on
 * notifications/initialized or the first tools request, and any state -> Closed.
 * There are no transitions back. tools/list and tools/call are refused with
 * SERVER_NOT_INITIALIZED until initialize has been seen.
 *
 * Not thread-safe: a session processes one message at a time, in arrival order.
 */
class StreamSession
{
  public:
    StreamSession(ServerInfo info, const Dispatcher& dispatcher)
        : info_(std::move(info)), dispatcher_(dispatcher)
    {
    }

    /// Returns the response, or a null Json for notifications.
    /// Throws TransportError once the session is closed.
    Json handle(const Json& message);

    void close()
    {
        state_ = SessionState::Closed;
    }

    SessionState state() const
    {
        return state_;
    }

  private:
    ServerInfo info_;
    const Dispatcher& dispatcher_;
    SessionState state_{SessionState::Uninitialized};
};

} // namespace spotifymcp::mcp
