#pragma once
#include "spotifymcp/mcp/handler.hpp"
#include "spotifymcp/types.hpp"

#include <atomic>
#include <iostream>
#include <thread>

namespace spotifymcp::server
{

/**
 * STDIO-based MCP server: newline-delimited JSON-RPC over a stream pair.
 *
 * Each wrapper owns exactly one StreamSession. Messages are read one line at a
 * time and answered in arrival order; there is never more than one dispatch in
 * flight. The session is closed on EOF, on stop(), and on the first unparseable
 * line (after a PARSE_ERROR response has been written).
 *
 * Usage:
 *   spotifymcp::mcp::Dispatcher dispatcher(registry);
 *   StdioServerWrapper server(info, dispatcher);
 *   server.run();  // Blocking - runs until EOF or stop() is called
 */
class StdioServerWrapper
{
  public:
    /**
     * @param info       Reported in the initialize response
     * @param dispatcher Shared dispatcher; must outlive the wrapper
     * @param in         Source of requests (default: std::cin)
     * @param out        Destination of responses (default: std::cout)
     */
    StdioServerWrapper(mcp::ServerInfo info, const mcp::Dispatcher& dispatcher,
                       std::istream& in = std::cin, std::ostream& out = std::cout);

    ~StdioServerWrapper();

    /**
     * Serve until EOF, stop(), or a transport fault (blocking).
     *
     * @return true on clean shutdown, false on a transport fault, if already running,
     *         or if the session has already been closed
     */
    bool run();

    /**
     * Run the serving loop on a background thread. Use stop() to terminate.
     *
     * @return true if the thread was started; false while running or once the
     *         session is closed
     */
    bool start_async();

    /**
     * Request shutdown and join the background thread, if any. The loop notices the
     * request between messages. Safe to call multiple times.
     */
    void stop();

    bool running() const
    {
        return running_.load();
    }

    /// True once the loop ended because of a malformed message or a failed write.
    bool faulted() const
    {
        return faulted_.load();
    }

    mcp::SessionState session_state() const
    {
        return session_.state();
    }

  private:
    bool run_loop();
    void write(const Json& message);

    mcp::StreamSession session_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> faulted_{false};
    std::thread thread_;
};

} // namespace spotifymcp::server
