#pragma once
#include "spotifymcp/mcp/dispatcher.hpp"
#include "spotifymcp/mcp/handler.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace httplib
{
class Server;
}

namespace spotifymcp::server
{

/// Request/response binding over HTTP (GET /, /health, /tools; POST /call_tool, /mcp).
/// Requests are served concurrently on httplib's worker threads.
class HttpServerWrapper
{
  public:
    /**
     * @param info        Server metadata reported by / and /health
     * @param dispatcher  May be null; requests needing it get 503 until attach()
     * @param host        Host address to bind to (default: "127.0.0.1" for localhost)
     * @param port        Port to listen on; 0 picks a free port (see port())
     * @param cors_origin Optional CORS origin to allow (empty = no CORS header)
     */
    HttpServerWrapper(mcp::ServerInfo info,
                      std::shared_ptr<const mcp::Dispatcher> dispatcher = nullptr,
                      std::string host = "127.0.0.1", int port = 8000,
                      std::string cors_origin = "");
    ~HttpServerWrapper();

    void attach(std::shared_ptr<const mcp::Dispatcher> dispatcher);

    /// Binds and starts serving on a background thread. False if already running
    /// or the address could not be bound.
    bool start();
    void stop();
    bool running() const
    {
        return running_.load();
    }
    int port() const
    {
        return port_;
    }
    const std::string& host() const
    {
        return host_;
    }

  private:
    std::shared_ptr<const mcp::Dispatcher> dispatcher() const;

    mcp::ServerInfo info_;
    mutable std::mutex dispatcher_mutex_;
    std::shared_ptr<const mcp::Dispatcher> dispatcher_;
    std::string host_;
    int port_;
    std::string cors_origin_; // Optional CORS origin (empty = no CORS)
    std::unique_ptr<httplib::Server> svr_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace spotifymcp::server
