#include "spotifymcp/server/http_server.hpp"

#include "spotifymcp/server/http_routes.hpp"
#include "spotifymcp/util/log.hpp"

#include <httplib.h>

namespace spotifymcp::server
{

HttpServerWrapper::HttpServerWrapper(mcp::ServerInfo info,
                                     std::shared_ptr<const mcp::Dispatcher> dispatcher,
                                     std::string host, int port, std::string cors_origin)
    : info_(std::move(info)), dispatcher_(std::move(dispatcher)), host_(std::move(host)),
      port_(port), cors_origin_(std::move(cors_origin))
{
}

HttpServerWrapper::~HttpServerWrapper()
{
    stop();
}

void HttpServerWrapper::attach(std::shared_ptr<const mcp::Dispatcher> dispatcher)
{
    std::lock_guard<std::mutex> lock(dispatcher_mutex_);
    dispatcher_ = std::move(dispatcher);
}

std::shared_ptr<const mcp::Dispatcher> HttpServerWrapper::dispatcher() const
{
    // Only the pointer copy is guarded; dispatch itself runs unlocked.
    std::lock_guard<std::mutex> lock(dispatcher_mutex_);
    return dispatcher_;
}

bool HttpServerWrapper::start()
{
    // Idempotent start: return false if already running
    if (running_)
        return false;
    // The previous listener may have returned on its own
    if (thread_.joinable())
        thread_.join();
    svr_ = std::make_unique<httplib::Server>();

    // Security: Set payload and timeout limits to prevent DoS
    svr_->set_payload_max_length(10 * 1024 * 1024); // 10MB max payload
    svr_->set_read_timeout(30, 0);                  // 30 second read timeout
    svr_->set_write_timeout(30, 0);                 // 30 second write timeout

    auto send = [this](httplib::Response& res, const routes::HttpReply& reply)
    {
        // Security: Only set CORS header if explicitly configured
        if (!cors_origin_.empty())
            res.set_header("Access-Control-Allow-Origin", cors_origin_);
        res.status = reply.status;
        if (!reply.body.is_null())
            res.set_content(reply.body.dump(-1, ' ', false, Json::error_handler_t::replace),
                            "application/json");
    };

    svr_->Get("/", [this, send](const httplib::Request&, httplib::Response& res)
              { send(res, routes::root(info_)); });

    svr_->Get("/health", [this, send](const httplib::Request&, httplib::Response& res)
              { send(res, routes::health(info_)); });

    svr_->Get("/tools",
              [this, send](const httplib::Request&, httplib::Response& res)
              {
                  auto d = dispatcher();
                  send(res, routes::list_tools(d.get()));
              });

    svr_->Post("/call_tool",
               [this, send](const httplib::Request& req, httplib::Response& res)
               {
                   auto d = dispatcher();
                   send(res, routes::call_tool(d.get(), req.body));
               });

    svr_->Post("/mcp",
               [this, send](const httplib::Request& req, httplib::Response& res)
               {
                   auto d = dispatcher();
                   send(res, routes::mcp_message(info_, d.get(), req.body));
               });

    bool bound = false;
    if (port_ == 0)
    {
        int chosen = svr_->bind_to_any_port(host_);
        if (chosen > 0)
        {
            port_ = chosen;
            bound = true;
        }
    }
    else
    {
        bound = svr_->bind_to_port(host_, port_);
    }

    if (!bound)
    {
        util::log::error("HTTP server could not bind " + host_ + ":" + std::to_string(port_));
        svr_.reset();
        return false;
    }

    running_ = true;
    thread_ = std::thread(
        [this]()
        {
            svr_->listen_after_bind();
            running_ = false;
        });
    util::log::info("HTTP server listening on " + host_ + ":" + std::to_string(port_));
    return true;
}

void HttpServerWrapper::stop()
{
    // Always attempt a graceful shutdown; safe to call multiple times
    if (svr_)
        svr_->stop();
    if (thread_.joinable())
        thread_.join();
    running_ = false;
    svr_.reset();
}

} // namespace spotifymcp::server
