#include "spotifymcp/server/stdio_server.hpp"

#include "spotifymcp/exceptions.hpp"
#include "spotifymcp/util/json.hpp"
#include "spotifymcp/util/log.hpp"

#include <string>

namespace spotifymcp::server
{

namespace
{
bool is_blank(const std::string& line)
{
    return line.find_first_not_of(" \t\r") == std::string::npos;
}
} // namespace

StdioServerWrapper::StdioServerWrapper(mcp::ServerInfo info, const mcp::Dispatcher& dispatcher,
                                       std::istream& in, std::ostream& out)
    : session_(std::move(info), dispatcher), in_(in), out_(out)
{
}

StdioServerWrapper::~StdioServerWrapper()
{
    stop();
}

void StdioServerWrapper::write(const Json& message)
{
    // Line-delimited: one JSON document per line, flushed immediately
    out_ << message.dump(-1, ' ', false, Json::error_handler_t::replace) << '\n';
    out_.flush();
    if (!out_)
        throw TransportError("failed to write response");
}

bool StdioServerWrapper::run_loop()
{
    std::string line;
    bool clean = true;

    while (!stop_requested_ && std::getline(in_, line))
    {
        if (is_blank(line))
            continue;
        if (line.back() == '\r')
            line.pop_back();

        Json request;
        try
        {
            request = util::json::parse(line);
        }
        catch (const Json::parse_error& e)
        {
            util::log::error(std::string("malformed message, closing connection: ") + e.what());
            try
            {
                write(mcp::jsonrpc_error(Json(), mcp::PARSE_ERROR, "Parse error"));
            }
            catch (const TransportError& we)
            {
                util::log::error(we.what());
            }
            clean = false;
            break;
        }

        Json response;
        try
        {
            response = session_.handle(request);
        }
        catch (const TransportError& e)
        {
            util::log::error(std::string("stdio session unusable: ") + e.what());
            clean = false;
            break;
        }
        catch (const std::exception& e)
        {
            Json id = request.is_object() ? request.value("id", Json()) : Json();
            response = mcp::jsonrpc_error(id, mcp::INTERNAL_ERROR, e.what());
        }

        if (response.is_null())
            continue;
        try
        {
            write(response);
        }
        catch (const TransportError& e)
        {
            util::log::error(std::string("stdio transport failed: ") + e.what());
            clean = false;
            break;
        }
    }

    if (in_.bad())
    {
        util::log::error("stdio input stream failed");
        clean = false;
    }

    session_.close();
    faulted_ = !clean;
    running_ = false;
    return clean;
}

bool StdioServerWrapper::run()
{
    // A closed session never reopens
    if (running_ || session_.state() == mcp::SessionState::Closed)
        return false;
    if (thread_.joinable())
        thread_.join();

    running_ = true;
    stop_requested_ = false;
    return run_loop();
}

bool StdioServerWrapper::start_async()
{
    if (running_ || session_.state() == mcp::SessionState::Closed)
        return false;
    // The previous loop may have ended on its own (EOF or fault)
    if (thread_.joinable())
        thread_.join();

    running_ = true;
    stop_requested_ = false;

    thread_ = std::thread([this]() { run_loop(); });

    return true;
}

void StdioServerWrapper::stop()
{
    stop_requested_ = true;

    // If running in background thread, join it
    if (thread_.joinable())
        thread_.join();
}

} // namespace spotifymcp::server
