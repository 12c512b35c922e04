#include "spotifymcp/mcp/dispatcher.hpp"

#include "spotifymcp/util/json_schema.hpp"
#include "spotifymcp/util/log.hpp"

#include <chrono>

namespace spotifymcp::mcp
{

ResultEnvelope Dispatcher::dispatch(const CallRequest& request) const
{
    const tools::Tool* tool = registry_.find(request.name);
    if (!tool)
    {
        util::log::warning("unknown tool: " + request.name);
        return ResultEnvelope::fail("unknown tool: " + request.name);
    }

    Json arguments;
    try
    {
        arguments = util::schema::validate(tool->input_schema(), request.arguments);
    }
    catch (const ValidationError& e)
    {
        util::log::warning("invalid arguments for " + request.name + ": " + e.what());
        return ResultEnvelope::fail(e.what());
    }

    auto start = std::chrono::steady_clock::now();
    try
    {
        tools::HandlerOutcome outcome = tool->invoke(arguments);
        if (util::log::enabled(util::log::Level::Debug))
        {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            util::log::debug("CALL " + request.name + " (" + std::to_string(elapsed.count()) +
                             "ms) " + (outcome.ok() ? "ok" : "failed"));
        }
        if (outcome.ok())
            return ResultEnvelope::ok(outcome.payload());
        return ResultEnvelope::fail(outcome.reason());
    }
    catch (const std::exception& e)
    {
        util::log::error("tool " + request.name + " raised: " + e.what());
        return ResultEnvelope::fail("internal error in tool '" + request.name +
                                    "': " + e.what());
    }
    catch (...)
    {
        util::log::error("tool " + request.name + " raised a non-standard exception");
        return ResultEnvelope::fail("internal error in tool '" + request.name +
                                    "': unknown exception");
    }
}

Json Dispatcher::list_tools() const
{
    Json tools = Json::array();
    for (const auto& tool : registry_.list())
        tools.push_back(tool.to_json());
    return tools;
}

} // namespace spotifymcp::mcp
