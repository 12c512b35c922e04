#pragma once
#include "spotifymcp/mcp/envelope.hpp"
#include "spotifymcp/tools/registry.hpp"

namespace spotifymcp::mcp
{

/// Routes a CallRequest to its registered handler.
///
/// Resolution, validation and handler faults all come back as a failure envelope;
/// dispatch() never throws. The handler is invoked at most once per call and nothing
/// is cached, so the dispatcher can be shared across threads and transports.
class Dispatcher
{
  public:
    /// The registry must outlive the dispatcher.
    explicit Dispatcher(const tools::ToolRegistry& registry) : registry_(registry) {}

    ResultEnvelope dispatch(const CallRequest& request) const;

    /// [{name, description, inputSchema}, ...] in registration order.
    Json list_tools() const;

    const tools::ToolRegistry& registry() const
    {
        return registry_;
    }

  private:
    const tools::ToolRegistry& registry_;
};

} // namespace spotifymcp::mcp
