#pragma once
#include "spotifymcp/types.hpp"

#include <optional>
#include <string>

namespace spotifymcp::tools
{

/// What a handler produced: a structured payload, or a failure reason.
class HandlerOutcome
{
  public:
    static HandlerOutcome success(Json payload)
    {
        HandlerOutcome o;
        o.payload_ = std::move(payload);
        return o;
    }

    static HandlerOutcome failure(std::string reason)
    {
        HandlerOutcome o;
        o.reason_ = std::move(reason);
        return o;
    }

    bool ok() const
    {
        return !reason_.has_value();
    }
    const Json& payload() const
    {
        return payload_;
    }
    const std::string& reason() const
    {
        return *reason_;
    }

  private:
    HandlerOutcome() = default;

    Json payload_;
    std::optional<std::string> reason_;
};

} // namespace spotifymcp::tools
