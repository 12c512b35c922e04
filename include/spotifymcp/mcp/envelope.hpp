#pragma once
#include "spotifymcp/types.hpp"

#include <optional>
#include <string>

namespace spotifymcp::mcp
{

/// Transport-neutral unit of work: a tool name plus raw caller arguments.
struct CallRequest
{
    std::string name;
    Json arguments = Json::object();
};

/// Uniform outcome of a dispatch, shared by every transport.
///
/// Serialized as {"success": bool, "result": value|null, "error": string|null}.
/// On success error is null; on failure result is null and error is non-empty.
class ResultEnvelope
{
  public:
    static ResultEnvelope ok(Json result)
    {
        ResultEnvelope e;
        e.success_ = true;
        e.result_ = std::move(result);
        return e;
    }

    static ResultEnvelope fail(std::string message)
    {
        ResultEnvelope e;
        e.success_ = false;
        e.error_ = message.empty() ? std::string("unknown error") : std::move(message);
        return e;
    }

    bool success() const
    {
        return success_;
    }
    const Json& result() const
    {
        return result_;
    }
    const std::optional<std::string>& error() const
    {
        return error_;
    }

    Json to_json() const
    {
        return Json{{"success", success_},
                    {"result", success_ ? result_ : Json()},
                    {"error", error_ ? Json(*error_) : Json()}};
    }

  private:
    ResultEnvelope() = default;

    bool success_{false};
    Json result_;
    std::optional<std::string> error_;
};

inline void to_json(Json& j, const ResultEnvelope& e)
{
    j = e.to_json();
}

} // namespace spotifymcp::mcp
