#pragma once
#include "spotifymcp/tools/outcome.hpp"
#include "spotifymcp/tools/schema.hpp"
#include "spotifymcp/types.hpp"

#include <functional>
#include <string>

namespace spotifymcp::tools
{

class Tool
{
  public:
    /// Receives arguments already validated against input_schema().
    using Fn = std::function<HandlerOutcome(const Json&)>;

    Tool() = default;

    Tool(std::string name, std::string description, InputSchema input_schema, Fn fn)
        : name_(std::move(name)), description_(std::move(description)),
          input_schema_(std::move(input_schema)), fn_(std::move(fn))
    {
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::string& description() const
    {
        return description_;
    }
    const InputSchema& input_schema() const
    {
        return input_schema_;
    }
    HandlerOutcome invoke(const Json& validated_arguments) const
    {
        return fn_(validated_arguments);
    }
    bool has_handler() const
    {
        return static_cast<bool>(fn_);
    }

    /// Listing entry: name, description, inputSchema.
    Json to_json() const
    {
        return Json{{"name", name_},
                    {"description", description_},
                    {"inputSchema", input_schema_.to_json()}};
    }

  private:
    std::string name_;
    std::string description_;
    InputSchema input_schema_;
    Fn fn_;
};

} // namespace spotifymcp::tools
