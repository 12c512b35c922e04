#include "spotifymcp/tools/registry.hpp"

namespace spotifymcp::tools
{

void ToolRegistry::register_tool(Tool tool)
{
    if (frozen())
        throw RegistryFrozenError("cannot register tool '" + tool.name() +
                                  "': registry is frozen");
    if (tool.name().empty())
        throw InvalidSchemaError("tool name must not be empty");
    if (index_.count(tool.name()))
        throw DuplicateNameError("duplicate tool name: " + tool.name());
    if (!tool.has_handler())
        throw RegistrationError("tool '" + tool.name() + "' has no handler");
    try
    {
        tool.input_schema().check_consistency();
    }
    catch (const InvalidSchemaError& e)
    {
        throw InvalidSchemaError("tool '" + tool.name() + "': " + e.what());
    }

    index_.emplace(tool.name(), tools_.size());
    tools_.push_back(std::move(tool));
}

const Tool* ToolRegistry::find(const std::string& name) const
{
    freeze();
    auto it = index_.find(name);
    if (it == index_.end())
        return nullptr;
    return &tools_[it->second];
}

const Tool& ToolRegistry::get(const std::string& name) const
{
    if (const Tool* t = find(name))
        return *t;
    throw NotFoundError("tool not found: " + name);
}

const std::vector<Tool>& ToolRegistry::list() const
{
    freeze();
    return tools_;
}

std::vector<std::string> ToolRegistry::list_names() const
{
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& t : list())
        names.push_back(t.name());
    return names;
}

} // namespace spotifymcp::tools
