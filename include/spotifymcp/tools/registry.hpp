#pragma once
#include "spotifymcp/exceptions.hpp"
#include "spotifymcp/tools/tool.hpp"

#include <atomic>
#include <string>
#include <unordered_map>
#include <vector>

namespace spotifymcp::tools
{

/// Catalogue of tools, populated once at startup.
///
/// register_tool() is only valid before the first find/get/list; after that the
/// registry is frozen and may be read concurrently without locking.
class ToolRegistry
{
  public:
    ToolRegistry() = default;
    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    /// Throws DuplicateNameError, InvalidSchemaError or RegistryFrozenError.
    void register_tool(Tool tool);

    /// nullptr if no tool has that name.
    const Tool* find(const std::string& name) const;

    /// Throws NotFoundError.
    const Tool& get(const std::string& name) const;

    /// Tools in registration order.
    const std::vector<Tool>& list() const;

    std::vector<std::string> list_names() const;

    size_t size() const
    {
        return tools_.size();
    }
    bool frozen() const
    {
        return frozen_.load();
    }

  private:
    void freeze() const
    {
        frozen_.store(true);
    }

    std::vector<Tool> tools_;
    std::unordered_map<std::string, size_t> index_;
    mutable std::atomic<bool> frozen_{false};
};

} // namespace spotifymcp::tools
