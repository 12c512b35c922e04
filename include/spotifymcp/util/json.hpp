#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace spotifymcp::util::json
{

using json = nlohmann::json;

inline json parse(const std::string& s)
{
    return json::parse(s);
}

/// Parse without throwing; returns a discarded value on malformed input.
inline json try_parse(const std::string& s)
{
    return json::parse(s, nullptr, false);
}

} // namespace spotifymcp::util::json
