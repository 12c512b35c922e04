#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace spotifymcp
{

using Json = nlohmann::json;

/// Primitive kind of a declared tool argument.
enum class FieldKind
{
    String,
    Integer,
    Boolean,
    StringArray
};

inline std::string to_string(FieldKind kind)
{
    switch (kind)
    {
    case FieldKind::String:
        return "string";
    case FieldKind::Integer:
        return "integer";
    case FieldKind::Boolean:
        return "boolean";
    case FieldKind::StringArray:
        return "array";
    }
    return "string";
}

} // namespace spotifymcp
