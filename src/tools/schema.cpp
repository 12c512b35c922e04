#include "spotifymcp/tools/schema.hpp"

#include "spotifymcp/exceptions.hpp"
#include "spotifymcp/util/json_schema.hpp"

#include <algorithm>
#include <unordered_set>

namespace spotifymcp::tools
{

namespace
{

FieldSpec make_field(std::string name, FieldKind kind, std::string description)
{
    FieldSpec f;
    f.name = std::move(name);
    f.kind = kind;
    f.description = std::move(description);
    return f;
}

[[noreturn]] void reject(const FieldSpec& field, const std::string& why)
{
    throw InvalidSchemaError("invalid schema for field '" + field.name + "': " + why);
}

void check_field(const FieldSpec& field)
{
    if (field.is_required && field.default_value)
        reject(field, "required field must not declare a default");

    if (field.minimum && field.maximum && *field.minimum > *field.maximum)
        reject(field, "minimum is greater than maximum");

    if (field.kind == FieldKind::Boolean && (field.minimum || field.maximum))
        reject(field, "bounds are not allowed on boolean fields");

    if ((field.kind == FieldKind::String || field.kind == FieldKind::StringArray) &&
        ((field.minimum && *field.minimum < 0) || (field.maximum && *field.maximum < 0)))
        reject(field, "length bounds must not be negative");

    if (field.enum_values)
    {
        if (field.kind == FieldKind::Boolean || field.kind == FieldKind::StringArray)
            reject(field, "enum is only allowed on string and integer fields");
        if (field.enum_values->empty())
            reject(field, "enum set is empty");
        for (const auto& v : *field.enum_values)
            if (!util::schema::coerce(field.kind, v))
                reject(field, "enum value " + v.dump() + " is not of kind " +
                                  util::schema::describe(field.kind));
    }

    if (field.default_value)
    {
        auto def = util::schema::coerce(field.kind, *field.default_value);
        if (!def)
            reject(field, "default " + field.default_value->dump() + " is not of kind " +
                              util::schema::describe(field.kind));
        if (field.enum_values &&
            std::find(field.enum_values->begin(), field.enum_values->end(), *def) ==
                field.enum_values->end())
            reject(field, "default is not one of the enum values");
        if (auto m = util::schema::measure(field, *def))
        {
            if ((field.minimum && *m < *field.minimum) || (field.maximum && *m > *field.maximum))
                reject(field, "default is outside " + util::schema::describe_bounds(field));
        }
    }
}

} // namespace

FieldSpec FieldSpec::string(std::string name, std::string description)
{
    return make_field(std::move(name), FieldKind::String, std::move(description));
}

FieldSpec FieldSpec::integer(std::string name, std::string description)
{
    return make_field(std::move(name), FieldKind::Integer, std::move(description));
}

FieldSpec FieldSpec::boolean(std::string name, std::string description)
{
    return make_field(std::move(name), FieldKind::Boolean, std::move(description));
}

FieldSpec FieldSpec::string_array(std::string name, std::string description)
{
    return make_field(std::move(name), FieldKind::StringArray, std::move(description));
}

Json FieldSpec::to_json() const
{
    Json j = {{"type", spotifymcp::to_string(kind)}};
    if (kind == FieldKind::StringArray)
        j["items"] = Json{{"type", "string"}};
    if (!description.empty())
        j["description"] = description;
    if (enum_values)
        j["enum"] = *enum_values;
    if (default_value)
        j["default"] = *default_value;

    const char* min_key = "minimum";
    const char* max_key = "maximum";
    if (kind == FieldKind::String)
    {
        min_key = "minLength";
        max_key = "maxLength";
    }
    else if (kind == FieldKind::StringArray)
    {
        min_key = "minItems";
        max_key = "maxItems";
    }
    if (minimum)
        j[min_key] = *minimum;
    if (maximum)
        j[max_key] = *maximum;
    return j;
}

void InputSchema::check_consistency() const
{
    std::unordered_set<std::string> seen;
    for (const auto& field : fields_)
    {
        if (field.name.empty())
            throw InvalidSchemaError("invalid schema: field name must not be empty");
        if (!seen.insert(field.name).second)
            reject(field, "declared more than once");
        check_field(field);
    }
}

Json InputSchema::to_json() const
{
    Json properties = Json::object();
    Json required = Json::array();
    for (const auto& field : fields_)
    {
        properties[field.name] = field.to_json();
        if (field.is_required)
            required.push_back(field.name);
    }

    Json schema = {{"type", "object"}, {"properties", properties}};
    if (!required.empty())
        schema["required"] = required;
    return schema;
}

} // namespace spotifymcp::tools
