#include "spotifymcp/util/json_schema.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace spotifymcp::util::schema
{

namespace
{

// Length in code points; continuation bytes of multi-byte UTF-8 sequences are skipped.
long long utf8_length(const std::string& s)
{
    long long n = 0;
    for (unsigned char c : s)
        if ((c & 0xC0) != 0x80)
            ++n;
    return n;
}

constexpr long long kMaxInteger = std::numeric_limits<long long>::max();

// Unsigned JSON integers that do not fit the signed range used for Integer fields.
bool exceeds_integer_range(const Json& value)
{
    return value.is_number_unsigned() &&
           value.get<unsigned long long>() > static_cast<unsigned long long>(kMaxInteger);
}

bool in_enum(const tools::FieldSpec& field, const Json& value)
{
    const auto& allowed = *field.enum_values;
    return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}

} // namespace

std::optional<Json> coerce(FieldKind kind, const Json& value)
{
    switch (kind)
    {
    case FieldKind::String:
        if (value.is_string())
            return value;
        return std::nullopt;
    case FieldKind::Integer:
        if (exceeds_integer_range(value))
            return std::nullopt;
        if (value.is_number_integer())
            return Json(value.get<long long>());
        if (value.is_number_float())
        {
            double d = value.get<double>();
            if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 9.0e15)
                return Json(static_cast<long long>(d));
        }
        return std::nullopt;
    case FieldKind::Boolean:
        if (value.is_boolean())
            return value;
        return std::nullopt;
    case FieldKind::StringArray:
        if (!value.is_array())
            return std::nullopt;
        for (const auto& item : value)
            if (!item.is_string())
                return std::nullopt;
        return value;
    }
    return std::nullopt;
}

std::string describe(FieldKind kind)
{
    if (kind == FieldKind::StringArray)
        return "array of string";
    return to_string(kind);
}

std::string describe_bounds(const tools::FieldSpec& field)
{
    if (field.minimum && field.maximum)
        return std::to_string(*field.minimum) + ".." + std::to_string(*field.maximum);
    if (field.minimum)
        return ">= " + std::to_string(*field.minimum);
    if (field.maximum)
        return "<= " + std::to_string(*field.maximum);
    return "any";
}

std::optional<long long> measure(const tools::FieldSpec& field, const Json& value)
{
    switch (field.kind)
    {
    case FieldKind::Integer:
        if (exceeds_integer_range(value))
            return kMaxInteger;
        if (value.is_number_integer())
            return value.get<long long>();
        return std::nullopt;
    case FieldKind::String:
        if (value.is_string())
            return utf8_length(value.get_ref<const std::string&>());
        return std::nullopt;
    case FieldKind::StringArray:
        if (value.is_array())
            return static_cast<long long>(value.size());
        return std::nullopt;
    case FieldKind::Boolean:
        return std::nullopt;
    }
    return std::nullopt;
}

Json validate(const tools::InputSchema& schema, const Json& arguments)
{
    if (!arguments.is_null() && !arguments.is_object())
        throw ValidationError(ValidationFailure::TypeMismatch, "",
                              "arguments must be an object");

    const Json empty = Json::object();
    const Json& args = arguments.is_null() ? empty : arguments;

    Json validated = Json::object();
    for (const auto& field : schema.fields())
    {
        auto it = args.find(field.name);
        if (it == args.end() || it->is_null())
        {
            if (field.default_value)
            {
                validated[field.name] = *field.default_value;
                continue;
            }
            if (field.is_required)
                throw ValidationError(ValidationFailure::MissingRequiredField, field.name,
                                      "missing required field: " + field.name);
            continue;
        }

        auto value = coerce(field.kind, *it);
        if (!value && field.kind == FieldKind::Integer && field.maximum &&
            exceeds_integer_range(*it))
            throw ValidationError(ValidationFailure::OutOfRange, field.name,
                                  "value out of range for field '" + field.name +
                                      "': expected " + describe_bounds(field));
        if (!value)
            throw ValidationError(ValidationFailure::TypeMismatch, field.name,
                                  "type mismatch for field '" + field.name +
                                      "': expected " + describe(field.kind));

        if (field.enum_values && !in_enum(field, *value))
            throw ValidationError(ValidationFailure::InvalidEnumValue, field.name,
                                  "invalid value for field '" + field.name +
                                      "': expected one of " +
                                      Json(*field.enum_values).dump());

        if (field.minimum || field.maximum)
        {
            auto m = measure(field, *value);
            if (m && ((field.minimum && *m < *field.minimum) ||
                      (field.maximum && *m > *field.maximum)))
            {
                std::string what = field.kind == FieldKind::Integer ? "value" : "length";
                throw ValidationError(ValidationFailure::OutOfRange, field.name,
                                      what + " out of range for field '" + field.name +
                                          "': expected " + describe_bounds(field));
            }
        }

        validated[field.name] = std::move(*value);
    }
    return validated;
}

} // namespace spotifymcp::util::schema
