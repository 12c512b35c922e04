#pragma once
#include "spotifymcp/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace spotifymcp::tools
{

/// Declaration of a single tool argument.
///
/// For Integer fields minimum/maximum bound the value; for String and StringArray
/// fields they bound the length (characters or items).
struct FieldSpec
{
    std::string name;
    FieldKind kind{FieldKind::String};
    std::string description;
    std::optional<std::vector<Json>> enum_values;
    std::optional<long long> minimum;
    std::optional<long long> maximum;
    std::optional<Json> default_value;
    bool is_required{false};

    static FieldSpec string(std::string name, std::string description = "");
    static FieldSpec integer(std::string name, std::string description = "");
    static FieldSpec boolean(std::string name, std::string description = "");
    static FieldSpec string_array(std::string name, std::string description = "");

    FieldSpec& required()
    {
        is_required = true;
        return *this;
    }
    FieldSpec& one_of(std::vector<Json> values)
    {
        enum_values = std::move(values);
        return *this;
    }
    FieldSpec& between(long long lo, long long hi)
    {
        minimum = lo;
        maximum = hi;
        return *this;
    }
    FieldSpec& at_least(long long lo)
    {
        minimum = lo;
        return *this;
    }
    FieldSpec& at_most(long long hi)
    {
        maximum = hi;
        return *this;
    }
    FieldSpec& with_default(Json value)
    {
        default_value = std::move(value);
        return *this;
    }

    Json to_json() const;
};

/// Ordered set of argument declarations for one tool.
class InputSchema
{
  public:
    InputSchema() = default;
    InputSchema(std::initializer_list<FieldSpec> fields) : fields_(fields) {}

    InputSchema& add(const FieldSpec& field)
    {
        fields_.push_back(field);
        return *this;
    }

    const std::vector<FieldSpec>& fields() const
    {
        return fields_;
    }

    /// Throws InvalidSchemaError if the declaration contradicts itself.
    void check_consistency() const;

    /// JSON Schema rendering used in tool listings.
    Json to_json() const;

  private:
    std::vector<FieldSpec> fields_;
};

} // namespace spotifymcp::tools
