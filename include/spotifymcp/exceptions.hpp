#pragma once
#include <optional>
#include <stdexcept>
#include <string>

namespace spotifymcp
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

// Raised while building the registry; fatal at startup.
struct RegistrationError : public Error
{
    using Error::Error;
};

struct DuplicateNameError : public RegistrationError
{
    using RegistrationError::RegistrationError;
};

struct InvalidSchemaError : public RegistrationError
{
    using RegistrationError::RegistrationError;
};

struct RegistryFrozenError : public RegistrationError
{
    using RegistrationError::RegistrationError;
};

enum class ValidationFailure
{
    MissingRequiredField,
    TypeMismatch,
    InvalidEnumValue,
    OutOfRange
};

class ValidationError : public Error
{
  public:
    ValidationError(ValidationFailure kind, std::string field, const std::string& message)
        : Error(message), kind_(kind), field_(std::move(field))
    {
    }

    ValidationFailure kind() const
    {
        return kind_;
    }
    const std::string& field() const
    {
        return field_;
    }

  private:
    ValidationFailure kind_;
    std::string field_;
};

struct TransportError : public Error
{
    using Error::Error;
};

/// Failure reported by the external Spotify service (HTTP error, unreachable host, bad body).
class UpstreamError : public Error
{
  public:
    explicit UpstreamError(const std::string& message, std::optional<int> status = std::nullopt)
        : Error(message), status_(status)
    {
    }

    const std::optional<int>& status() const
    {
        return status_;
    }

  private:
    std::optional<int> status_;
};

} // namespace spotifymcp
