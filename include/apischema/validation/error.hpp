#pragma once
#include "apischema/exceptions.hpp"
#include "apischema/types.hpp"

#include <deque>
#include <functional>
#include <string>
#include <vector>

namespace apischema::validation
{

/// One validation failure. Produced by keyword handlers; a failing instance is
/// reported with these records, never with an exception.
struct ValidationError
{
    std::string message;
    /// Keyword that produced the error and its value in the schema.
    std::string validator;
    Json validator_value;
    Json instance;
    Json schema;
    /// Property names / array indices from the instance root.
    std::deque<Json> path;
    /// Keywords and indices from the schema root ("$ref" hops are not recorded).
    std::deque<Json> schema_path;
    /// Sub-errors of combinators (anyOf / oneOf).
    std::vector<ValidationError> context;

    ValidationError() = default;
    explicit ValidationError(std::string msg, std::vector<ValidationError> ctx = {})
        : message(std::move(msg)), context(std::move(ctx))
    {
    }

    /// RFC 6901 pointer to the failing value ("" for the root).
    std::string json_pointer() const;
    std::string schema_pointer() const;
};

void to_json(Json& j, const ValidationError& error);

/// Receives errors as they are produced. Returning false stops validation.
using ErrorCallback = std::function<bool(ValidationError)>;

} // namespace apischema::validation

namespace apischema
{

/// Thrown only by Validator::validate(), for callers that prefer exceptions.
class InstanceValidationError : public Error
{
  public:
    explicit InstanceValidationError(std::vector<validation::ValidationError> errors);

    const std::vector<validation::ValidationError>& errors() const noexcept
    {
        return errors_;
    }

  private:
    std::vector<validation::ValidationError> errors_;
};

} // namespace apischema
