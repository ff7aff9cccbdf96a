#pragma once
#include "apischema/types.hpp"
#include "apischema/validation/error.hpp"
#include "apischema/validation/format.hpp"
#include "apischema/validation/keywords.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace apischema::validation
{

class ErrorRange;

/// Keyword-dispatch validator bound to one root schema.
///
/// Immutable after construction; one instance may validate many payloads from
/// many threads at once.
class Validator
{
  public:
    Validator(Json schema, std::shared_ptr<const KeywordRegistry> keywords,
              std::optional<FormatChecker> format_checker = std::nullopt);

    static Validator draft4(Json schema, std::optional<FormatChecker> format_checker = std::nullopt);
    static Validator request(Json schema,
                             std::optional<FormatChecker> format_checker = std::nullopt);
    static Validator response(Json schema,
                              std::optional<FormatChecker> format_checker = std::nullopt);

    const Json& schema() const
    {
        return *schema_;
    }
    const FormatChecker* format_checker() const
    {
        return format_checker_.get();
    }
    bool has_keyword(const std::string& keyword) const;

    /// Lazy: nothing runs until the range is consumed. The range borrows both the
    /// validator and the instance, so neither may be a temporary.
    ErrorRange iter_errors(const Json& instance) const&;
    ErrorRange iter_errors(const Json& instance) const&& = delete;
    ErrorRange iter_errors(Json&& instance) const& = delete;

    /// Dispatch every registered keyword of `schema` against `instance`.
    /// Returns false if `yield` asked to stop.
    bool iter_errors(const Json& instance, const Json& schema, const ErrorCallback& yield) const;

    /// Validate a sub-instance against a subschema, prefixing the produced errors with
    /// `path` / `schema_path` (pass null Json to leave a path unchanged).
    bool descend(const Json& instance, const Json& schema, const Json& path,
                 const Json& schema_path, const ErrorCallback& yield) const;

    bool is_type(const Json& instance, const std::string& type) const;
    bool is_valid(const Json& instance) const;
    bool is_valid(const Json& instance, const Json& schema) const;

    /// Throws InstanceValidationError carrying every error.
    void validate(const Json& instance) const;

  private:
    std::shared_ptr<const Json> schema_;
    std::shared_ptr<const KeywordRegistry> keywords_;
    std::shared_ptr<const FormatChecker> format_checker_;
};

/// Finite, restartable view over the errors of one instance. Each traversal runs
/// validation again. Borrows the validator and instance; both must outlive it.
class ErrorRange
{
  public:
    ErrorRange(const Validator& validator, const Json& instance)
        : validator_(&validator), instance_(&instance)
    {
    }
    ErrorRange(const Validator& validator, Json&& instance) = delete;
    ErrorRange(Validator&& validator, const Json& instance) = delete;

    /// Stops early when `yield` returns false.
    void for_each(const ErrorCallback& yield) const;
    std::vector<ValidationError> collect() const;
    std::optional<ValidationError> first() const;
    bool empty() const;

  private:
    const Validator* validator_;
    const Json* instance_;
};

/// Request or response configuration, selected by payload direction.
Validator make_validator(Json schema, Direction direction,
                         std::optional<FormatChecker> format_checker = std::nullopt);

} // namespace apischema::validation
