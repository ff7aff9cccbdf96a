#include "apischema/validation/validator.hpp"

#include "apischema/exceptions.hpp"
#include "apischema/util/json.hpp"

namespace apischema::validation
{

Validator::Validator(Json schema, std::shared_ptr<const KeywordRegistry> keywords,
                     std::optional<FormatChecker> format_checker)
    : schema_(std::make_shared<Json>(std::move(schema))), keywords_(std::move(keywords))
{
    if (!keywords_)
        throw Error("Validator requires a keyword registry");
    if (format_checker)
        format_checker_ = std::make_shared<FormatChecker>(std::move(*format_checker));
}

Validator Validator::draft4(Json schema, std::optional<FormatChecker> format_checker)
{
    return Validator(std::move(schema), draft4_keywords(), std::move(format_checker));
}

Validator Validator::request(Json schema, std::optional<FormatChecker> format_checker)
{
    return Validator(std::move(schema), request_keywords(), std::move(format_checker));
}

Validator Validator::response(Json schema, std::optional<FormatChecker> format_checker)
{
    return Validator(std::move(schema), response_keywords(), std::move(format_checker));
}

bool Validator::has_keyword(const std::string& keyword) const
{
    return keywords_->count(keyword) > 0;
}

ErrorRange Validator::iter_errors(const Json& instance) const&
{
    return ErrorRange(*this, instance);
}

bool Validator::iter_errors(const Json& instance, const Json& schema,
                            const ErrorCallback& yield) const
{
    if (!schema.is_object())
        throw SchemaError(util::json::repr(schema) + " is not a valid schema");

    auto dispatch = [&](const std::string& keyword, const Json& value) -> bool
    {
        auto handler = keywords_->find(keyword);
        if (handler == keywords_->end() || !handler->second)
            return true;

        ErrorCallback annotate = [&](ValidationError error)
        {
            if (error.validator.empty())
            {
                error.validator = keyword;
                error.validator_value = value;
                error.instance = instance;
                error.schema = schema;
            }
            if (keyword != "$ref")
                error.schema_path.push_front(keyword);
            return yield(std::move(error));
        };
        return handler->second(*this, value, instance, schema, annotate);
    };

    // Draft 4: siblings of "$ref" are ignored.
    auto ref = schema.find("$ref");
    if (ref != schema.end())
        return dispatch("$ref", *ref);

    for (auto it = schema.begin(); it != schema.end(); ++it)
    {
        if (!dispatch(it.key(), it.value()))
            return false;
    }
    return true;
}

bool Validator::descend(const Json& instance, const Json& schema, const Json& path,
                        const Json& schema_path, const ErrorCallback& yield) const
{
    if (path.is_null() && schema_path.is_null())
        return iter_errors(instance, schema, yield);

    ErrorCallback relay = [&](ValidationError error)
    {
        if (!path.is_null())
            error.path.push_front(path);
        if (!schema_path.is_null())
            error.schema_path.push_front(schema_path);
        return yield(std::move(error));
    };
    return iter_errors(instance, schema, relay);
}

bool Validator::is_type(const Json& instance, const std::string& type) const
{
    if (type == "object")
        return instance.is_object();
    if (type == "array")
        return instance.is_array();
    if (type == "string")
        return instance.is_string();
    if (type == "number")
        return instance.is_number();
    if (type == "integer")
        return instance.is_number_integer();
    if (type == "boolean")
        return instance.is_boolean();
    if (type == "null")
        return instance.is_null();
    throw SchemaError("Unknown type " + util::json::repr(type));
}

bool Validator::is_valid(const Json& instance) const
{
    return is_valid(instance, *schema_);
}

bool Validator::is_valid(const Json& instance, const Json& schema) const
{
    bool failed = false;
    iter_errors(instance, schema,
                [&failed](ValidationError)
                {
                    failed = true;
                    return false;
                });
    return !failed;
}

void Validator::validate(const Json& instance) const
{
    auto errors = iter_errors(instance).collect();
    if (!errors.empty())
        throw InstanceValidationError(std::move(errors));
}

void ErrorRange::for_each(const ErrorCallback& yield) const
{
    validator_->iter_errors(*instance_, validator_->schema(), yield);
}

std::vector<ValidationError> ErrorRange::collect() const
{
    std::vector<ValidationError> errors;
    for_each(
        [&errors](ValidationError error)
        {
            errors.push_back(std::move(error));
            return true;
        });
    return errors;
}

std::optional<ValidationError> ErrorRange::first() const
{
    std::optional<ValidationError> found;
    for_each(
        [&found](ValidationError error)
        {
            found = std::move(error);
            return false;
        });
    return found;
}

bool ErrorRange::empty() const
{
    return !first().has_value();
}

Validator make_validator(Json schema, Direction direction,
                         std::optional<FormatChecker> format_checker)
{
    if (direction == Direction::Response)
        return Validator::response(std::move(schema), std::move(format_checker));
    return Validator::request(std::move(schema), std::move(format_checker));
}

} // namespace apischema::validation
