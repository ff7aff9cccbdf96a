#include "apischema/validation/error.hpp"

#include "apischema/util/pointer.hpp"

namespace apischema::validation
{

namespace
{

std::string to_pointer(const std::deque<Json>& tokens)
{
    std::string out;
    for (const auto& token : tokens)
    {
        out.push_back('/');
        if (token.is_string())
            out += util::pointer::escape(token.get<std::string>());
        else
            out += token.dump();
    }
    return out;
}

std::string summarize(const std::vector<validation::ValidationError>& errors)
{
    if (errors.empty())
        return "Instance is valid";
    std::string message = errors.front().message;
    const auto where = errors.front().json_pointer();
    if (!where.empty())
        message = where + ": " + message;
    if (errors.size() > 1)
        message += " (and " + std::to_string(errors.size() - 1) + " more)";
    return message;
}

} // namespace

std::string ValidationError::json_pointer() const
{
    return to_pointer(path);
}

std::string ValidationError::schema_pointer() const
{
    return to_pointer(schema_path);
}

void to_json(Json& j, const ValidationError& error)
{
    j = Json{{"message", error.message},
             {"path", Json(error.path)},
             {"schema_path", Json(error.schema_path)}};
    if (!error.validator.empty())
        j["validator"] = error.validator;
    if (!error.context.empty())
    {
        Json context = Json::array();
        for (const auto& child : error.context)
            context.push_back(child);
        j["context"] = context;
    }
}

} // namespace apischema::validation

namespace apischema
{

InstanceValidationError::InstanceValidationError(std::vector<validation::ValidationError> errors)
    : Error(validation::summarize(errors)), errors_(std::move(errors))
{
}

} // namespace apischema
