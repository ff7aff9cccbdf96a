#include "apischema/exceptions.hpp"
#include "apischema/util/json.hpp"
#include "apischema/util/pointer.hpp"
#include "apischema/util/regex.hpp"
#include "apischema/validation/keywords.hpp"
#include "apischema/validation/validator.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <set>
#include <vector>

namespace apischema::validation
{

namespace
{

using util::json::repr;

std::string join_repr(const std::vector<Json>& values)
{
    std::string out;
    for (const auto& value : values)
    {
        if (!out.empty())
            out += ", ";
        out += repr(value);
    }
    return out;
}

std::vector<Json> ensure_list(const Json& value)
{
    if (value.is_array())
        return std::vector<Json>(value.begin(), value.end());
    return {value};
}

size_t as_size(const Json& limit, const char* keyword)
{
    if (!limit.is_number() || limit.get<double>() < 0)
        throw SchemaError(std::string(keyword) + " must be a non-negative number");
    return static_cast<size_t>(limit.get<double>());
}

// Length in code points, as "minLength" / "maxLength" count it.
size_t utf8_length(const std::string& s)
{
    return static_cast<size_t>(std::count_if(s.begin(), s.end(), [](char c)
                                             { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; }));
}

bool matches_pattern(const std::string& pattern, const std::string& value)
{
    try
    {
        return util::regex::search(pattern, value);
    }
    catch (const std::regex_error& e)
    {
        throw SchemaError("Invalid regex " + repr(pattern) + ": " + e.what());
    }
}

std::string extras_msg(const std::vector<Json>& extras)
{
    return join_repr(extras) + (extras.size() == 1 ? " was" : " were");
}

} // namespace

std::shared_ptr<const KeywordRegistry> extend(const KeywordRegistry& base,
                                              const KeywordRegistry& overrides)
{
    auto registry = std::make_shared<KeywordRegistry>(base);
    for (const auto& [keyword, handler] : overrides)
        (*registry)[keyword] = handler;
    return registry;
}

std::shared_ptr<const KeywordRegistry> draft4_keywords()
{
    static const std::shared_ptr<const KeywordRegistry> registry =
        std::make_shared<KeywordRegistry>(KeywordRegistry{
            {"$ref", draft4::ref},
            {"additionalItems", draft4::additional_items},
            {"additionalProperties", draft4::additional_properties},
            {"allOf", draft4::all_of},
            {"anyOf", draft4::any_of},
            {"dependencies", draft4::dependencies},
            {"enum", draft4::enum_},
            {"format", draft4::format},
            {"items", draft4::items},
            {"maxItems", draft4::max_items},
            {"maxLength", draft4::max_length},
            {"maxProperties", draft4::max_properties},
            {"maximum", draft4::maximum},
            {"minItems", draft4::min_items},
            {"minLength", draft4::min_length},
            {"minProperties", draft4::min_properties},
            {"minimum", draft4::minimum},
            {"multipleOf", draft4::multiple_of},
            {"not", draft4::not_},
            {"oneOf", draft4::one_of},
            {"pattern", draft4::pattern},
            {"patternProperties", draft4::pattern_properties},
            {"properties", draft4::properties},
            {"required", draft4::required},
            {"type", draft4::type},
            {"uniqueItems", draft4::unique_items},
        });
    return registry;
}

namespace draft4
{

// Only document-local references: run the resolver over schemas that point elsewhere.
bool ref(const Validator& v, const Json& ref, const Json& instance, const Json&,
         const ErrorCallback& yield)
{
    if (!ref.is_string())
        throw SchemaError("$ref must be a string");
    const auto target_ref = ref.get<std::string>();
    if (target_ref.empty() || target_ref[0] != '#')
        throw ResolutionError(target_ref, "Unresolved external reference in schema");

    const Json* target =
        util::pointer::find(v.schema(), util::pointer::from_fragment(target_ref.substr(1)));
    if (!target)
        throw ResolutionError(target_ref, "Unresolvable JSON pointer");
    return v.descend(instance, *target, Json(), Json(), yield);
}

bool type(const Validator& v, const Json& types, const Json& instance, const Json&,
          const ErrorCallback& yield)
{
    auto declared = ensure_list(types);
    for (const auto& t : declared)
    {
        if (!t.is_string())
            throw SchemaError("type entries must be strings, got " + repr(t));
        if (v.is_type(instance, t.get<std::string>()))
            return true;
    }
    return yield(ValidationError(repr(instance) + " is not of type " + join_repr(declared)));
}

bool enum_(const Validator&, const Json& enums, const Json& instance, const Json&,
           const ErrorCallback& yield)
{
    auto allowed = ensure_list(enums);
    if (std::find(allowed.begin(), allowed.end(), instance) != allowed.end())
        return true;
    return yield(ValidationError(repr(instance) + " is not one of " + repr(enums)));
}

bool required(const Validator& v, const Json& required, const Json& instance, const Json&,
              const ErrorCallback& yield)
{
    if (!v.is_type(instance, "object"))
        return true;
    if (!required.is_array())
        throw SchemaError("required must be an array");
    for (const auto& property : required)
    {
        if (!property.is_string())
            throw SchemaError("required entries must be strings");
        if (!instance.contains(property.get<std::string>()))
        {
            if (!yield(ValidationError(repr(property) + " is a required property")))
                return false;
        }
    }
    return true;
}

bool properties(const Validator& v, const Json& properties, const Json& instance, const Json&,
                const ErrorCallback& yield)
{
    if (!v.is_type(instance, "object"))
        return true;
    for (const auto& [property, subschema] : properties.items())
    {
        auto found = instance.find(property);
        if (found == instance.end())
            continue;
        if (!v.descend(*found, subschema, property, property, yield))
            return false;
    }
    return true;
}

bool pattern_properties(const Validator& v, const Json& patterns, const Json& instance,
                        const Json&, const ErrorCallback& yield)
{
    if (!v.is_type(instance, "object"))
        return true;
    for (const auto& [pattern, subschema] : patterns.items())
    {
        for (const auto& [key, value] : instance.items())
        {
            if (!matches_pattern(pattern, key))
                continue;
            if (!v.descend(value, subschema, key, pattern, yield))
                return false;
        }
    }
    return true;
}

bool additional_properties(const Validator& v, const Json& additional, const Json& instance,
                           const Json& schema, const ErrorCallback& yield)
{
    if (!v.is_type(instance, "object"))
        return true;

    const Json no_properties = Json::object();
    auto props_it = schema.find("properties");
    auto patterns_it = schema.find("patternProperties");
    const Json& props = props_it != schema.end() ? *props_it : no_properties;
    const Json& patterns = patterns_it != schema.end() ? *patterns_it : no_properties;

    std::vector<Json> extras;
    for (const auto& [key, value] : instance.items())
    {
        if (props.contains(key))
            continue;
        bool matched = false;
        for (const auto& [pattern, subschema] : patterns.items())
        {
            if (matches_pattern(pattern, key))
            {
                matched = true;
                break;
            }
        }
        if (!matched)
            extras.push_back(key);
    }

    if (additional.is_object())
    {
        for (const auto& extra : extras)
        {
            const auto& name = extra.get_ref<const std::string&>();
            if (!v.descend(instance.at(name), additional, extra, Json(), yield))
                return false;
        }
        return true;
    }

    if (additional.is_boolean() && !additional.get<bool>() && !extras.empty())
    {
        if (patterns_it != schema.end())
        {
            std::vector<Json> pattern_names;
            for (const auto& [pattern, subschema] : patterns.items())
                pattern_names.push_back(pattern);
            return yield(ValidationError(join_repr(extras) +
                                         (extras.size() == 1 ? " does" : " do") +
                                         " not match any of the regexes: " +
                                         join_repr(pattern_names)));
        }
        return yield(ValidationError("Additional properties are not allowed (" +
                                     extras_msg(extras) + " unexpected)"));
    }
    return true;
}

bool items(const Validator& v, const Json& items, const Json& instance, const Json&,
           const ErrorCallback& yield)
{
    if (!v.is_type(instance, "array"))
        return true;

    if (items.is_array())
    {
        size_t count = std::min(items.size(), instance.size());
        for (size_t index = 0; index < count; ++index)
        {
            if (!v.descend(instance[index], items[index], index, index, yield))
                return false;
        }
        return true;
    }

    for (size_t index = 0; index < instance.size(); ++index)
    {
        if (!v.descend(instance[index], items, index, Json(), yield))
            return false;
    }
    return true;
}

bool additional_items(const Validator& v, const Json& additional, const Json& instance,
                      const Json& schema, const ErrorCallback& yield)
{
    auto items_it = schema.find("items");
    if (!v.is_type(instance, "array") || items_it == schema.end() || items_it->is_object())
        return true;

    size_t len_items = items_it->is_array() ? items_it->size() : 0;
    if (additional.is_object())
    {
        for (size_t index = len_items; index < instance.size(); ++index)
        {
            if (!v.descend(instance[index], additional, index, Json(), yield))
                return false;
        }
        return true;
    }
    if (additional.is_boolean() && !additional.get<bool>() && instance.size() > len_items)
    {
        std::vector<Json> extras(instance.begin() + static_cast<long>(len_items), instance.end());
        return yield(ValidationError("Additional items are not allowed (" + extras_msg(extras) +
                                     " unexpected)"));
    }
    return true;
}

bool min_items(const Validator& v, const Json& limit, const Json& instance, const Json&,
               const ErrorCallback& yield)
{
    if (v.is_type(instance, "array") && instance.size() < as_size(limit, "minItems"))
        return yield(ValidationError(repr(instance) + " is too short"));
    return true;
}

bool max_items(const Validator& v, const Json& limit, const Json& instance, const Json&,
               const ErrorCallback& yield)
{
    if (v.is_type(instance, "array") && instance.size() > as_size(limit, "maxItems"))
        return yield(ValidationError(repr(instance) + " is too long"));
    return true;
}

bool unique_items(const Validator& v, const Json& unique, const Json& instance, const Json&,
                  const ErrorCallback& yield)
{
    if (!unique.is_boolean() || !unique.get<bool>() || !v.is_type(instance, "array"))
        return true;
    std::set<Json> seen;
    for (const auto& item : instance)
    {
        if (!seen.insert(item).second)
            return yield(ValidationError(repr(instance) + " has non-unique elements"));
    }
    return true;
}

bool min_length(const Validator& v, const Json& limit, const Json& instance, const Json&,
                const ErrorCallback& yield)
{
    if (v.is_type(instance, "string") &&
        utf8_length(instance.get_ref<const std::string&>()) < as_size(limit, "minLength"))
        return yield(ValidationError(repr(instance) + " is too short"));
    return true;
}

bool max_length(const Validator& v, const Json& limit, const Json& instance, const Json&,
                const ErrorCallback& yield)
{
    if (v.is_type(instance, "string") &&
        utf8_length(instance.get_ref<const std::string&>()) > as_size(limit, "maxLength"))
        return yield(ValidationError(repr(instance) + " is too long"));
    return true;
}

bool pattern(const Validator& v, const Json& pattern, const Json& instance, const Json&,
             const ErrorCallback& yield)
{
    if (!v.is_type(instance, "string"))
        return true;
    if (!pattern.is_string())
        throw SchemaError("pattern must be a string");
    if (!matches_pattern(pattern.get<std::string>(), instance.get<std::string>()))
        return yield(ValidationError(repr(instance) + " does not match " + repr(pattern)));
    return true;
}

bool format(const Validator& v, const Json& format, const Json& instance, const Json&,
            const ErrorCallback& yield)
{
    const FormatChecker* checker = v.format_checker();
    if (!checker || !format.is_string())
        return true;
    if (!checker->conforms(instance, format.get<std::string>()))
        return yield(ValidationError(repr(instance) + " is not a " + repr(format)));
    return true;
}

bool minimum(const Validator& v, const Json& minimum, const Json& instance, const Json& schema,
             const ErrorCallback& yield)
{
    if (!v.is_type(instance, "number"))
        return true;
    if (!minimum.is_number())
        throw SchemaError("minimum must be a number");

    bool exclusive = schema.value("exclusiveMinimum", false);
    double value = instance.get<double>();
    double limit = minimum.get<double>();
    bool failed = exclusive ? value <= limit : value < limit;
    if (failed)
    {
        std::string cmp = exclusive ? "less than or equal to" : "less than";
        return yield(
            ValidationError(repr(instance) + " is " + cmp + " the minimum of " + repr(minimum)));
    }
    return true;
}

bool maximum(const Validator& v, const Json& maximum, const Json& instance, const Json& schema,
             const ErrorCallback& yield)
{
    if (!v.is_type(instance, "number"))
        return true;
    if (!maximum.is_number())
        throw SchemaError("maximum must be a number");

    bool exclusive = schema.value("exclusiveMaximum", false);
    double value = instance.get<double>();
    double limit = maximum.get<double>();
    bool failed = exclusive ? value >= limit : value > limit;
    if (failed)
    {
        std::string cmp = exclusive ? "greater than or equal to" : "greater than";
        return yield(
            ValidationError(repr(instance) + " is " + cmp + " the maximum of " + repr(maximum)));
    }
    return true;
}

bool multiple_of(const Validator& v, const Json& divisor, const Json& instance, const Json&,
                 const ErrorCallback& yield)
{
    if (!v.is_type(instance, "number"))
        return true;
    if (!divisor.is_number() || divisor.get<double>() <= 0)
        throw SchemaError("multipleOf must be a number greater than 0");

    bool failed;
    if (divisor.is_number_integer() && instance.is_number_integer())
    {
        // Compare magnitudes in unsigned arithmetic; the divisor is positive here.
        unsigned long long magnitude;
        if (instance.is_number_unsigned())
        {
            magnitude = instance.get<unsigned long long>();
        }
        else
        {
            long long value = instance.get<long long>();
            magnitude = value < 0 ? 0ULL - static_cast<unsigned long long>(value)
                                  : static_cast<unsigned long long>(value);
        }
        failed = magnitude % divisor.get<unsigned long long>() != 0;
    }
    else
    {
        double quotient = instance.get<double>() / divisor.get<double>();
        failed = std::trunc(quotient) != quotient;
    }
    if (failed)
        return yield(ValidationError(repr(instance) + " is not a multiple of " + repr(divisor)));
    return true;
}

bool min_properties(const Validator& v, const Json& limit, const Json& instance, const Json&,
                    const ErrorCallback& yield)
{
    if (v.is_type(instance, "object") && instance.size() < as_size(limit, "minProperties"))
        return yield(ValidationError(repr(instance) + " does not have enough properties"));
    return true;
}

bool max_properties(const Validator& v, const Json& limit, const Json& instance, const Json&,
                    const ErrorCallback& yield)
{
    if (v.is_type(instance, "object") && instance.size() > as_size(limit, "maxProperties"))
        return yield(ValidationError(repr(instance) + " has too many properties"));
    return true;
}

bool dependencies(const Validator& v, const Json& dependencies, const Json& instance,
                  const Json&, const ErrorCallback& yield)
{
    if (!v.is_type(instance, "object"))
        return true;
    for (const auto& [property, dependency] : dependencies.items())
    {
        if (!instance.contains(property))
            continue;
        if (dependency.is_array())
        {
            for (const auto& each : dependency)
            {
                if (instance.contains(each.get<std::string>()))
                    continue;
                if (!yield(ValidationError(repr(each) + " is a dependency of " + repr(property))))
                    return false;
            }
        }
        else if (!v.descend(instance, dependency, Json(), property, yield))
        {
            return false;
        }
    }
    return true;
}

bool all_of(const Validator& v, const Json& subschemas, const Json& instance, const Json&,
            const ErrorCallback& yield)
{
    for (size_t index = 0; index < subschemas.size(); ++index)
    {
        if (!v.descend(instance, subschemas[index], Json(), index, yield))
            return false;
    }
    return true;
}

bool any_of(const Validator& v, const Json& subschemas, const Json& instance, const Json&,
            const ErrorCallback& yield)
{
    std::vector<ValidationError> all_errors;
    for (size_t index = 0; index < subschemas.size(); ++index)
    {
        std::vector<ValidationError> errors;
        v.descend(instance, subschemas[index], Json(), index,
                  [&errors](ValidationError error)
                  {
                      errors.push_back(std::move(error));
                      return true;
                  });
        if (errors.empty())
            return true;
        std::move(errors.begin(), errors.end(), std::back_inserter(all_errors));
    }
    return yield(ValidationError(repr(instance) + " is not valid under any of the given schemas",
                                 std::move(all_errors)));
}

// Exactly one subschema must match: one pass records every passing index, then
// 0 / 1 / many decides.
bool one_of(const Validator& v, const Json& subschemas, const Json& instance, const Json&,
            const ErrorCallback& yield)
{
    std::vector<ValidationError> all_errors;
    std::vector<size_t> matches;
    for (size_t index = 0; index < subschemas.size(); ++index)
    {
        std::vector<ValidationError> errors;
        v.descend(instance, subschemas[index], Json(), index,
                  [&errors](ValidationError error)
                  {
                      errors.push_back(std::move(error));
                      return true;
                  });
        if (errors.empty())
            matches.push_back(index);
        else
            std::move(errors.begin(), errors.end(), std::back_inserter(all_errors));
    }

    if (matches.empty())
        return yield(ValidationError(repr(instance) +
                                         " is not valid under any of the given schemas",
                                     std::move(all_errors)));
    if (matches.size() > 1)
    {
        std::vector<Json> matched;
        for (auto index : matches)
            matched.push_back(subschemas[index]);
        return yield(
            ValidationError(repr(instance) + " is valid under each of " + join_repr(matched)));
    }
    return true;
}

bool not_(const Validator& v, const Json& not_schema, const Json& instance, const Json&,
          const ErrorCallback& yield)
{
    if (v.is_valid(instance, not_schema))
        return yield(
            ValidationError(repr(not_schema) + " is not allowed for " + repr(instance)));
    return true;
}

} // namespace draft4

} // namespace apischema::validation
