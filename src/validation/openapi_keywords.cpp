#include "apischema/util/json.hpp"
#include "apischema/util/pointer.hpp"
#include "apischema/validation/keywords.hpp"
#include "apischema/validation/validator.hpp"

#include <algorithm>
#include <string>
#include <unordered_map>
#include <vector>

namespace apischema::validation
{

namespace
{

bool flag_set(const Json& schema, const char* key)
{
    if (!schema.is_object())
        return false;
    auto it = schema.find(key);
    return it != schema.end() && it->is_boolean() && it->get<bool>();
}

// Follows local "$ref" chains so a referencing allOf member merges the keywords of
// its target. External references are left for the "$ref" keyword to report.
const Json& dereference(const Validator& v, const Json& subschema)
{
    const Json* current = &subschema;
    std::vector<std::string> seen;
    while (current->is_object())
    {
        auto ref = current->find("$ref");
        if (ref == current->end() || !ref->is_string())
            break;
        auto target_ref = ref->get<std::string>();
        if (target_ref.empty() || target_ref[0] != '#')
            break;
        if (std::find(seen.begin(), seen.end(), target_ref) != seen.end())
            throw CircularReferenceError(target_ref, "Circular reference in allOf member");
        seen.push_back(target_ref);

        const Json* target =
            util::pointer::find(v.schema(), util::pointer::from_fragment(target_ref.substr(1)));
        if (!target)
            throw ResolutionError(target_ref, "Unresolvable JSON pointer");
        current = target;
    }
    return *current;
}

} // namespace

std::shared_ptr<const KeywordRegistry> request_keywords()
{
    static const std::shared_ptr<const KeywordRegistry> registry =
        extend(*draft4_keywords(), KeywordRegistry{
                                       {"type", openapi::type},
                                       {"enum", openapi::enum_},
                                       {"required", openapi::required},
                                       {"readOnly", openapi::read_only},
                                       {"oneOf", openapi::one_of},
                                       {"allOf", openapi::all_of},
                                   });
    return registry;
}

std::shared_ptr<const KeywordRegistry> response_keywords()
{
    static const std::shared_ptr<const KeywordRegistry> registry =
        extend(*draft4_keywords(), KeywordRegistry{
                                       {"type", openapi::type},
                                       {"enum", openapi::enum_},
                                       {"required", openapi::required},
                                       {"writeOnly", openapi::write_only},
                                       {"x-writeOnly", openapi::write_only},
                                       {"properties", openapi::properties},
                                       {"oneOf", openapi::one_of},
                                   });
    return registry;
}

namespace openapi
{

bool is_nullable(const Json& schema)
{
    return flag_set(schema, "x-nullable") || flag_set(schema, "nullable");
}

bool type(const Validator& v, const Json& types, const Json& instance, const Json& schema,
          const ErrorCallback& yield)
{
    if (instance.is_null() && is_nullable(schema))
        return true;
    return draft4::type(v, types, instance, schema, yield);
}

bool enum_(const Validator& v, const Json& enums, const Json& instance, const Json& schema,
           const ErrorCallback& yield)
{
    if (instance.is_null() && is_nullable(schema))
        return true;
    return draft4::enum_(v, enums, instance, schema, yield);
}

// A missing property is tolerated when the other direction of the flow owns it:
// readOnly values are filled in by the service, writeOnly values never come back.
// Each exemption applies only if this configuration registers that keyword.
bool required(const Validator& v, const Json& required, const Json& instance, const Json& schema,
              const ErrorCallback& yield)
{
    if (!v.is_type(instance, "object"))
        return true;
    if (!required.is_array())
        throw SchemaError("required must be an array");

    const Json* properties = nullptr;
    auto props_it = schema.find("properties");
    if (props_it != schema.end() && props_it->is_object())
        properties = &*props_it;

    for (const auto& property : required)
    {
        if (!property.is_string())
            throw SchemaError("required entries must be strings");
        const auto& name = property.get_ref<const std::string&>();
        if (instance.contains(name))
            continue;

        if (properties)
        {
            auto sub = properties->find(name);
            if (sub != properties->end())
            {
                if (v.has_keyword("readOnly") && flag_set(*sub, "readOnly"))
                    continue;
                if (v.has_keyword("writeOnly") && flag_set(*sub, "writeOnly"))
                    continue;
                if (v.has_keyword("x-writeOnly") && flag_set(*sub, "x-writeOnly"))
                    continue;
            }
        }
        if (!yield(ValidationError(util::json::repr(property) + " is a required property")))
            return false;
    }
    return true;
}

// Reached only when a value was supplied for a property marked read-only.
bool read_only(const Validator&, const Json& read_only, const Json&, const Json&,
               const ErrorCallback& yield)
{
    if (read_only.is_boolean() && read_only.get<bool>())
        return yield(ValidationError("Property is read-only"));
    return true;
}

bool write_only(const Validator&, const Json& write_only, const Json&, const Json&,
                const ErrorCallback& yield)
{
    if (write_only.is_boolean() && write_only.get<bool>())
        return yield(ValidationError("Property is write-only"));
    return true;
}

bool one_of(const Validator& v, const Json& subschemas, const Json& instance, const Json& schema,
            const ErrorCallback& yield)
{
    if (instance.is_null() && is_nullable(schema))
        return true;
    return draft4::one_of(v, subschemas, instance, schema, yield);
}

// Shallow merge, later subschemas overwriting earlier keywords, then a single
// descent. A member that is a local "$ref" contributes its target's keywords.
// Errors are attributed to the subschema that contributed the failing keyword.
bool all_of(const Validator& v, const Json& subschemas, const Json& instance, const Json&,
            const ErrorCallback& yield)
{
    Json merged = Json::object();
    std::unordered_map<std::string, size_t> contributor;
    for (size_t index = 0; index < subschemas.size(); ++index)
    {
        const auto& subschema = dereference(v, subschemas[index]);
        if (!subschema.is_object())
            throw SchemaError("allOf entries must be schemas");
        for (const auto& [keyword, value] : subschema.items())
        {
            merged[keyword] = value;
            contributor[keyword] = index;
        }
    }
    if (subschemas.empty())
        return true;

    const size_t last = subschemas.size() - 1;
    return v.iter_errors(instance, merged,
                         [&](ValidationError error)
                         {
                             size_t index = last;
                             if (!error.schema_path.empty() && error.schema_path.front().is_string())
                             {
                                 auto found = contributor.find(
                                     error.schema_path.front().get<std::string>());
                                 if (found != contributor.end())
                                     index = found->second;
                             }
                             error.schema_path.push_front(index);
                             return yield(std::move(error));
                         });
}

bool properties(const Validator& v, const Json& properties, const Json& instance,
                const Json& schema, const ErrorCallback& yield)
{
    if (instance.is_null() && is_nullable(schema))
        return true;
    return draft4::properties(v, properties, instance, schema, yield);
}

} // namespace openapi

} // namespace apischema::validation
