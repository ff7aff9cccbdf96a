#pragma once
#include "apischema/types.hpp"
#include "apischema/validation/error.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>

namespace apischema::validation
{

class Validator;

/// (validator, keyword value, instance, enclosing schema, yield) -> false once the
/// consumer has asked to stop. A handler that yields nothing accepts the instance.
using KeywordHandler = std::function<bool(const Validator&, const Json&, const Json&,
                                          const Json&, const ErrorCallback&)>;

using KeywordRegistry = std::map<std::string, KeywordHandler>;

/// Copy of `base` with `overrides` installed on top.
std::shared_ptr<const KeywordRegistry> extend(const KeywordRegistry& base,
                                              const KeywordRegistry& overrides);

/// Baseline JSON Schema Draft 4.
std::shared_ptr<const KeywordRegistry> draft4_keywords();
/// Draft 4 + type, enum, required, readOnly, oneOf, allOf (OpenAPI request payloads).
std::shared_ptr<const KeywordRegistry> request_keywords();
/// Draft 4 + type, enum, required, writeOnly, x-writeOnly, properties, oneOf
/// (OpenAPI response payloads).
std::shared_ptr<const KeywordRegistry> response_keywords();

namespace draft4
{
bool ref(const Validator& v, const Json& ref, const Json& instance, const Json& schema,
         const ErrorCallback& yield);
bool type(const Validator& v, const Json& types, const Json& instance, const Json& schema,
          const ErrorCallback& yield);
bool enum_(const Validator& v, const Json& enums, const Json& instance, const Json& schema,
           const ErrorCallback& yield);
bool required(const Validator& v, const Json& required, const Json& instance, const Json& schema,
              const ErrorCallback& yield);
bool properties(const Validator& v, const Json& properties, const Json& instance,
                const Json& schema, const ErrorCallback& yield);
bool pattern_properties(const Validator& v, const Json& patterns, const Json& instance,
                        const Json& schema, const ErrorCallback& yield);
bool additional_properties(const Validator& v, const Json& additional, const Json& instance,
                           const Json& schema, const ErrorCallback& yield);
bool items(const Validator& v, const Json& items, const Json& instance, const Json& schema,
           const ErrorCallback& yield);
bool additional_items(const Validator& v, const Json& additional, const Json& instance,
                      const Json& schema, const ErrorCallback& yield);
bool min_items(const Validator& v, const Json& limit, const Json& instance, const Json& schema,
               const ErrorCallback& yield);
bool max_items(const Validator& v, const Json& limit, const Json& instance, const Json& schema,
               const ErrorCallback& yield);
bool unique_items(const Validator& v, const Json& unique, const Json& instance,
                  const Json& schema, const ErrorCallback& yield);
bool min_length(const Validator& v, const Json& limit, const Json& instance, const Json& schema,
                const ErrorCallback& yield);
bool max_length(const Validator& v, const Json& limit, const Json& instance, const Json& schema,
                const ErrorCallback& yield);
bool pattern(const Validator& v, const Json& pattern, const Json& instance, const Json& schema,
             const ErrorCallback& yield);
bool format(const Validator& v, const Json& format, const Json& instance, const Json& schema,
            const ErrorCallback& yield);
bool minimum(const Validator& v, const Json& minimum, const Json& instance, const Json& schema,
             const ErrorCallback& yield);
bool maximum(const Validator& v, const Json& maximum, const Json& instance, const Json& schema,
             const ErrorCallback& yield);
bool multiple_of(const Validator& v, const Json& divisor, const Json& instance,
                 const Json& schema, const ErrorCallback& yield);
bool min_properties(const Validator& v, const Json& limit, const Json& instance,
                    const Json& schema, const ErrorCallback& yield);
bool max_properties(const Validator& v, const Json& limit, const Json& instance,
                    const Json& schema, const ErrorCallback& yield);
bool dependencies(const Validator& v, const Json& dependencies, const Json& instance,
                  const Json& schema, const ErrorCallback& yield);
bool all_of(const Validator& v, const Json& subschemas, const Json& instance, const Json& schema,
            const ErrorCallback& yield);
bool any_of(const Validator& v, const Json& subschemas, const Json& instance, const Json& schema,
            const ErrorCallback& yield);
bool one_of(const Validator& v, const Json& subschemas, const Json& instance, const Json& schema,
            const ErrorCallback& yield);
bool not_(const Validator& v, const Json& not_schema, const Json& instance, const Json& schema,
          const ErrorCallback& yield);
} // namespace draft4

namespace openapi
{
/// `nullable: true` or `x-nullable: true`.
bool is_nullable(const Json& schema);

bool type(const Validator& v, const Json& types, const Json& instance, const Json& schema,
          const ErrorCallback& yield);
bool enum_(const Validator& v, const Json& enums, const Json& instance, const Json& schema,
           const ErrorCallback& yield);
bool required(const Validator& v, const Json& required, const Json& instance, const Json& schema,
              const ErrorCallback& yield);
bool read_only(const Validator& v, const Json& read_only, const Json& instance,
               const Json& schema, const ErrorCallback& yield);
bool write_only(const Validator& v, const Json& write_only, const Json& instance,
                const Json& schema, const ErrorCallback& yield);
bool one_of(const Validator& v, const Json& subschemas, const Json& instance, const Json& schema,
            const ErrorCallback& yield);
bool all_of(const Validator& v, const Json& subschemas, const Json& instance, const Json& schema,
            const ErrorCallback& yield);
bool properties(const Validator& v, const Json& properties, const Json& instance,
                const Json& schema, const ErrorCallback& yield);
} // namespace openapi

} // namespace apischema::validation
