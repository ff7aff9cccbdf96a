#pragma once
#include <regex>
#include <string>

namespace apischema::util::regex {

// Compiled ECMAScript regex, cached per thread. Throws std::regex_error for
// invalid patterns.
const std::regex& cached(const std::string& pattern);

// Unanchored search, as JSON Schema "pattern" requires.
bool search(const std::string& pattern, const std::string& value);

} // namespace apischema::util::regex
