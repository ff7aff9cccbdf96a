#pragma once
#include "apischema/types.hpp"

#include <string>

namespace apischema::util::pointer {

// Turn a URI fragment ("/definitions/Pet", "definitions/Pet", "/a%20b") into a
// JSON pointer string: percent-decoded, with a leading '/' unless empty.
std::string from_fragment(const std::string& fragment);

// Look up a JSON pointer (~0 / ~1 escaped, array indices as decimal tokens).
// Returns nullptr when any token is missing or the pointer is malformed.
const apischema::Json* find(const apischema::Json& document, const std::string& json_pointer);

// Escape a single reference token for use in a pointer.
std::string escape(const std::string& token);

} // namespace apischema::util::pointer
