#include "apischema/util/pointer.hpp"

#include "apischema/util/uri.hpp"

namespace apischema::util::pointer {

std::string from_fragment(const std::string& fragment) {
  std::string decoded = uri::percent_decode(fragment);
  if (!decoded.empty() && decoded[0] != '/') decoded.insert(decoded.begin(), '/');
  return decoded;
}

const apischema::Json* find(const apischema::Json& document, const std::string& json_pointer) {
  try {
    apischema::Json::json_pointer ptr(json_pointer);
    if (!document.contains(ptr)) return nullptr;
    return &document.at(ptr);
  } catch (const apischema::Json::exception&) {
    // parse_error for malformed pointers, out_of_range / type_error for bad array tokens
    return nullptr;
  }
}

std::string escape(const std::string& token) {
  std::string out;
  out.reserve(token.size());
  for (char c : token) {
    if (c == '~')
      out += "~0";
    else if (c == '/')
      out += "~1";
    else
      out.push_back(c);
  }
  return out;
}

} // namespace apischema::util::pointer
