#pragma once
#include <string>
#include <utility>

namespace apischema::util::uri {

// RFC 3986 components. The has_* flags distinguish "absent" from "empty".
struct Uri {
  std::string scheme;
  std::string authority;
  std::string path;
  std::string query;
  std::string fragment;
  bool has_authority = false;
  bool has_query = false;
  bool has_fragment = false;

  std::string to_string() const;
};

Uri parse(const std::string& text);

// Resolve `ref` against `base` (RFC 3986 section 5.2). The result's scheme is
// lower-cased; an empty base returns ref otherwise unchanged.
std::string join(const std::string& base, const std::string& ref);

// `text` with its scheme lower-cased (RFC 3986 section 6.2.2.1).
std::string normalize_scheme(const std::string& text);

// {uri without fragment, fragment without '#'}
std::pair<std::string, std::string> split_fragment(const std::string& text);

// Lower-cased scheme, or "" for relative references.
std::string scheme_of(const std::string& text);

std::string percent_decode(const std::string& text);

// file:///abs/path -> /abs/path (percent-decoded; "localhost" authority accepted)
std::string file_path(const std::string& file_uri);
std::string from_file_path(const std::string& path);

} // namespace apischema::util::uri
