#include "apischema/util/uri.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <regex>
#include <vector>

namespace apischema::util::uri {
namespace {

std::string remove_dot_segments(const std::string& path) {
  std::string input = path;
  std::string output;
  while (!input.empty()) {
    if (input.rfind("../", 0) == 0) {
      input.erase(0, 3);
    } else if (input.rfind("./", 0) == 0) {
      input.erase(0, 2);
    } else if (input.rfind("/./", 0) == 0) {
      input.replace(0, 3, "/");
    } else if (input == "/.") {
      input = "/";
    } else if (input.rfind("/../", 0) == 0 || input == "/..") {
      input = input.size() == 3 ? "/" : input.substr(3);
      auto last = output.rfind('/');
      output.erase(last == std::string::npos ? 0 : last);
    } else if (input == "." || input == "..") {
      input.clear();
    } else {
      size_t start = input[0] == '/' ? 1 : 0;
      size_t next = input.find('/', start);
      output += input.substr(0, next);
      input = next == std::string::npos ? std::string() : input.substr(next);
    }
  }
  return output;
}

std::string merge_paths(const Uri& base, const std::string& ref_path) {
  if (base.has_authority && base.path.empty()) return "/" + ref_path;
  auto last = base.path.rfind('/');
  if (last == std::string::npos) return ref_path;
  return base.path.substr(0, last + 1) + ref_path;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

std::string Uri::to_string() const {
  std::string out;
  if (!scheme.empty()) out += scheme + ":";
  if (has_authority) out += "//" + authority;
  out += path;
  if (has_query) out += "?" + query;
  if (has_fragment) out += "#" + fragment;
  return out;
}

Uri parse(const std::string& text) {
  // Appendix B of RFC 3986
  static const std::regex re(R"(^(([^:/?#]+):)?(//([^/?#]*))?([^?#]*)(\?([^#]*))?(#(.*))?$)");
  Uri out;
  std::smatch m;
  if (!std::regex_match(text, m, re)) {
    out.path = text;
    return out;
  }
  out.scheme = m[2].str();
  out.has_authority = m[3].matched;
  out.authority = m[4].str();
  out.path = m[5].str();
  out.has_query = m[6].matched;
  out.query = m[7].str();
  out.has_fragment = m[8].matched;
  out.fragment = m[9].str();
  return out;
}

std::string join(const std::string& base, const std::string& ref) {
  if (base.empty()) return normalize_scheme(ref);
  Uri b = parse(base);
  Uri r = parse(ref);
  Uri t;
  if (!r.scheme.empty()) {
    t = r;
    t.path = remove_dot_segments(r.path);
  } else {
    if (r.has_authority) {
      t.has_authority = true;
      t.authority = r.authority;
      t.path = remove_dot_segments(r.path);
      t.has_query = r.has_query;
      t.query = r.query;
    } else {
      if (r.path.empty()) {
        t.path = b.path;
        t.has_query = r.has_query || b.has_query;
        t.query = r.has_query ? r.query : b.query;
      } else {
        t.path = remove_dot_segments(r.path[0] == '/' ? r.path : merge_paths(b, r.path));
        t.has_query = r.has_query;
        t.query = r.query;
      }
      t.has_authority = b.has_authority;
      t.authority = b.authority;
    }
    t.scheme = b.scheme;
  }
  std::transform(t.scheme.begin(), t.scheme.end(), t.scheme.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  t.has_fragment = r.has_fragment;
  t.fragment = r.fragment;
  return t.to_string();
}

std::pair<std::string, std::string> split_fragment(const std::string& text) {
  auto pos = text.find('#');
  if (pos == std::string::npos) return {text, std::string()};
  return {text.substr(0, pos), text.substr(pos + 1)};
}

std::string scheme_of(const std::string& text) {
  static const std::regex scheme_re(R"(^([A-Za-z][A-Za-z0-9+.\-]*):)");
  std::smatch m;
  if (!std::regex_search(text, m, scheme_re)) return "";
  std::string scheme = m[1].str();
  std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return scheme;
}

std::string normalize_scheme(const std::string& text) {
  std::string scheme = scheme_of(text);
  if (scheme.empty()) return text;
  return scheme + text.substr(scheme.size());
}

std::string percent_decode(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size()) {
      int hi = hex_value(text[i + 1]);
      int lo = hex_value(text[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(text[i]);
  }
  return out;
}

std::string file_path(const std::string& file_uri) {
  Uri u = parse(file_uri);
  std::string path = percent_decode(u.path);
#ifdef _WIN32
  // file:///C:/dir -> C:/dir
  if (path.size() > 2 && path[0] == '/' && path[2] == ':') path.erase(0, 1);
#endif
  if (u.has_authority && !u.authority.empty() && u.authority != "localhost")
    return "//" + u.authority + path;
  return path;
}

std::string from_file_path(const std::string& path) {
  std::string absolute = std::filesystem::absolute(std::filesystem::path(path)).generic_string();
  if (absolute.empty() || absolute[0] != '/') absolute.insert(absolute.begin(), '/');
  return "file://" + absolute;
}

} // namespace apischema::util::uri
