#include "apischema/util/regex.hpp"

#include <unordered_map>

namespace apischema::util::regex {
namespace {

std::unordered_map<std::string, std::regex>& regex_cache() {
  thread_local std::unordered_map<std::string, std::regex> cache;
  return cache;
}

} // namespace

const std::regex& cached(const std::string& pattern) {
  auto& cache = regex_cache();
  auto it = cache.find(pattern);
  if (it != cache.end()) return it->second;
  auto [ins_it, _] = cache.emplace(pattern, std::regex(pattern, std::regex::ECMAScript));
  return ins_it->second;
}

bool search(const std::string& pattern, const std::string& value) {
  return std::regex_search(value, cached(pattern));
}

} // namespace apischema::util::regex
