#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace apischema::util::json {

using json = nlohmann::json;

inline json parse(const std::string& s) { return json::parse(s); }
inline std::string dump(const json& j) { return j.dump(); }
inline std::string dump_pretty(const json& j, int indent = 2) { return j.dump(indent); }

// Compact rendering used inside error messages: strings keep their quotes.
inline std::string repr(const json& j) { return j.dump(-1, ' ', false, json::error_handler_t::replace); }

// Read and parse a JSON document from disk. Throws std::runtime_error when the
// file cannot be opened and json::parse_error when it is not valid JSON.
json read_file(const std::string& file_path);

} // namespace apischema::util::json
