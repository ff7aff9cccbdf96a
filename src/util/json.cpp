#include "apischema/util/json.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace apischema::util::json {

json read_file(const std::string& file_path) {
  std::ifstream in(std::filesystem::path(file_path), std::ios::binary);
  if (!in) throw std::runtime_error("Unable to open file: " + file_path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return json::parse(ss.str());
}

} // namespace apischema::util::json
