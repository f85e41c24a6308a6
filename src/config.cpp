#include "matryoshka/config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace matryoshka {

Config parse_config(const std::string& text) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& e) {
    throw std::runtime_error(std::string("config: ") + e.what());
  }
  if (!j.is_object()) throw std::runtime_error("config: top level must be an object");

  Config c;
  if (j.contains("database")) {
    if (!j["database"].is_string()) throw std::runtime_error("config: 'database' must be a string");
    c.database_path = j["database"].get<std::string>();
  }
  if (j.contains("chunk_size")) {
    if (!j["chunk_size"].is_number_unsigned())
      throw std::runtime_error("config: 'chunk_size' must be a non-negative integer");
    c.chunk_size = j["chunk_size"].get<std::size_t>();
  }
  return c;
}

Config load_config(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("config: cannot open " + path);
  std::ostringstream ss; ss << in.rdbuf();
  return parse_config(ss.str());
}

} // namespace matryoshka
