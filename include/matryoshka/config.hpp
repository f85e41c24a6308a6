#pragma once
#include <cstddef>
#include <optional>
#include <string>

namespace matryoshka {

// Defaults for the command-line tool, read from a JSON object such as
//   { "database": "store.sqlite", "chunk_size": 1048576 }
// Unknown keys are ignored.
struct Config {
  std::optional<std::string> database_path;
  std::optional<std::size_t> chunk_size;
};

// Throws std::runtime_error on unreadable files, malformed JSON or wrongly
// typed values.
Config load_config(const std::string& path);
Config parse_config(const std::string& text);

} // namespace matryoshka
