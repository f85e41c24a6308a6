#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace matryoshka {

struct Args {
  std::string mode;                       // init, push, pull, find, stat, cat, rm
  std::vector<std::string> operands;
  std::string db_path = "./matryoshka.sqlite";
  std::size_t chunk_size = 0;             // 0: engine default
  std::size_t offset = 0;                 // cat
  std::optional<std::size_t> length;      // cat, default: to the end
  bool json = false;
  std::string config_path;
};

// Exits with the usage text on malformed command lines.
Args parse_cli(int argc, char** argv);

} // namespace matryoshka
