#include "matryoshka/cli.hpp"
#include "matryoshka/config.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace matryoshka {

static const char* USAGE =
"matryoshka_cli init [--db path] [--config file]\n"
"matryoshka_cli push <local> <inner> [--db path] [--chunk-size N] [--config file]\n"
"matryoshka_cli pull <inner> <local> [--db path] [--config file]\n"
"matryoshka_cli find <pattern> [--db path] [--json] [--config file]\n"
"matryoshka_cli stat <inner> [--db path] [--json] [--config file]\n"
"matryoshka_cli cat <inner> [--offset N] [--length N] [--db path] [--config file]\n"
"matryoshka_cli rm <inner> [--db path] [--config file]\n";

namespace {
[[noreturn]] void usage() {
  std::cerr << USAGE;
  std::exit(1);
}

std::size_t parse_size(const std::string& flag, const std::string& value) {
  try {
    if (value.empty() || value[0] == '-') throw std::invalid_argument(value);
    size_t used = 0;
    unsigned long long v = std::stoull(value, &used);
    if (used != value.size()) throw std::invalid_argument(value);
    return (std::size_t)v;
  } catch (const std::logic_error&) {
    std::cerr << "Invalid value for " << flag << ": " << value << "\n";
    std::exit(1);
  }
}

size_t operand_count(const std::string& mode) {
  if (mode == "init") return 0;
  if (mode == "push" || mode == "pull") return 2;
  if (mode == "find" || mode == "stat" || mode == "cat" || mode == "rm") return 1;
  usage();
}
}

Args parse_cli(int argc, char** argv) {
  Args a;
  if (argc < 2) usage();
  a.mode = argv[1];
  const size_t wanted = operand_count(a.mode);

  std::optional<std::string> db_flag;
  std::optional<std::size_t> chunk_flag;
  int i = 2;
  while (i < argc) {
    std::string f = argv[i++];
    auto next = [&](std::string& dst){
      if (i >= argc) { std::cerr << "Missing value after " << f << "\n"; std::exit(1); }
      dst = argv[i++];
    };
    std::string v;
    if (f == "--db") { next(v); db_flag = v; }
    else if (f == "--chunk-size") { next(v); chunk_flag = parse_size(f, v); }
    else if (f == "--offset") { next(v); a.offset = parse_size(f, v); }
    else if (f == "--length") { next(v); a.length = parse_size(f, v); }
    else if (f == "--config") next(a.config_path);
    else if (f == "--json") a.json = true;
    else if (f.size() > 1 && f[0] == '-') { std::cerr << "Unknown flag: " << f << "\n"; std::exit(1); }
    else a.operands.push_back(f);
  }
  if (a.operands.size() != wanted) usage();

  // config file first, flags win
  if (!a.config_path.empty()) {
    try {
      Config c = load_config(a.config_path);
      if (c.database_path) a.db_path = *c.database_path;
      if (c.chunk_size) a.chunk_size = *c.chunk_size;
    } catch (const std::runtime_error& e) {
      std::cerr << e.what() << "\n";
      std::exit(1);
    }
  }
  if (db_flag) a.db_path = *db_flag;
  if (chunk_flag) a.chunk_size = *chunk_flag;
  return a;
}

} // namespace matryoshka
