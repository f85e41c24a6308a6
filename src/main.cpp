#include "matryoshka/cli.hpp"
#include "matryoshka/errors.hpp"
#include "matryoshka/file.hpp"
#include "matryoshka/file_system.hpp"
#include "matryoshka/io.hpp"
#include "matryoshka/transfer.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <iostream>

using namespace matryoshka;
using json = nlohmann::json;

static int run(const Args& args) {
  const bool create = args.mode == "init" || args.mode == "push";
  FileSystem fs = FileSystem::load(args.db_path, create);

  if (args.mode == "init") {
    std::cerr << "File system ready in " << args.db_path
              << " (version " << fs.meta_data().version() << ")\n";
    return 0;
  }

  if (args.mode == "push") {
    const std::string& local = args.operands[0];
    const std::string& inner = args.operands[1];
    if (std::filesystem::is_directory(local)) {
      auto files = push_directory(fs, local, inner, args.chunk_size);
      size_t total = 0;
      for (auto& f : files) total += f.size();
      std::cerr << "Pushed " << files.size() << " files (" << total << " bytes)\n";
    } else {
      File f = push_file(fs, local, inner, args.chunk_size);
      std::cerr << "Pushed " << VirtualPath(inner) << " (" << f.size() << " bytes)\n";
    }
    return 0;
  }

  if (args.mode == "pull") {
    File f = File::load(fs, args.operands[0]);
    size_t n = pull_file(fs, f.handle(), args.operands[1]);
    std::cerr << "Pulled " << VirtualPath(args.operands[0]) << " (" << n << " bytes)\n";
    return 0;
  }

  if (args.mode == "find") {
    auto paths = fs.find(args.operands[0]);
    if (args.json) {
      std::cout << json(paths).dump(2) << "\n";
    } else {
      for (auto& p : paths) std::cout << p << "\n";
    }
    return 0;
  }

  if (args.mode == "stat") {
    File f = File::load(fs, args.operands[0]);
    const VirtualPath path(args.operands[0]);
    if (args.json) {
      json j = { {"path", path.str()}, {"handle", f.handle().value()}, {"size", f.size()} };
      std::cout << j.dump(2) << "\n";
    } else {
      std::cout << path << "\thandle=" << f.handle().value() << "\tsize=" << f.size() << "\n";
    }
    return 0;
  }

  if (args.mode == "cat") {
    File f = File::load(fs, args.operands[0]);
    size_t length = args.length ? *args.length
                                : (args.offset < f.size() ? f.size() - args.offset : 0);
    StreamSink out(std::cout);
    f.random_read(out, args.offset, length);
    std::cout.flush();
    return 0;
  }

  if (args.mode == "rm") {
    File f = File::load(fs, args.operands[0]);
    if (!f.remove()) {
      std::cerr << "error: " << VirtualPath(args.operands[0]) << " was not deleted\n";
      return 1;
    }
    std::cerr << "Deleted " << VirtualPath(args.operands[0]) << "\n";
    return 0;
  }

  return 1;
}

int main(int argc, char** argv) {
  auto args = parse_cli(argc, argv);
  try {
    return run(args);
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
  }
  return 1;
}
