#include "matryoshka/transfer.hpp"
#include "matryoshka/errors.hpp"
#include "matryoshka/io.hpp"
#include <algorithm>
#include <filesystem>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace matryoshka {

File push_file(FileSystem& file_system, const std::string& local_path,
               const std::string& inner_path, std::size_t chunk_size) {
  std::optional<DescriptorSource> source;
  try {
    source.emplace(local_path);
  } catch (const std::system_error& e) {
    throw CreationError::source(e.code());
  }
  return File::create(file_system, inner_path, *source, chunk_size);
}

std::vector<std::string> list_files(const std::string& root) {
  std::vector<std::string> out;
  for (auto& p : fs::recursive_directory_iterator(root)) {
    if (!p.is_regular_file()) continue;
    out.push_back(p.path().string());
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<File> push_directory(FileSystem& file_system, const std::string& local_root,
                                 const std::string& inner_prefix, std::size_t chunk_size) {
  std::vector<File> pushed;
  for (const auto& local : list_files(local_root)) {
    const std::string relative = fs::relative(local, local_root).generic_string();
    pushed.push_back(push_file(file_system, local, inner_prefix + "/" + relative, chunk_size));
  }
  return pushed;
}

std::size_t pull_file(FileSystem& file_system, Handle handle, const std::string& local_path) {
  File file = File::from_handle(file_system, handle);
  try {
    DescriptorSink sink(local_path);
    std::size_t n = file.random_read(sink, 0, file.size());
    if (n != file.size()) throw ReadError::out_of_bounds();
    sink.close();
    return n;
  } catch (const std::system_error& e) {
    throw ReadError::sink(e.code());
  }
}

} // namespace matryoshka
