#pragma once
#include "file.hpp"
#include "file_system.hpp"
#include "handle.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace matryoshka {

// Copies a host file into the virtual file system. Throws CreationError; a
// host file that cannot be opened is a SourceError.
File push_file(FileSystem& fs, const std::string& local_path, const std::string& inner_path,
               std::size_t chunk_size);

// Pushes every regular file below `local_root` to `inner_prefix/<relative path>`,
// in sorted order. Stops at the first failure.
std::vector<File> push_directory(FileSystem& fs, const std::string& local_root,
                                 const std::string& inner_prefix, std::size_t chunk_size);

// Regular files below `root`, sorted.
std::vector<std::string> list_files(const std::string& root);

// Writes the whole file to `local_path` (created or truncated) and returns
// its size. Throws LoadingError for dead handles, ReadError otherwise.
std::size_t pull_file(FileSystem& fs, Handle handle, const std::string& local_path);

} // namespace matryoshka
