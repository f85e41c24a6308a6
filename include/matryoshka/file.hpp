#pragma once
#include "file_system.hpp"
#include "handle.hpp"
#include "io.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace matryoshka {

// A file of a FileSystem, bound to it by reference. The size is fetched once
// on construction. Besides random reads it keeps a cursor for sequential ones.
class File {
public:
  // Throws CreationError.
  static File create(FileSystem& file_system, const std::string& path, Source& data,
                     std::size_t chunk_size);
  // Throws LoadingError; an unknown path is FileNotFound.
  static File load(FileSystem& file_system, const std::string& path);
  // Revalidates a raw handle. Throws LoadingError.
  static File from_handle(FileSystem& file_system, Handle handle);

  // Does not move the cursor. Throws ReadError.
  std::size_t random_read(Sink& sink, std::size_t index, std::size_t length) const;

  // Reads up to `length` bytes at the cursor and advances it; 0 at the end.
  std::size_t read(uint8_t* buffer, std::size_t length);
  // Everything from the cursor to the end.
  std::vector<uint8_t> read_to_end();

  std::size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }
  Handle handle() const { return handle_; }
  std::size_t position() const { return position_; }
  void seek(std::size_t position);   // clamped to size()

  // Deletes the file; true if exactly one entry went away. The File must not
  // be read afterwards. Throws DatabaseError.
  bool remove();

private:
  File(FileSystem& file_system, Handle handle, std::size_t size)
    : file_system_(&file_system), handle_(handle), size_(size) {}

  FileSystem* file_system_;
  Handle handle_;
  std::size_t size_;
  std::size_t position_ = 0;
};

} // namespace matryoshka
