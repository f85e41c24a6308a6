#include "matryoshka/file.hpp"
#include "matryoshka/errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace matryoshka {

File File::create(FileSystem& file_system, const std::string& path, Source& data,
                  std::size_t chunk_size) {
  Handle handle = file_system.create(path, data, chunk_size);
  std::optional<std::size_t> size;
  try {
    size = file_system.size(handle);
  } catch (const DatabaseError& e) {
    throw CreationError::database(e);
  }
  if (!size) throw std::logic_error("missing file size for a file just created");
  return File(file_system, handle, *size);
}

File File::load(FileSystem& file_system, const std::string& path) {
  std::optional<Handle> handle;
  try {
    handle = file_system.open(path);
  } catch (const DatabaseError& e) {
    throw LoadingError::database(e);
  }
  if (!handle) throw LoadingError::file_not_found();
  return from_handle(file_system, *handle);
}

File File::from_handle(FileSystem& file_system, Handle handle) {
  std::optional<std::size_t> size;
  try {
    size = file_system.size(handle);
  } catch (const DatabaseError& e) {
    throw LoadingError::database(e);
  }
  if (!size) throw LoadingError::file_not_found();
  return File(file_system, handle, *size);
}

std::size_t File::random_read(Sink& sink, std::size_t index, std::size_t length) const {
  return file_system_->read(handle_, sink, index, length);
}

std::size_t File::read(uint8_t* buffer, std::size_t length) {
  const std::size_t n = std::min(length, size_ - position_);
  MemorySink sink(buffer, n);
  const std::size_t written = file_system_->read(handle_, sink, position_, n);
  position_ += written;
  return written;
}

std::vector<uint8_t> File::read_to_end() {
  std::vector<uint8_t> out;
  out.reserve(size_ - position_);
  BufferSink sink(out);
  position_ += file_system_->read(handle_, sink, position_, size_ - position_);
  return out;
}

void File::seek(std::size_t position) {
  position_ = std::min(position, size_);
}

bool File::remove() {
  return file_system_->remove(handle_) == 1;
}

} // namespace matryoshka
