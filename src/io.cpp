#include "matryoshka/io.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <fcntl.h>
#include <unistd.h>

namespace matryoshka {

namespace {
[[noreturn]] void throw_errno(int err, const std::string& what) {
  throw std::system_error(err, std::generic_category(), what);
}
}

std::size_t StreamSource::read(uint8_t* buffer, std::size_t length) {
  in_.read(reinterpret_cast<char*>(buffer), (std::streamsize)length);
  if (in_.bad()) {
    throw std::system_error(std::make_error_code(std::errc::io_error), "stream read failed");
  }
  return (std::size_t)in_.gcount();
}

void StreamSink::write(const uint8_t* data, std::size_t length) {
  out_.write(reinterpret_cast<const char*>(data), (std::streamsize)length);
  if (!out_) {
    throw std::system_error(std::make_error_code(std::errc::io_error), "stream write failed");
  }
}

std::size_t BufferSource::read(uint8_t* buffer, std::size_t length) {
  std::size_t n = std::min(length, size_ - pos_);
  if (n) std::memcpy(buffer, data_ + pos_, n);
  pos_ += n;
  return n;
}

void BufferSink::write(const uint8_t* data, std::size_t length) {
  out_.insert(out_.end(), data, data + length);
}

void MemorySink::write(const uint8_t* data, std::size_t length) {
  if (length > capacity_ - written_) {
    throw std::system_error(std::make_error_code(std::errc::no_buffer_space),
                            "destination buffer too small");
  }
  if (length) std::memcpy(buffer_ + written_, data, length);
  written_ += length;
}

// --- DescriptorSource

DescriptorSource::DescriptorSource(const std::string& path)
  : fd_(::open(path.c_str(), O_RDONLY | O_CLOEXEC)) {
  if (fd_ < 0) throw_errno(errno, "open " + path);
}

DescriptorSource::~DescriptorSource() {
  if (fd_ >= 0) ::close(fd_);
}

std::size_t DescriptorSource::read(uint8_t* buffer, std::size_t length) {
  // A retried call passes the same buffer again, so resume behind what
  // the interrupted attempt already stored.
  std::size_t got = std::min(pending_, length);
  while (got < length) {
    ssize_t n = ::read(fd_, buffer + got, length - got);
    if (n < 0) {
      if (errno == EINTR) {
        pending_ = got;
        throw std::system_error(std::make_error_code(std::errc::interrupted), "read");
      }
      pending_ = 0;
      throw_errno(errno, "read");
    }
    if (n == 0) break;
    got += (std::size_t)n;
  }
  pending_ = 0;
  return got;
}

// --- DescriptorSink

DescriptorSink::DescriptorSink(const std::string& path)
  : fd_(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)) {
  if (fd_ < 0) throw_errno(errno, "open " + path);
}

DescriptorSink::~DescriptorSink() {
  if (fd_ >= 0) ::close(fd_);
}

void DescriptorSink::write(const uint8_t* data, std::size_t length) {
  std::size_t done = 0;
  while (done < length) {
    ssize_t n = ::write(fd_, data + done, length - done);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw_errno(errno, "write");
    }
    done += (std::size_t)n;
  }
}

void DescriptorSink::close() {
  if (fd_ < 0) return;
  int fd = fd_;
  fd_ = -1;
  if (::fsync(fd) != 0) {
    int err = errno;
    ::close(fd);
    throw_errno(err, "fsync");
  }
  if (::close(fd) != 0) throw_errno(errno, "close");
}

} // namespace matryoshka
