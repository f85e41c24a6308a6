#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace matryoshka {

// Where file content comes from. read() fills the whole buffer unless the
// data ends first; failures are thrown as std::system_error, and a code of
// std::errc::interrupted asks the caller to simply try again.
class Source {
public:
  virtual ~Source() = default;
  virtual std::size_t read(uint8_t* buffer, std::size_t length) = 0;
};

// Where file content goes. write() takes everything or throws std::system_error.
class Sink {
public:
  virtual ~Sink() = default;
  virtual void write(const uint8_t* data, std::size_t length) = 0;
};

class StreamSource : public Source {
public:
  explicit StreamSource(std::istream& in) : in_(in) {}
  std::size_t read(uint8_t* buffer, std::size_t length) override;

private:
  std::istream& in_;
};

class StreamSink : public Sink {
public:
  explicit StreamSink(std::ostream& out) : out_(out) {}
  void write(const uint8_t* data, std::size_t length) override;

private:
  std::ostream& out_;
};

class BufferSource : public Source {
public:
  BufferSource(const uint8_t* data, std::size_t size) : data_(data), size_(size) {}
  explicit BufferSource(const std::vector<uint8_t>& data) : BufferSource(data.data(), data.size()) {}
  explicit BufferSource(std::vector<uint8_t>&&) = delete;   // would dangle
  std::size_t read(uint8_t* buffer, std::size_t length) override;

private:
  const uint8_t* data_;
  std::size_t size_;
  std::size_t pos_ = 0;
};

// Appends to a vector owned by the caller.
class BufferSink : public Sink {
public:
  explicit BufferSink(std::vector<uint8_t>& out) : out_(out) {}
  void write(const uint8_t* data, std::size_t length) override;

private:
  std::vector<uint8_t>& out_;
};

// Fills a fixed caller buffer; writing past its end fails with no_buffer_space.
class MemorySink : public Sink {
public:
  MemorySink(uint8_t* buffer, std::size_t capacity) : buffer_(buffer), capacity_(capacity) {}
  void write(const uint8_t* data, std::size_t length) override;
  std::size_t written() const { return written_; }

private:
  uint8_t* buffer_;
  std::size_t capacity_;
  std::size_t written_ = 0;
};

// Owns a POSIX descriptor opened for reading. EINTR is passed on as
// std::errc::interrupted.
class DescriptorSource : public Source {
public:
  explicit DescriptorSource(const std::string& path);   // throws std::system_error
  ~DescriptorSource() override;

  DescriptorSource(const DescriptorSource&) = delete;
  DescriptorSource& operator=(const DescriptorSource&) = delete;

  std::size_t read(uint8_t* buffer, std::size_t length) override;

private:
  int fd_;
  std::size_t pending_ = 0;   // bytes of an interrupted fill that are already in the buffer
};

// Owns a POSIX descriptor created/truncated for writing.
class DescriptorSink : public Sink {
public:
  explicit DescriptorSink(const std::string& path);   // throws std::system_error
  ~DescriptorSink() override;

  DescriptorSink(const DescriptorSink&) = delete;
  DescriptorSink& operator=(const DescriptorSink&) = delete;

  void write(const uint8_t* data, std::size_t length) override;
  // Flushes to stable storage and closes; errors are reported, unlike in the destructor.
  void close();

private:
  int fd_;
};

} // namespace matryoshka
