#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

namespace matryoshka {

// Common base of everything the virtual file system throws on purpose.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// A failure reported by SQLite itself.
class DatabaseError : public Error {
public:
  static constexpr const char* kMissingMessage = "<Unknown SQLite error>";

  DatabaseError(int code, std::optional<std::string> message);

  int code() const { return code_; }               // extended result code
  int primary_code() const { return code_ & 0xff; }
  const std::optional<std::string>& message() const { return message_; }

private:
  int code_;
  std::optional<std::string> message_;
};

class FileSystemError : public Error {
public:
  enum class Kind { NoFileSystem, InvalidBaseCommand, UnsupportedVersion, Database };

  static FileSystemError no_file_system();
  static FileSystemError invalid_base_command(const std::string& sql, const DatabaseError& cause);
  static FileSystemError unsupported_version(uint32_t version);
  static FileSystemError database(const DatabaseError& cause);

  Kind kind() const { return kind_; }
  const std::string& statement() const { return statement_; }   // InvalidBaseCommand only
  uint32_t version() const { return version_; }                 // UnsupportedVersion only
  const std::optional<DatabaseError>& cause() const { return cause_; }

private:
  FileSystemError(Kind kind, const std::string& description);

  Kind kind_;
  std::string statement_;
  uint32_t version_ = 0;
  std::optional<DatabaseError> cause_;
};

class CreationError : public Error {
public:
  enum class Kind { FileExists, SourceError, Database };

  static CreationError file_exists();
  static CreationError source(std::error_code code);
  static CreationError database(const DatabaseError& cause);

  Kind kind() const { return kind_; }
  std::error_code source_error() const { return source_error_; }
  const std::optional<DatabaseError>& cause() const { return cause_; }

private:
  CreationError(Kind kind, const std::string& description);

  Kind kind_;
  std::error_code source_error_;
  std::optional<DatabaseError> cause_;
};

class LoadingError : public Error {
public:
  enum class Kind { FileNotFound, Database };

  static LoadingError file_not_found();
  static LoadingError database(const DatabaseError& cause);

  Kind kind() const { return kind_; }
  const std::optional<DatabaseError>& cause() const { return cause_; }

private:
  LoadingError(Kind kind, const std::string& description);

  Kind kind_;
  std::optional<DatabaseError> cause_;
};

class ReadError : public Error {
public:
  enum class Kind { OutOfBounds, FileSystemLimits, SinkError, Database };

  static ReadError out_of_bounds();
  static ReadError file_system_limits();
  static ReadError sink(std::error_code code);
  static ReadError database(const DatabaseError& cause);

  Kind kind() const { return kind_; }
  std::error_code sink_error() const { return sink_error_; }
  const std::optional<DatabaseError>& cause() const { return cause_; }

private:
  ReadError(Kind kind, const std::string& description);

  Kind kind_;
  std::error_code sink_error_;
  std::optional<DatabaseError> cause_;
};

} // namespace matryoshka
