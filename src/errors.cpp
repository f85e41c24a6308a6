#include "matryoshka/errors.hpp"

namespace matryoshka {

namespace {
std::string database_failed(const DatabaseError& cause) {
  return "The underlying database failed ('" + std::string(cause.what()) + "')";
}
}

DatabaseError::DatabaseError(int code, std::optional<std::string> message)
  : Error(message ? *message : std::string(kMissingMessage)),
    code_(code), message_(std::move(message)) {}

// --- FileSystemError

FileSystemError::FileSystemError(Kind kind, const std::string& description)
  : Error("Error during loading of virtual file system from database: " + description),
    kind_(kind) {}

FileSystemError FileSystemError::no_file_system() {
  return FileSystemError(Kind::NoFileSystem,
                         "No virtual file system exists and none should be created");
}

FileSystemError FileSystemError::invalid_base_command(const std::string& sql,
                                                      const DatabaseError& cause) {
  FileSystemError e(Kind::InvalidBaseCommand,
                    "Preparing the base SQL command '" + sql + "' failed ('" + cause.what() + "')");
  e.statement_ = sql;
  e.cause_ = cause;
  return e;
}

FileSystemError FileSystemError::unsupported_version(uint32_t version) {
  FileSystemError e(Kind::UnsupportedVersion,
                    "The virtual file system version '" + std::to_string(version) +
                    "' is not supported by this library version");
  e.version_ = version;
  return e;
}

FileSystemError FileSystemError::database(const DatabaseError& cause) {
  FileSystemError e(Kind::Database, database_failed(cause));
  e.cause_ = cause;
  return e;
}

// --- CreationError

CreationError::CreationError(Kind kind, const std::string& description)
  : Error("Error during file creation: " + description), kind_(kind) {}

CreationError CreationError::file_exists() {
  return CreationError(Kind::FileExists, "The file already exists");
}

CreationError CreationError::source(std::error_code code) {
  CreationError e(Kind::SourceError, "The data source failed ('" + code.message() + "')");
  e.source_error_ = code;
  return e;
}

CreationError CreationError::database(const DatabaseError& cause) {
  CreationError e(Kind::Database, database_failed(cause));
  e.cause_ = cause;
  return e;
}

// --- LoadingError

LoadingError::LoadingError(Kind kind, const std::string& description)
  : Error("Error during file loading: " + description), kind_(kind) {}

LoadingError LoadingError::file_not_found() {
  return LoadingError(Kind::FileNotFound, "The requested file does not exist");
}

LoadingError LoadingError::database(const DatabaseError& cause) {
  LoadingError e(Kind::Database, database_failed(cause));
  e.cause_ = cause;
  return e;
}

// --- ReadError

ReadError::ReadError(Kind kind, const std::string& description)
  : Error("Error during file reading: " + description), kind_(kind) {}

ReadError ReadError::out_of_bounds() {
  return ReadError(Kind::OutOfBounds, "The specified indices are out of bounds");
}

ReadError ReadError::file_system_limits() {
  return ReadError(Kind::FileSystemLimits,
                   "The underlying database does not allow files of such size");
}

ReadError ReadError::sink(std::error_code code) {
  ReadError e(Kind::SinkError, "The data destination failed ('" + code.message() + "')");
  e.sink_error_ = code;
  return e;
}

ReadError ReadError::database(const DatabaseError& cause) {
  ReadError e(Kind::Database, database_failed(cause));
  e.cause_ = cause;
  return e;
}

} // namespace matryoshka
