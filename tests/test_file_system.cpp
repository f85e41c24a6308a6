#include "matryoshka/database.hpp"
#include "matryoshka/errors.hpp"
#include "matryoshka/file.hpp"
#include "matryoshka/file_system.hpp"
#include "check.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <string>
#include <system_error>
#include <vector>

using namespace matryoshka;

namespace {

std::vector<uint8_t> sequence(std::size_t n) {
  std::vector<uint8_t> data(n);
  for (std::size_t i = 0; i < n; ++i) data[i] = (uint8_t)(i * 7 + 1);
  return data;
}

FileSystem fresh() {
  return FileSystem::load(Database::open_in_memory(), true);
}

int64_t count_rows(FileSystem& fs, const std::string& sql) {
  Statement q = fs.database().prepare(sql);
  if (!q.step()) return -1;
  return q.column_int64(0);
}

// Hands out `good` bytes, then fails.
class FailingSource : public Source {
public:
  explicit FailingSource(std::size_t good) : good_(good) {}
  std::size_t read(uint8_t* buffer, std::size_t length) override {
    if (good_ == 0) throw std::system_error(std::make_error_code(std::errc::io_error), "boom");
    std::size_t n = std::min(length, good_);
    for (std::size_t i = 0; i < n; ++i) buffer[i] = 0xAA;
    good_ -= n;
    return n;
  }
private:
  std::size_t good_;
};

// Reports an interrupted read before every successful one.
class InterruptingSource : public Source {
public:
  explicit InterruptingSource(const std::vector<uint8_t>& data) : inner_(data) {}
  std::size_t read(uint8_t* buffer, std::size_t length) override {
    interrupt_ = !interrupt_;
    if (interrupt_) {
      ++interruptions;
      throw std::system_error(std::make_error_code(std::errc::interrupted), "EINTR");
    }
    return inner_.read(buffer, length);
  }
  int interruptions = 0;
private:
  BufferSource inner_;
  bool interrupt_ = false;
};

std::string temp_db(const char* name) {
  auto path = std::filesystem::temp_directory_path() / name;
  std::filesystem::remove(path);
  return path.string();
}

void test_loading() {
  const std::string path = temp_db("matryoshka_loading_test.sqlite");

  CHECK(kind_of<FileSystemError>([&] { FileSystem::load(path, false); },
                                 FileSystemError::Kind::Database)
        == FileSystemError::Kind::NoFileSystem);
  {
    FileSystem fs = FileSystem::load(path, true);
    CHECK(fs.meta_data().version() == FileSystem::kCurrentVersion);
    CHECK(fs.database().statement_cache().capacity() == FileSystem::kPrecompiledStatements);
    CHECK(fs.database().statement_cache().size() == FileSystem::kPrecompiledStatements);
  }
  { FileSystem fs = FileSystem::load(path, false); }
  { FileSystem fs = FileSystem::load(path, true); }

  std::filesystem::remove(path);
}

void test_unsupported_version() {
  Database db = Database::open_in_memory();
  db.execute("CREATE TABLE " + MetaData::table_name(1) + " (id INTEGER PRIMARY KEY)");
  try {
    FileSystem::load(std::move(db), true);
    CHECK(false);
  } catch (const FileSystemError& e) {
    CHECK(e.kind() == FileSystemError::Kind::UnsupportedVersion);
    CHECK(e.version() == 1);
  }
}

struct ReadCase {
  std::size_t file_size, chunk_size, index, length;
  bool out_of_bounds;
};

void test_file_handling() {
  const ReadCase cases[] = {
    // whole file
    {0, 0, 0, 0, false}, {1, 0, 0, 1, false}, {3, 0, 0, 3, false},
    {0, 1, 0, 0, false}, {1, 1, 0, 1, false}, {3, 1, 0, 3, false},
    {0, 3, 0, 0, false}, {1, 3, 0, 1, false}, {3, 3, 0, 3, false},
    {0, 4, 0, 0, false}, {1, 4, 0, 1, false}, {3, 4, 0, 3, false},
    // random reads
    {3, 0, 1, 2, false}, {3, 1, 1, 2, false}, {3, 3, 1, 2, false}, {3, 4, 1, 2, false},
    {3, 0, 2, 1, false}, {3, 1, 2, 1, false}, {3, 3, 2, 1, false}, {3, 4, 2, 1, false},
    {6, 4, 2, 1, false}, {6, 4, 2, 4, false}, {9, 4, 3, 6, false}, {12, 4, 4, 8, false},
    // out of bounds
    {0, 0, 0, 1, true}, {1, 0, 1, 1, true}, {1, 0, 1, 2, true}, {3, 0, 1, 3, true}, {3, 0, 2, 2, true},
    {0, 1, 0, 1, true}, {1, 1, 1, 1, true}, {1, 1, 1, 2, true}, {3, 1, 1, 3, true}, {3, 1, 2, 2, true},
    {0, 3, 0, 1, true}, {1, 3, 1, 1, true}, {1, 3, 1, 2, true}, {3, 3, 1, 3, true}, {3, 3, 2, 2, true},
    {0, 4, 0, 1, true}, {1, 4, 1, 1, true}, {1, 4, 1, 2, true}, {3, 4, 1, 3, true}, {3, 4, 2, 2, true},
    {8, 4, 8, 1, true}, {8, 4, 20, 1, true},
    // zero length is always fine
    {0, 0, 1, 0, false}, {0, 1, 1, 0, false}, {0, 3, 1, 0, false}, {0, 4, 1, 0, false},
    {3, 3, 100, 0, false},
  };

  for (const auto& c : cases) {
    const auto data = sequence(c.file_size);
    FileSystem fs = fresh();

    {
      BufferSource src(data);
      File file = File::create(fs, "file", src, c.chunk_size);
      CHECK(file.size() == data.size());
    }

    // never overwritten
    {
      BufferSource src(data);
      CHECK(kind_of<CreationError>([&] { File::create(fs, "file", src, c.chunk_size); },
                                   CreationError::Kind::Database)
            == CreationError::Kind::FileExists);
    }

    File file = File::load(fs, "file");
    CHECK(file.size() == data.size());

    std::vector<uint8_t> out;
    BufferSink sink(out);
    if (c.out_of_bounds) {
      CHECK(kind_of<ReadError>([&] { file.random_read(sink, c.index, c.length); },
                               ReadError::Kind::Database)
            == ReadError::Kind::OutOfBounds);
    } else {
      CHECK(file.random_read(sink, c.index, c.length) == c.length);
      CHECK(out.size() == c.length);
      if (c.length > 0) {
        CHECK(std::equal(out.begin(), out.end(), data.begin() + c.index));
      }
    }
  }
}

void test_every_range() {
  // all ranges of small files, across chunk boundaries
  for (std::size_t n : {0u, 1u, 5u, 8u, 13u}) {
    for (std::size_t chunk : {0u, 1u, 3u, 4u, 8u}) {
      FileSystem fs = fresh();
      const auto data = sequence(n);
      BufferSource src(data);
      File file = File::create(fs, "f", src, chunk);
      CHECK(file.size() == n);

      for (std::size_t index = 0; index <= n + 1; ++index) {
        for (std::size_t length = 0; index + length <= n + 2; ++length) {
          std::vector<uint8_t> out;
          BufferSink sink(out);
          if (length == 0 || index + length <= n) {
            CHECK(file.random_read(sink, index, length) == length);
            CHECK(std::equal(out.begin(), out.end(), data.begin() + (std::ptrdiff_t)std::min(index, n)));
          } else {
            CHECK(throws<ReadError>([&] { file.random_read(sink, index, length); }));
          }
        }
      }
    }
  }
}

void test_chunk_layout() {
  FileSystem fs = fresh();
  CHECK(fs.resolve_chunk_size(0) == FileSystem::kDefaultChunkSize);
  CHECK(fs.resolve_chunk_size(3) == 3);
  CHECK(fs.resolve_chunk_size(std::numeric_limits<std::size_t>::max()) ==
        FileSystem::kDefaultChunkSize);

  auto ten = sequence(10);
  BufferSource src10(ten);
  Handle h10 = fs.create("ten", src10, 4);
  const std::string chunks10 =
    "FROM Matryoshka_Data WHERE file_id = " + std::to_string(h10.value());
  CHECK(count_rows(fs, "SELECT COUNT(*) " + chunks10) == 3);
  CHECK(count_rows(fs, "SELECT MAX(chunk_num) " + chunks10) == 2);
  CHECK(count_rows(fs, "SELECT LENGTH(data) " + chunks10 + " AND chunk_num = 2") == 2);
  CHECK(count_rows(fs, "SELECT chunk_size FROM Matryoshka_Meta_0 WHERE id = " +
                       std::to_string(h10.value())) == 4);

  // an exact multiple ends with an empty chunk
  auto eight = sequence(8);
  BufferSource src8(eight);
  Handle h8 = fs.create("eight", src8, 4);
  CHECK(count_rows(fs, "SELECT COUNT(*) FROM Matryoshka_Data WHERE file_id = " +
                       std::to_string(h8.value())) == 3);
  CHECK(fs.size(h8) == std::optional<std::size_t>(8));

  // an empty file is one empty chunk
  BufferSource empty(nullptr, 0);
  Handle h0 = fs.create("empty", empty, 4);
  CHECK(count_rows(fs, "SELECT COUNT(*) FROM Matryoshka_Data WHERE file_id = " +
                       std::to_string(h0.value())) == 1);
  CHECK(fs.size(h0) == std::optional<std::size_t>(0));
}

void test_atomic_creation() {
  FileSystem fs = fresh();

  FailingSource src(8);
  try {
    fs.create("broken", src, 4);
    CHECK(false);
  } catch (const CreationError& e) {
    CHECK(e.kind() == CreationError::Kind::SourceError);
    CHECK(e.source_error() == std::errc::io_error);
  }
  CHECK(!fs.open("broken"));
  CHECK(count_rows(fs, "SELECT COUNT(*) FROM Matryoshka_Data") == 0);
  CHECK(count_rows(fs, "SELECT COUNT(*) FROM Matryoshka_Meta_0") == 0);

  // the path is free afterwards
  const auto three = sequence(3);
  BufferSource ok(three);
  CHECK(File::create(fs, "broken", ok, 4).size() == 3);
}

void test_interrupted_source() {
  FileSystem fs = fresh();
  const auto data = sequence(11);
  InterruptingSource src(data);
  File file = File::create(fs, "retry", src, 4);
  CHECK(src.interruptions > 0);
  CHECK(file.size() == 11);
  CHECK(file.read_to_end() == data);
}

void test_handle() {
  FileSystem fs = fresh();
  const auto data = sequence(3);
  BufferSource src(data);
  Handle handle = File::create(fs, "file", src, 3).handle();

  Handle invalid(42);
  CHECK(handle != invalid);

  CHECK(File::from_handle(fs, handle).size() == 3);
  CHECK(!fs.size(invalid));
  CHECK(kind_of<LoadingError>([&] { File::from_handle(fs, invalid); },
                              LoadingError::Kind::Database)
        == LoadingError::Kind::FileNotFound);
}

void test_empty_file() {
  FileSystem fs = fresh();
  BufferSource src(nullptr, 0);
  Handle handle = File::create(fs, "abc", src, 3).handle();

  File file = File::from_handle(fs, handle);
  CHECK(file.size() == 0);
  CHECK(file.empty());

  std::vector<uint8_t> out;
  BufferSink sink(out);
  CHECK(file.random_read(sink, 0, 0) == 0);
  CHECK(kind_of<ReadError>([&] { file.random_read(sink, 0, 1); }, ReadError::Kind::Database)
        == ReadError::Kind::OutOfBounds);
}

void test_delete() {
  FileSystem fs = fresh();
  const auto data = sequence(9);
  const std::string path = "abc";

  { BufferSource src(data); File::create(fs, path, src, 3); }
  { BufferSource src(data); CHECK(throws<CreationError>([&] { File::create(fs, path, src, 3); })); }

  File file = File::load(fs, path);
  CHECK(count_rows(fs, "SELECT COUNT(*) FROM Matryoshka_Data") == 4);
  CHECK(file.remove());

  // chunks are gone with the entry
  CHECK(count_rows(fs, "SELECT COUNT(*) FROM Matryoshka_Data") == 0);
  CHECK(kind_of<LoadingError>([&] { File::load(fs, path); }, LoadingError::Kind::Database)
        == LoadingError::Kind::FileNotFound);
  CHECK(fs.remove(file.handle()) == 0);
  CHECK(!fs.size(file.handle()));

  BufferSource again(data);
  CHECK(File::create(fs, path, again, 3).size() == data.size());
}

void test_find() {
  FileSystem fs = fresh();
  const char* paths[] = {
    "folder/example_file_1.txt",
    "folder/example_file_2.txt",
    "folder/nested_folder1/file1.txt",
    "folder/nested_folder1/file2.txt",
    "folder/nested_folder2/file1.txt",
  };
  const auto data = sequence(3);
  for (const char* p : paths) {
    BufferSource src(data);
    File::create(fs, p, src, 42);
  }

  CHECK(fs.find("folder").empty());
  CHECK(fs.find(paths[0]).size() == 1);
  CHECK(fs.find("/folder/./example_file_1.txt").size() == 1);
  CHECK(fs.find("folder/example_file_?.txt").size() == 2);
  CHECK(fs.find("folder/example_*.txt").size() == 2);
  CHECK(fs.find("folder/*/*").size() == 3);
  // '*' also matches across '/'
  CHECK((fs.find("folder/*1.txt") == std::vector<std::string>{
    "folder/example_file_1.txt",
    "folder/nested_folder1/file1.txt",
    "folder/nested_folder2/file1.txt",
  }));

  auto all = fs.find("*");
  CHECK(all.size() == 5);
  CHECK(std::is_sorted(all.begin(), all.end()));
  CHECK(all.front() == paths[0]);
}

void test_paths_are_normalized() {
  FileSystem fs = fresh();
  const auto data = sequence(2);
  BufferSource src(data);
  Handle h = fs.create("/a/./b/../c", src, 0);
  CHECK(fs.open("a/c") == std::optional<Handle>(h));
  CHECK(fs.open("a/b/../c/") == std::optional<Handle>(h));
  CHECK(!fs.open("a/b/c"));
}

void test_read_failures() {
  FileSystem fs = fresh();
  const auto data = sequence(10);
  BufferSource src(data);
  File file = File::create(fs, "f", src, 4);

  uint8_t small[3];
  MemorySink sink(small, sizeof(small));
  try {
    file.random_read(sink, 0, 10);
    CHECK(false);
  } catch (const ReadError& e) {
    CHECK(e.kind() == ReadError::Kind::SinkError);
    CHECK(e.sink_error() == std::errc::no_buffer_space);
  }

  std::vector<uint8_t> out;
  BufferSink any(out);
  const std::size_t huge = (std::size_t)std::numeric_limits<int64_t>::max() + 1;
  CHECK(kind_of<ReadError>([&] { file.random_read(any, huge, 1); }, ReadError::Kind::Database)
        == ReadError::Kind::FileSystemLimits);
  CHECK(kind_of<ReadError>([&] { file.random_read(any, 0, huge); }, ReadError::Kind::Database)
        == ReadError::Kind::FileSystemLimits);
  CHECK(kind_of<ReadError>([&] { file.random_read(any, huge - 2, 4); }, ReadError::Kind::Database)
        == ReadError::Kind::FileSystemLimits);

  // unknown handles have no chunks
  CHECK(kind_of<ReadError>([&] { fs.read(Handle(4242), any, 0, 1); }, ReadError::Kind::Database)
        == ReadError::Kind::OutOfBounds);
}

void test_persistence() {
  const std::string path = temp_db("matryoshka_persistence_test.sqlite");
  const auto data = sequence(1000);
  {
    FileSystem fs = FileSystem::load(path, true);
    BufferSource src(data);
    File::create(fs, "dir/blob.bin", src, 64);
  }
  {
    FileSystem fs = FileSystem::load(path, false);
    File file = File::load(fs, "dir/blob.bin");
    CHECK(file.size() == data.size());
    CHECK(file.read_to_end() == data);
  }
  std::filesystem::remove(path);
}

void test_error_messages() {
  CHECK(std::string(CreationError::file_exists().what()).find("already exists") != std::string::npos);
  CHECK(std::string(LoadingError::file_not_found().what()).find("does not exist") != std::string::npos);
  CHECK(std::string(ReadError::out_of_bounds().what()).find("out of bounds") != std::string::npos);
  CHECK(std::string(FileSystemError::unsupported_version(7).what()).find("'7'") != std::string::npos);
  CHECK(std::string(DatabaseError(1, std::nullopt).what()) == DatabaseError::kMissingMessage);
  const auto invalid = FileSystemError::invalid_base_command("SELEC 1", DatabaseError(1, std::string("syntax")));
  CHECK(invalid.kind() == FileSystemError::Kind::InvalidBaseCommand);
  CHECK(invalid.statement() == "SELEC 1");
  CHECK(std::string(ReadError::database(DatabaseError(1, std::string("disk on fire"))).what())
          .find("disk on fire") != std::string::npos);
}

} // namespace

int main() {
  test_loading();
  test_unsupported_version();
  test_file_handling();
  test_every_range();
  test_chunk_layout();
  test_atomic_creation();
  test_interrupted_source();
  test_handle();
  test_empty_file();
  test_delete();
  test_find();
  test_paths_are_normalized();
  test_read_failures();
  test_persistence();
  test_error_messages();
  return report("file_system");
}
