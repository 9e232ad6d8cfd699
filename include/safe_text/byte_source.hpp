#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>

namespace st {

// Fixed-size binary reads from a file. The handle is held from construction
// until close() or destruction.
class ByteSource {
public:
  // buffer_size below kMinBufferSize is raised to it.
  ByteSource(std::string path, std::size_t buffer_size);
  ~ByteSource();

  ByteSource(const ByteSource&) = delete;
  ByteSource& operator=(const ByteSource&) = delete;

  // Reads up to buffer_size() bytes into `out`; false at end of file.
  bool next(std::string& out);

  void close() noexcept;
  bool is_open() const noexcept { return f_ != nullptr; }

  const std::string& path() const noexcept { return path_; }
  std::size_t buffer_size() const noexcept { return buffer_size_; }
  std::uint64_t bytes_read() const noexcept { return bytes_; }

private:
  std::string path_;
  std::size_t buffer_size_;
  std::FILE* f_{nullptr};
  std::uint64_t bytes_{0};
};

std::size_t effective_buffer_size(std::size_t requested) noexcept;

// Size of the file on disk; errors map like ByteSource's open.
std::uint64_t file_size_of(const std::string& path);

// Whole file in one string (full-buffer decode path).
std::string read_all_bytes(const std::string& path, std::size_t buffer_size);

}
