#include "safe_text/byte_source.hpp"
#include "safe_text/constants.hpp"
#include "safe_text/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <system_error>

namespace st {

std::size_t effective_buffer_size(std::size_t requested) noexcept {
  return std::max(requested, kMinBufferSize);
}

ByteSource::ByteSource(std::string path, std::size_t buffer_size)
  : path_(std::move(path)), buffer_size_(effective_buffer_size(buffer_size)) {
  std::error_code ec;
  if (std::filesystem::is_directory(path_, ec)) {
    throw error_from_errno(EISDIR, "open", path_);
  }
  f_ = std::fopen(path_.c_str(), "rb");
  if (!f_) throw error_from_errno(errno, "open", path_);
}

ByteSource::~ByteSource() { close(); }

bool ByteSource::next(std::string& out) {
  out.clear();
  if (!f_) return false;
  out.resize(buffer_size_);
  std::size_t n = std::fread(out.data(), 1, buffer_size_, f_);
  if (n == 0 && std::ferror(f_)) {
    const int err = errno;
    close();
    throw error_from_errno(err, "read", path_);
  }
  out.resize(n);
  bytes_ += n;
  return n > 0;
}

void ByteSource::close() noexcept {
  if (f_) { std::fclose(f_); f_ = nullptr; }
}

std::uint64_t file_size_of(const std::string& path) {
  std::error_code ec;
  auto n = std::filesystem::file_size(path, ec);
  if (ec) throw error_from_errno(ec.value(), "stat", path);
  return static_cast<std::uint64_t>(n);
}

std::string read_all_bytes(const std::string& path, std::size_t buffer_size) {
  ByteSource src(path, buffer_size);
  std::string all, buf;
  while (src.next(buf)) all.append(buf);
  return all;
}

}
