#pragma once
#include "safe_text/chunk_assembler.hpp"
#include "safe_text/constants.hpp"
#include "safe_text/line_filter.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace st {

// Pull-based chunk stream over one file. The file is opened on the first
// pull and closed on exhaustion, on close(), on any error, and on destruction.
// Single pass; a new stream re-opens the file.
class LineStream {
public:
  struct Config {
    std::string  encoding    = std::string(kDefaultEncoding);
    std::size_t  buffer_size = kDefaultBufferSize;
    std::size_t  chunk_size  = kDefaultChunkSize;
    FilterConfig filter;
  };

  LineStream(std::string path, Config cfg);
  ~LineStream();

  LineStream(LineStream&& o) noexcept;
  LineStream& operator=(LineStream&& o) noexcept;
  LineStream(const LineStream&) = delete;
  LineStream& operator=(const LineStream&) = delete;

  // Next non-empty chunk, or nullopt once the source is exhausted.
  std::optional<Chunk> next();

  // Return false from the callback to stop early; the file is closed either way.
  using ChunkCallback = std::function<bool(const Chunk&)>;
  bool for_each_chunk(const ChunkCallback& cb);

  void close() noexcept;
  bool is_open() const noexcept;
  bool exhausted() const noexcept;

  // true when the codec probe chose the whole-file decode.
  bool full_buffer() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t lines_emitted() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
