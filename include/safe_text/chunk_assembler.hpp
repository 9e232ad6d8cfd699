#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace st {

using Chunk = std::vector<std::string>;

std::size_t effective_chunk_size(std::size_t requested) noexcept;

class ChunkAssembler {
public:
  explicit ChunkAssembler(std::size_t chunk_size);

  // true once a full chunk is ready in `out`.
  bool add(std::string line, Chunk& out);

  // Hands over the partial chunk; false when there is nothing left.
  bool flush(Chunk& out);

  std::size_t chunk_size() const noexcept { return size_; }
  std::size_t pending() const noexcept { return cur_.size(); }

private:
  std::size_t size_;
  Chunk cur_;
};

}
