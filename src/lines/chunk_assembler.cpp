#include "safe_text/chunk_assembler.hpp"
#include "safe_text/constants.hpp"

#include <algorithm>

namespace st {

std::size_t effective_chunk_size(std::size_t requested) noexcept {
  return std::max(requested, kMinChunkSize);
}

ChunkAssembler::ChunkAssembler(std::size_t chunk_size)
  : size_(effective_chunk_size(chunk_size)) {}

bool ChunkAssembler::add(std::string line, Chunk& out) {
  cur_.push_back(std::move(line));
  if (cur_.size() < size_) return false;
  out.swap(cur_);
  cur_.clear();
  return true;
}

bool ChunkAssembler::flush(Chunk& out) {
  if (cur_.empty()) return false;
  out.swap(cur_);
  cur_.clear();
  return true;
}

}
