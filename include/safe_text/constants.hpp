#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace st {

inline constexpr std::string_view kCanonicalNewline = "\n";
inline constexpr std::string_view kDefaultEncoding  = "utf-8";

inline constexpr std::size_t kDefaultChunkSize  = 500;    // lines per chunk
inline constexpr std::size_t kMinChunkSize      = 10;
inline constexpr std::size_t kDefaultBufferSize = 32768;  // bytes per raw read
inline constexpr std::size_t kMinBufferSize     = 16384;

inline constexpr int kDefaultPreviewLines = 100;

// line_count() materializes files up to this size and streams anything larger.
inline constexpr std::uint64_t kDefaultLineCountThreshold = 64ull * 1024 * 1024; // 64 MiB
inline constexpr std::uint64_t kMinLineCountThreshold     = 1ull * 1024 * 1024;  // 1 MiB

}
