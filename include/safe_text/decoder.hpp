#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace st {

// Incremental text decoder. Output is UTF-8. Bytes that end mid-character are
// carried into the next feed(); finish() fails if any are still held.
class Decoder {
public:
  virtual ~Decoder() = default;
  virtual std::string feed(std::string_view bytes) = 0;
  virtual std::string finish() = 0;
  virtual const std::string& name() const noexcept = 0;
};

struct CodecPlan {
  enum class Path { Incremental, FullBuffer };

  Path path = Path::Incremental;
  std::string codec;         // codec actually used for decoding
  std::size_t skip_bytes = 0; // leading BOM consumed by the probe
};

// Lower-case, '_' -> '-', "utf8" -> "utf-8" and similar aliases.
std::string normalize_codec_name(std::string_view name);

// Decides, from the first bytes of the source, whether `encoding` can be
// decoded incrementally. Throws EncodingError for unknown codecs.
CodecPlan probe_codec(std::string_view encoding, std::string_view head);

std::unique_ptr<Decoder> make_decoder(std::string_view codec);

// One-shot decode of a complete buffer.
std::string decode_all(std::string_view codec, std::string_view bytes);

}
