#pragma once
#include "safe_text/constants.hpp"
#include "safe_text/line_filter.hpp"
#include "safe_text/line_stream.hpp"

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace st {

// Reader facade over an already-validated path. Options are fixed per
// instance; every call opens the file afresh.
class TextFileReader {
public:
  struct Options {
    std::string encoding          = std::string(kDefaultEncoding);
    bool        strip             = false;
    int         skip_header_lines = 0;
    int         skip_footer_lines = 0;
    bool        skip_empty_lines  = false;
    std::size_t chunk_size        = kDefaultChunkSize;   // floor kMinChunkSize
    std::size_t buffer_size       = kDefaultBufferSize;  // floor kMinBufferSize
  };

  explicit TextFileReader(std::string path);          // default Options{}
  TextFileReader(std::string path, Options opts);     // throws ParameterError

  // Lines joined with the canonical newline.
  std::string read_all();
  std::vector<std::string> read_all_lines();

  LineStream stream_chunks();

  // First `max_lines` filtered lines; the file is closed before returning.
  std::vector<std::string> preview(int max_lines = kDefaultPreviewLines);

  // Every logical line on disk, ignoring header/footer skips but honoring
  // skip_empty_lines. Files up to `threshold_bytes` are read whole.
  std::uint64_t line_count(std::uint64_t threshold_bytes = kDefaultLineCountThreshold);

  // read_all() as an in-memory stream.
  std::istringstream open_text();

  const std::string& path() const noexcept { return path_; }
  const Options& options() const noexcept { return opts_; }

private:
  std::vector<std::string> materialize(const FilterConfig& fc) const;
  LineStream open_stream(const FilterConfig& fc) const;

  std::string path_;
  Options opts_;
  FilterConfig filter_;
};

}
