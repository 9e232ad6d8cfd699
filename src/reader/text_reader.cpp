#include "safe_text/text_reader.hpp"
#include "safe_text/byte_source.hpp"
#include "safe_text/decoder.hpp"
#include "safe_text/errors.hpp"
#include "safe_text/line_splitter.hpp"

namespace st {

namespace {

std::size_t checked_count(int v, const char* field) {
  if (v < 0) {
    throw Error(ErrorKind::ParameterError, "invalid-skip",
                std::string(field) + " must be >= 0, got " + std::to_string(v));
  }
  return static_cast<std::size_t>(v);
}

}

TextFileReader::TextFileReader(std::string path)
  : TextFileReader(std::move(path), Options{}) {}

TextFileReader::TextFileReader(std::string path, Options opts)
  : path_(std::move(path)), opts_(std::move(opts)) {
  if (opts_.encoding.empty()) {
    throw Error(ErrorKind::ParameterError, "invalid-encoding", "encoding must not be empty");
  }
  filter_.skip_header_lines = checked_count(opts_.skip_header_lines, "skip_header_lines");
  filter_.skip_footer_lines = checked_count(opts_.skip_footer_lines, "skip_footer_lines");
  filter_.skip_empty_lines  = opts_.skip_empty_lines;
  filter_.strip             = opts_.strip;
}

std::vector<std::string> TextFileReader::materialize(const FilterConfig& fc) const {
  std::vector<std::string> out;
  try {
    const std::string bytes = read_all_bytes(path_, opts_.buffer_size);
    const CodecPlan plan = probe_codec(opts_.encoding, bytes);
    const std::string text = decode_all(plan.codec, std::string_view(bytes).substr(plan.skip_bytes));

    LineFilter filter(fc);
    LineSplitter splitter;
    auto sink = [&](std::string&& line) {
      std::string kept;
      if (filter.accept(std::move(line), kept)) out.push_back(std::move(kept));
    };
    splitter.push(text, sink);
    splitter.finish(sink);
    filter.finish();
  } catch (...) {
    rethrow_mapped(path_);
  }
  return out;
}

LineStream TextFileReader::open_stream(const FilterConfig& fc) const {
  LineStream::Config cfg;
  cfg.encoding    = opts_.encoding;
  cfg.buffer_size = opts_.buffer_size;
  cfg.chunk_size  = opts_.chunk_size;
  cfg.filter      = fc;
  try {
    return LineStream(path_, std::move(cfg));
  } catch (...) {
    rethrow_mapped(path_);
  }
}

std::vector<std::string> TextFileReader::read_all_lines() { return materialize(filter_); }

std::string TextFileReader::read_all() {
  const auto lines = read_all_lines();
  std::string out;
  std::size_t total = 0;
  for (const auto& l : lines) total += l.size() + kCanonicalNewline.size();
  out.reserve(total);
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i) out.append(kCanonicalNewline);
    out.append(lines[i]);
  }
  return out;
}

LineStream TextFileReader::stream_chunks() { return open_stream(filter_); }

std::vector<std::string> TextFileReader::preview(int max_lines) {
  if (max_lines < 0) {
    throw Error(ErrorKind::ParameterError, "invalid-max-lines",
                "max_lines must be >= 0, got " + std::to_string(max_lines));
  }
  std::vector<std::string> out;
  if (max_lines == 0) return out;

  const std::size_t want = static_cast<std::size_t>(max_lines);
  LineStream s = open_stream(filter_);
  s.for_each_chunk([&](const Chunk& c) {
    for (const auto& line : c) {
      out.push_back(line);
      if (out.size() == want) return false;
    }
    return true;
  });
  s.close();
  return out;
}

std::uint64_t TextFileReader::line_count(std::uint64_t threshold_bytes) {
  if (threshold_bytes < kMinLineCountThreshold) {
    throw Error(ErrorKind::ParameterError, "invalid-threshold",
                "threshold_bytes must be >= " + std::to_string(kMinLineCountThreshold),
                "got " + std::to_string(threshold_bytes));
  }

  FilterConfig fc;
  fc.skip_empty_lines = filter_.skip_empty_lines;

  std::uint64_t size = 0;
  try {
    size = file_size_of(path_);
  } catch (...) {
    rethrow_mapped(path_);
  }
  if (size <= threshold_bytes) return materialize(fc).size();

  std::uint64_t n = 0;
  LineStream s = open_stream(fc);
  while (auto c = s.next()) n += c->size();
  return n;
}

std::istringstream TextFileReader::open_text() { return std::istringstream(read_all()); }

}
