#include "safe_text/errors.hpp"
#include "safe_text/reader_config.hpp"
#include "safe_text/run_json.hpp"
#include "safe_text/text_reader.hpp"
#include "safe_text/byte_source.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace {

enum class Mode { Read, Lines, Stream, Preview, Count };

struct Cli {
  Mode mode = Mode::Lines;
  std::string file;
  std::string config;          // JSON options file, applied before flags
  std::string summary;         // run summary JSON output
  int preview_lines = st::kDefaultPreviewLines;
  std::uint64_t count_threshold = st::kDefaultLineCountThreshold;

  // flags override the options file, so they are kept unset until then
  std::optional<std::string> encoding;
  std::optional<bool> strip, skip_empty;
  std::optional<int> skip_header, skip_footer;
  std::optional<std::size_t> chunk_size, buffer_size;
};

const char* mode_name(Mode m) {
  switch (m) {
    case Mode::Read:    return "read";
    case Mode::Lines:   return "lines";
    case Mode::Stream:  return "stream";
    case Mode::Preview: return "preview";
    case Mode::Count:   return "count";
  }
  return "lines";
}

void usage(std::ostream& os) {
  os << "Usage: safe-text-reader [--encoding=NAME] [--strip] [--skip-header=N]\n"
        "                        [--skip-footer=N] [--skip-empty] [--chunk-size=N]\n"
        "                        [--buffer-size=N] [--config=FILE.json]\n"
        "                        [--read | --lines | --stream | --preview=N | --count[=BYTES]]\n"
        "                        [--summary=FILE.json] <file>\n";
}

// Returns false on a usage error.
bool parse_cli(int argc, char** argv, Cli& c) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto value_of = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    std::string v;
    try {
      if (value_of("--encoding=", &v))    { c.encoding = v; continue; }
      if (value_of("--skip-header=", &v)) { c.skip_header = std::stoi(v); continue; }
      if (value_of("--skip-footer=", &v)) { c.skip_footer = std::stoi(v); continue; }
      if (value_of("--chunk-size=", &v))  { c.chunk_size = std::stoul(v); continue; }
      if (value_of("--buffer-size=", &v)) { c.buffer_size = std::stoul(v); continue; }
      if (value_of("--config=", &v))      { c.config = v; continue; }
      if (value_of("--summary=", &v))     { c.summary = v; continue; }
      if (value_of("--preview=", &v))     { c.mode = Mode::Preview; c.preview_lines = std::stoi(v); continue; }
      if (value_of("--count=", &v))       { c.mode = Mode::Count; c.count_threshold = std::stoull(v); continue; }
    } catch (const std::exception&) {
      std::cerr << "[cli] bad number in " << a << "\n";
      return false;
    }
    if (a == "--strip")      { c.strip = true; continue; }
    if (a == "--skip-empty") { c.skip_empty = true; continue; }
    if (a == "--read")       { c.mode = Mode::Read; continue; }
    if (a == "--lines")      { c.mode = Mode::Lines; continue; }
    if (a == "--stream")     { c.mode = Mode::Stream; continue; }
    if (a == "--preview")    { c.mode = Mode::Preview; continue; }
    if (a == "--count")      { c.mode = Mode::Count; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(0); }
    if (a.rfind("--", 0) == 0) { std::cerr << "[cli] unknown flag: " << a << "\n"; return false; }
    if (!c.file.empty()) { std::cerr << "[cli] more than one input file\n"; return false; }
    c.file = a;
  }
  if (c.file.empty()) { std::cerr << "[cli] missing input file\n"; return false; }
  return true;
}

st::TextFileReader::Options build_options(const Cli& c) {
  st::TextFileReader::Options o;
  if (!c.config.empty()) o = st::load_options_file(c.config, o);
  if (c.encoding)    o.encoding = *c.encoding;
  if (c.strip)       o.strip = *c.strip;
  if (c.skip_empty)  o.skip_empty_lines = *c.skip_empty;
  if (c.skip_header) o.skip_header_lines = *c.skip_header;
  if (c.skip_footer) o.skip_footer_lines = *c.skip_footer;
  if (c.chunk_size)  o.chunk_size = *c.chunk_size;
  if (c.buffer_size) o.buffer_size = *c.buffer_size;
  return o;
}

void run(const Cli& cli, st::RunSummary& sum) {
  st::TextFileReader reader(cli.file, build_options(cli));
  sum.encoding = reader.options().encoding;

  switch (cli.mode) {
    case Mode::Read: {
      const std::string text = reader.read_all();
      std::cout << text;
      if (!text.empty()) std::cout << '\n';
      break;
    }
    case Mode::Lines: {
      for (const auto& l : reader.read_all_lines()) { std::cout << l << '\n'; ++sum.lines; }
      break;
    }
    case Mode::Stream: {
      auto s = reader.stream_chunks();
      while (auto c = s.next()) {
        ++sum.chunks;
        for (const auto& l : *c) std::cout << l << '\n';
        sum.lines += c->size();
      }
      sum.bytes = s.bytes_read();
      sum.full_buffer = s.full_buffer();
      std::cerr << "[stream] chunks=" << sum.chunks << " lines=" << sum.lines << "\n";
      break;
    }
    case Mode::Preview: {
      for (const auto& l : reader.preview(cli.preview_lines)) { std::cout << l << '\n'; ++sum.lines; }
      break;
    }
    case Mode::Count: {
      sum.lines = reader.line_count(cli.count_threshold);
      std::cout << sum.lines << "\n";
      break;
    }
  }
}

}

int main(int argc, char** argv) {
  Cli cli;
  if (!parse_cli(argc, argv, cli)) { usage(std::cerr); return 2; }

  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  st::RunSummary sum;
  sum.path = cli.file;
  sum.mode = mode_name(cli.mode);

  try {
    run(cli, sum);
    sum.file_size = st::file_size_of(cli.file);
  } catch (const st::Error& e) {
    std::cerr << "[error] kind=" << st::error_kind_name(e.kind())
              << " code=" << e.error_code() << ": " << e.what();
    if (!e.details().empty()) std::cerr << " (" << e.details() << ")";
    std::cerr << "\n";
    return 3;
  }

  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
  sum.wall_time_ms = wall_ms;
  if (cli.mode != Mode::Stream) sum.bytes = sum.file_size;
  const double sec = wall_ms / 1000.0;
  sum.throughput_mb_s = sec > 0.0 ? (sum.file_size / (1024.0 * 1024.0)) / sec : 0.0;

  if (!cli.summary.empty()) {
    std::string err;
    if (!st::RunSummaryWriter::write_file(cli.summary, sum, &err)) {
      std::cerr << "[summary] write failed: " << err << "\n";
      return 3;
    }
    std::cerr << "[summary] ok: " << cli.summary << "\n";
  }
  return 0;
}
