#include "safe_text/reader_config.hpp"
#include "safe_text/run_json.hpp"
#include "safe_text/errors.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include "test_check.hpp"

using st_test::throws_kind;

namespace fs = std::filesystem;

int main(){
  // defaults survive an empty object
  {
    auto o = st::parse_options_json("{}");
    ST_CHECK(o.encoding == "utf-8");
    ST_CHECK(!o.strip && !o.skip_empty_lines);
    ST_CHECK(o.skip_header_lines == 0 && o.skip_footer_lines == 0);
    ST_CHECK(o.chunk_size == st::kDefaultChunkSize);
    ST_CHECK(o.buffer_size == st::kDefaultBufferSize);
  }

  // every key, plus an ignored one
  {
    auto o = st::parse_options_json(R"({
      "encoding": "latin-1", "strip": true, "skip_empty_lines": true,
      "skip_header_lines": 2, "skip_footer_lines": 1,
      "chunk_size": 50, "buffer_size": 65536, "comment": {"nested": [1, 2]}
    })");
    ST_CHECK(o.encoding == "latin-1");
    ST_CHECK(o.strip && o.skip_empty_lines);
    ST_CHECK(o.skip_header_lines == 2 && o.skip_footer_lines == 1);
    ST_CHECK(o.chunk_size == 50 && o.buffer_size == 65536);
  }

  // overlay keeps fields the file does not mention
  {
    st::TextFileReader::Options base; base.skip_header_lines = 7;
    auto o = st::parse_options_json(R"({"strip": true})", base);
    ST_CHECK(o.skip_header_lines == 7 && o.strip);
  }

  ST_CHECK(throws_kind([]{ st::parse_options_json("{not json"); }, st::ErrorKind::ParameterError));
  ST_CHECK(throws_kind([]{ st::parse_options_json("[1,2]"); }, st::ErrorKind::ParameterError));
  ST_CHECK(throws_kind([]{ st::parse_options_json(R"({"strip": "yes"})"); }, st::ErrorKind::ParameterError));
  ST_CHECK(throws_kind([]{ st::parse_options_json(R"({"chunk_size": -5})"); }, st::ErrorKind::ParameterError));

  // integers that do not fit the option are rejected, never wrapped
  ST_CHECK(throws_kind([]{ st::parse_options_json(R"({"skip_header_lines": 4294967296})"); },
                       st::ErrorKind::ParameterError, "invalid-config"));
  ST_CHECK(throws_kind([]{ st::parse_options_json(R"({"skip_footer_lines": -2147483649})"); },
                       st::ErrorKind::ParameterError, "invalid-config"));
  {
    auto o = st::parse_options_json(R"({"skip_header_lines": 2147483647})");
    ST_CHECK(o.skip_header_lines == 2147483647);
  }

  // from a file
  {
    const fs::path p = fs::temp_directory_path() / "st_options.json";
    { std::ofstream out(p); out << R"({"skip_footer_lines": 3})"; }
    auto o = st::load_options_file(p.string());
    ST_CHECK(o.skip_footer_lines == 3);
    ST_CHECK(throws_kind([]{
      st::load_options_file((fs::temp_directory_path() / "st_no_options.json").string());
    }, st::ErrorKind::NotFound));
  }

  // run summary
  {
    st::RunSummary s;
    s.path = "dir/\"quoted\"\n.txt";
    s.encoding = "utf-8";
    s.mode = "stream";
    s.lines = 12; s.chunks = 2; s.bytes = 99; s.file_size = 99;
    s.wall_time_ms = std::numeric_limits<double>::infinity();
    s.full_buffer = true;
    const std::string json = st::RunSummaryWriter::to_json(s);
    ST_CHECK(json.find(R"("path":"dir/\"quoted\"\n.txt")") != std::string::npos);
    ST_CHECK(json.find(R"("lines":12)") != std::string::npos);
    ST_CHECK(json.find(R"("wall_time_ms":0)") != std::string::npos);
    ST_CHECK(json.find(R"("full_buffer":true)") != std::string::npos);

    // what we write must load back as JSON
    const fs::path out = fs::temp_directory_path() / "st_summary" / "run.json";
    std::string err;
    ST_CHECK(st::RunSummaryWriter::write_file(out.string(), s, &err));
    std::ifstream in(out);
    std::stringstream ss; ss << in.rdbuf();
    ST_CHECK(ss.str() == json);
    ST_CHECK(!throws_kind([&]{ st::parse_options_json(json); }, st::ErrorKind::ParameterError));
  }

  std::cout << "[PASS] reader config\n";
  return 0;
}
