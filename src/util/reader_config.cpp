#include "safe_text/reader_config.hpp"
#include "safe_text/byte_source.hpp"
#include "safe_text/errors.hpp"

#include <simdjson.h>
#include <cstdint>
#include <limits>
#include <string>

namespace st {

static Error config_error(const std::string& what, simdjson::error_code ec) {
  return Error(ErrorKind::ParameterError, "invalid-config", what,
               simdjson::error_message(ec));
}

static Error range_error(std::string_view key, const std::string& got) {
  return Error(ErrorKind::ParameterError, "invalid-config",
               std::string(key) + " is out of range", "got " + got);
}

TextFileReader::Options parse_options_json(std::string_view json,
                                           TextFileReader::Options base) {
  simdjson::ondemand::parser parser;
  simdjson::padded_string padded(json);

  simdjson::ondemand::document doc;
  if (auto ec = parser.iterate(padded).get(doc)) throw config_error("options are not valid JSON", ec);

  simdjson::ondemand::object obj;
  if (auto ec = doc.get_object().get(obj)) throw config_error("options must be a JSON object", ec);

  for (auto field : obj) {
    std::string_view key;
    if (auto ec = field.unescaped_key().get(key)) throw config_error("bad key in options", ec);
    simdjson::ondemand::value v;
    if (auto ec = field.value().get(v)) throw config_error("bad value for " + std::string(key), ec);

    auto want_bool = [&](bool& out) {
      bool b = false;
      if (auto ec = v.get_bool().get(b)) throw config_error(std::string(key) + " must be a boolean", ec);
      out = b;
    };
    auto want_int = [&](int& out) {
      std::int64_t i = 0;
      if (auto ec = v.get_int64().get(i)) throw config_error(std::string(key) + " must be an integer", ec);
      if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max()) {
        throw range_error(key, std::to_string(i));
      }
      out = static_cast<int>(i);
    };
    auto want_size = [&](std::size_t& out) {
      std::uint64_t u = 0;
      if (auto ec = v.get_uint64().get(u)) throw config_error(std::string(key) + " must be a non-negative integer", ec);
      if constexpr (sizeof(std::size_t) < sizeof(std::uint64_t)) {
        if (u > std::numeric_limits<std::size_t>::max()) throw range_error(key, std::to_string(u));
      }
      out = static_cast<std::size_t>(u);
    };

    if (key == "encoding") {
      std::string_view s;
      if (auto ec = v.get_string().get(s)) throw config_error("encoding must be a string", ec);
      base.encoding.assign(s.data(), s.size());
    }
    else if (key == "strip")             want_bool(base.strip);
    else if (key == "skip_empty_lines")  want_bool(base.skip_empty_lines);
    else if (key == "skip_header_lines") want_int(base.skip_header_lines);
    else if (key == "skip_footer_lines") want_int(base.skip_footer_lines);
    else if (key == "chunk_size")        want_size(base.chunk_size);
    else if (key == "buffer_size")       want_size(base.buffer_size);
    // anything else is ignored
  }
  return base;
}

TextFileReader::Options load_options_file(const std::string& path,
                                          TextFileReader::Options base) {
  const std::string json = read_all_bytes(path, 0);
  return parse_options_json(json, std::move(base));
}

}
