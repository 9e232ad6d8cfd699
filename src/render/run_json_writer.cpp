#include "safe_text/run_json.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace st {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
          o << buf;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunSummaryWriter::to_json(const RunSummary& s) {
  std::ostringstream o;
  o << "{";
  o << "\"path\":";     esc(o, s.path);     o << ",";
  o << "\"encoding\":"; esc(o, s.encoding); o << ",";
  o << "\"mode\":";     esc(o, s.mode);     o << ",";
  o << "\"lines\":" << s.lines << ",";
  o << "\"chunks\":" << s.chunks << ",";
  o << "\"bytes\":" << s.bytes << ",";
  o << "\"file_size\":" << s.file_size << ",";
  o << "\"wall_time_ms\":" << safe_num(s.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(s.throughput_mb_s) << ",";
  o << "\"full_buffer\":" << (s.full_buffer ? "true" : "false");
  o << "}";
  return o.str();
}

bool RunSummaryWriter::write_file(const std::string& out_path, const RunSummary& s,
                                  std::string* err_out) {
  const std::filesystem::path p(out_path);
  std::error_code ec;
  if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
  if (ec) {
    if (err_out) *err_out = "cannot create " + p.parent_path().string() + ": " + ec.message();
    return false;
  }
  std::ofstream out(p, std::ios::binary);
  if (!out) {
    if (err_out) *err_out = "failed to open " + out_path;
    return false;
  }
  const std::string json = to_json(s);
  out.write(json.data(), static_cast<std::streamsize>(json.size()));
  if (!out) {
    if (err_out) *err_out = "failed to write " + out_path;
    return false;
  }
  return true;
}

}
