#include "safe_text/text_reader.hpp"
#include "safe_text/errors.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using Lines = std::vector<std::string>;

static bool expected_ok_for(const fs::path& p) {
  const std::string n = p.filename().string();
  if (n.find("bad") != std::string::npos) return false;
  return true;
}

static std::string show_snippet(std::string_view s, size_t max = 180) {
  std::string out; out.reserve(s.size());
  auto push_hex = [&](unsigned char c){
    const char *hex = "0123456789ABCDEF";
    out += "\\x"; out += hex[c>>4]; out += hex[c&0xF];
  };
  for (unsigned char c : s) {
    if (c == '\n') { out += "\\n"; }
    else if (c == '\r') { out += "\\r"; }
    else if (c == '\t') { out += "\\t"; }
    else if (c < 0x20 || c == 0x7f) { push_hex(c); }
    else { out.push_back(static_cast<char>(c)); }
    if (out.size() >= max) { out += "..."; break; }
  }
  return out;
}

struct Res {
  bool ok{true};          // both paths succeeded
  bool agree{true};       // and produced the same lines
  uint64_t lines{0};
  uint64_t chunks{0};
  std::string err;
  std::string first_diff;
};

static Res run_one(const fs::path& f, const st::TextFileReader::Options& o) {
  Res r;
  st::TextFileReader reader(f.string(), o);
  Lines full, streamed;
  try {
    full = reader.read_all_lines();
  } catch (const st::Error& e) {
    r.ok = false;
    r.err = std::string(st::error_kind_name(e.kind())) + ": " + e.what();
  }
  try {
    auto s = reader.stream_chunks();
    while (auto c = s.next()) {
      ++r.chunks;
      streamed.insert(streamed.end(), c->begin(), c->end());
    }
  } catch (const st::Error& e) {
    if (r.ok) r.err = std::string(st::error_kind_name(e.kind())) + ": " + e.what();
    r.ok = false;
  }
  if (!r.ok) return r;

  r.lines = full.size();
  r.agree = (full == streamed);
  if (!r.agree) {
    for (size_t i = 0; i < std::max(full.size(), streamed.size()); ++i) {
      const std::string a = i < full.size() ? full[i] : "<none>";
      const std::string b = i < streamed.size() ? streamed[i] : "<none>";
      if (a != b) {
        r.first_diff = "line " + std::to_string(i + 1) + ": full=" + show_snippet(a) + " stream=" + show_snippet(b);
        break;
      }
    }
  }
  return r;
}

int main(int argc, char** argv){
  fs::path dir = (argc > 1) ? fs::path(argv[1]) : fs::path("tests/data");
  if (!fs::exists(dir)) {
    std::cerr << "[ERR] fixtures dir not found: " << dir << "\n";
    return 2;
  }

  std::vector<st::TextFileReader::Options> variants(4);
  variants[1].strip = true;
  variants[2].skip_empty_lines = true;
  variants[2].chunk_size = 1;
  variants[3].skip_header_lines = 1;
  variants[3].skip_footer_lines = 1;
  variants[3].encoding = "utf-8-sig";

  size_t total=0, passed=0, failed=0;
  for (auto& it : fs::directory_iterator(dir)) {
    if (!it.is_regular_file()) continue;
    const fs::path p = it.path();
    const bool expect_ok = expected_ok_for(p);

    for (size_t v = 0; v < variants.size(); ++v) {
      const Res r = run_one(p, variants[v]);
      const bool verdict = (r.ok == expect_ok) && r.agree;

      ++total; verdict ? ++passed : ++failed;

      if (verdict) {
        std::cout << "[PASS] " << p.filename().string()
                  << "  variant=" << v
                  << "  lines=" << r.lines
                  << "  chunks=" << r.chunks
                  << "  expected_ok=" << (expect_ok?"true":"false") << "\n";
      } else {
        std::cout << "[FAIL] " << p.filename().string()
                  << "  variant=" << v
                  << "  expected_ok=" << (expect_ok?"true":"false")
                  << "  actual_ok=" << (r.ok?"true":"false") << "\n";
        if (!r.err.empty())
          std::cout << "       error: " << r.err << "\n";
        if (!r.first_diff.empty())
          std::cout << "       " << r.first_diff << "\n";
      }
    }
  }

  std::cout << "\nSummary: total=" << total << " passed=" << passed << " failed=" << failed << "\n";
  return failed == 0 ? 0 : 1;
}
