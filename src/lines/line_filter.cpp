#include "safe_text/line_filter.hpp"

namespace st {

namespace {

// Byte length of the whitespace code point at s[i], or 0.
std::size_t ws_at(std::string_view s, std::size_t i) noexcept {
  const auto b = [&](std::size_t k) { return static_cast<unsigned char>(s[k]); };
  const unsigned char c = b(i);
  if (c == ' ' || (c >= 0x09 && c <= 0x0D) || (c >= 0x1C && c <= 0x1F)) return 1;
  if (c == 0xC2 && i + 1 < s.size()) {
    const unsigned char d = b(i + 1);
    return (d == 0x85 || d == 0xA0) ? 2 : 0;                       // U+0085 U+00A0
  }
  if (c == 0xE1 && i + 2 < s.size()) {
    return (b(i + 1) == 0x9A && b(i + 2) == 0x80) ? 3 : 0;         // U+1680
  }
  if (c == 0xE2 && i + 2 < s.size()) {
    const unsigned char d = b(i + 1), e = b(i + 2);
    if (d == 0x80 && (e <= 0x8A || e == 0xA8 || e == 0xA9 || e == 0xAF)) return 3; // U+2000-200A 2028 2029 202F
    if (d == 0x81 && e == 0x9F) return 3;                          // U+205F
    return 0;
  }
  if (c == 0xE3 && i + 2 < s.size()) {
    return (b(i + 1) == 0x80 && b(i + 2) == 0x80) ? 3 : 0;         // U+3000
  }
  return 0;
}

// Byte length of the whitespace code point ending at s[end-1], or 0.
std::size_t ws_before(std::string_view s, std::size_t end) noexcept {
  for (std::size_t len = 1; len <= 3 && len <= end; ++len) {
    const std::size_t at = end - len;
    if (ws_at(s, at) == len) return len;
  }
  return 0;
}

}

std::string_view strip_whitespace(std::string_view s) noexcept {
  std::size_t b = 0, e = s.size();
  while (b < e) {
    const std::size_t n = ws_at(s, b);
    if (n == 0) break;
    b += n;
  }
  while (e > b) {
    const std::size_t n = ws_before(s, e);
    if (n == 0) break;
    e -= n;
  }
  return s.substr(b, e - b);
}

bool is_blank(std::string_view s) noexcept { return strip_whitespace(s).empty(); }

bool FooterWindow::offer(std::string line, std::string& released) {
  if (cap_ == 0) {
    released = std::move(line);
    return true;
  }
  q_.push_back(std::move(line));
  if (q_.size() <= cap_) return false;
  released = std::move(q_.front());
  q_.pop_front();
  return true;
}

LineFilter::LineFilter(const FilterConfig& cfg)
  : cfg_(cfg), footer_(cfg.skip_footer_lines) {}

bool LineFilter::accept(std::string line, std::string& out) {
  if (seen_ < cfg_.skip_header_lines) {
    ++seen_;
    return false;
  }
  std::string released;
  if (!footer_.offer(std::move(line), released)) return false;
  return post_footer(std::move(released), out);
}

bool LineFilter::post_footer(std::string line, std::string& out) const {
  const std::string_view trimmed = strip_whitespace(line);
  if (cfg_.skip_empty_lines && trimmed.empty()) return false;
  if (cfg_.strip && trimmed.size() != line.size()) {
    out.assign(trimmed.data(), trimmed.size());
  } else {
    out = std::move(line);
  }
  return true;
}

}
