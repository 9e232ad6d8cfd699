#pragma once
#include <cstddef>
#include <deque>
#include <string>
#include <string_view>

namespace st {

struct FilterConfig {
  std::size_t skip_header_lines = 0;
  std::size_t skip_footer_lines = 0;
  bool        skip_empty_lines  = false;
  bool        strip             = false;
};

// Holds back the last `capacity` lines. What is still inside at end of stream
// is the footer and gets dropped.
class FooterWindow {
public:
  explicit FooterWindow(std::size_t capacity) : cap_(capacity) {}

  // true when a line leaves the window through `released`.
  bool offer(std::string line, std::string& released);
  void discard() noexcept { q_.clear(); }

  std::size_t size() const noexcept { return q_.size(); }
  std::size_t capacity() const noexcept { return cap_; }

private:
  std::size_t cap_;
  std::deque<std::string> q_;
};

// header skip -> footer window -> empty-line drop -> strip
class LineFilter {
public:
  explicit LineFilter(const FilterConfig& cfg);

  // true when `out` holds a line for the consumer.
  bool accept(std::string line, std::string& out);

  // End of stream: the footer window is dropped.
  void finish() noexcept { footer_.discard(); }

  const FilterConfig& config() const noexcept { return cfg_; }

private:
  bool post_footer(std::string line, std::string& out) const;

  FilterConfig cfg_;
  std::size_t seen_{0};
  FooterWindow footer_;
};

// Unicode whitespace trim over UTF-8 text.
std::string_view strip_whitespace(std::string_view s) noexcept;
bool is_blank(std::string_view s) noexcept;

}
