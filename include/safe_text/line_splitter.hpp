#pragma once
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace st {

// Splits decoded text into logical lines. "\n", "\r\n" and "\r" are one break
// each; a break split across two push() calls is still one break.
class LineSplitter {
public:
  using LineCallback = std::function<void(std::string&&)>;

  void push(std::string_view text, const LineCallback& cb);

  // Emits the unterminated tail, if any.
  void finish(const LineCallback& cb);

  const std::string& pending() const noexcept { return tail_; }

private:
  std::string tail_;
  bool swallow_lf_{false}; // last break seen was '\r'
};

std::vector<std::string> split_lines(std::string_view text);

}
