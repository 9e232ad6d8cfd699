#include "safe_text/line_splitter.hpp"

namespace st {

void LineSplitter::push(std::string_view text, const LineCallback& cb) {
  std::size_t i = 0;
  if (swallow_lf_ && !text.empty()) {
    if (text[0] == '\n') i = 1;  // second half of a CRLF split across blocks
    swallow_lf_ = false;
  }

  std::size_t start = i;
  while (i < text.size()) {
    const char c = text[i];
    if (c != '\n' && c != '\r') { ++i; continue; }

    std::string line;
    if (!tail_.empty()) { line.swap(tail_); }
    line.append(text.substr(start, i - start));
    cb(std::move(line));

    ++i;
    if (c == '\r') {
      if (i < text.size()) {
        if (text[i] == '\n') ++i;
      } else {
        swallow_lf_ = true;  // the '\n' may be the first byte of the next block
      }
    }
    start = i;
  }
  tail_.append(text.substr(start));
}

void LineSplitter::finish(const LineCallback& cb) {
  swallow_lf_ = false;
  if (tail_.empty()) return;
  std::string line;
  line.swap(tail_);
  cb(std::move(line));
}

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  LineSplitter sp;
  auto sink = [&](std::string&& s) { out.push_back(std::move(s)); };
  sp.push(text, sink);
  sp.finish(sink);
  return out;
}

}
