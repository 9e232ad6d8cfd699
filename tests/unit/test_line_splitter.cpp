#include "safe_text/line_splitter.hpp"
#include <algorithm>
#include <iostream>
#include <random>
#include <string>
#include <vector>
#include "test_check.hpp"

using Lines = std::vector<std::string>;

static Lines split_in_pieces(const std::string& text, const std::vector<std::size_t>& cuts) {
  Lines out;
  st::LineSplitter sp;
  auto sink = [&](std::string&& s) { out.push_back(std::move(s)); };
  std::size_t prev = 0;
  for (std::size_t c : cuts) {
    sp.push(std::string_view(text).substr(prev, c - prev), sink);
    prev = c;
  }
  sp.push(std::string_view(text).substr(prev), sink);
  sp.finish(sink);
  return out;
}

int main(){
  ST_CHECK((st::split_lines("a\nb\n\nc") == Lines{"a", "b", "", "c"}));
  ST_CHECK((st::split_lines("a\nb\n") == Lines{"a", "b"}));
  ST_CHECK((st::split_lines("a\r\nb\rc\n") == Lines{"a", "b", "c"}));
  ST_CHECK((st::split_lines("\n") == Lines{""}));
  ST_CHECK((st::split_lines("\r\n\r\n") == Lines{"", ""}));
  ST_CHECK((st::split_lines("\n\r") == Lines{"", ""}));
  ST_CHECK(st::split_lines("").empty());
  ST_CHECK((st::split_lines("no newline") == Lines{"no newline"}));

  // CRLF split across two pushes is one break
  ST_CHECK((split_in_pieces("a\r\nb", {2}) == Lines{"a", "b"}));
  ST_CHECK((split_in_pieces("a\r\r\nb", {2, 3}) == Lines{"a", "", "b"}));
  ST_CHECK((split_in_pieces("a\r", {2}) == Lines{"a"}));
  // a boundary right after a newline must not add a line
  ST_CHECK((split_in_pieces("a\nb\n", {2, 4}) == Lines{"a", "b"}));
  ST_CHECK((split_in_pieces("abc", {0, 1, 1, 2}) == Lines{"abc"}));

  // pending tail never holds a break
  {
    st::LineSplitter sp;
    Lines got;
    sp.push("x\r", [&](std::string&& s){ got.push_back(std::move(s)); });
    ST_CHECK(sp.pending().empty());
    sp.push("\nyy", [&](std::string&& s){ got.push_back(std::move(s)); });
    ST_CHECK(sp.pending() == "yy");
    ST_CHECK((got == Lines{"x"}));
  }

  // every way of cutting the text gives the same lines
  std::mt19937 rng(20240611);
  const char alphabet[] = {'a', 'b', ' ', '\n', '\r'};
  for (int iter = 0; iter < 3000; ++iter) {
    std::string text;
    const int len = static_cast<int>(rng() % 64);
    for (int i = 0; i < len; ++i) text.push_back(alphabet[rng() % sizeof(alphabet)]);
    const Lines whole = st::split_lines(text);

    std::vector<std::size_t> cuts;
    const int ncut = static_cast<int>(rng() % 6);
    for (int k = 0; k < ncut; ++k) cuts.push_back(text.empty() ? 0 : rng() % (text.size() + 1));
    std::sort(cuts.begin(), cuts.end());

    if (split_in_pieces(text, cuts) != whole) {
      std::cerr << "[FAIL] split differs for iter=" << iter << "\n";
      return 1;
    }
  }

  std::cout << "[PASS] line splitter\n";
  return 0;
}
