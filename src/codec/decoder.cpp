#include "safe_text/decoder.hpp"
#include "safe_text/errors.hpp"

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <iconv.h>
#include <memory>
#include <system_error>

namespace st {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

bool starts_with(std::string_view s, std::string_view p) {
  return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
}

Error decoding_error(const std::string& codec, std::uint64_t offset, std::string what) {
  return Error(ErrorKind::DecodingError, "decoding",
               "cannot decode input as " + codec + " at byte " + std::to_string(offset),
               std::move(what));
}

// Length of the UTF-8 sequence starting at s[i] if it is complete and valid,
// 0 if it is a valid but truncated prefix reaching the end of s, -1 if invalid.
int utf8_seq(std::string_view s, std::size_t i) {
  const auto b = [&](std::size_t k) { return static_cast<unsigned char>(s[k]); };
  const unsigned char c = b(i);
  if (c < 0x80) return 1;

  int len;
  unsigned char lo = 0x80, hi = 0xBF; // range of the first continuation byte
  if (c >= 0xC2 && c <= 0xDF)      { len = 2; }
  else if (c >= 0xE0 && c <= 0xEF) { len = 3; if (c == 0xE0) lo = 0xA0; if (c == 0xED) hi = 0x9F; }
  else if (c >= 0xF0 && c <= 0xF4) { len = 4; if (c == 0xF0) lo = 0x90; if (c == 0xF4) hi = 0x8F; }
  else return -1;

  for (int k = 1; k < len; ++k) {
    if (i + k >= s.size()) return 0;
    const unsigned char cc = b(i + k);
    const unsigned char l = (k == 1) ? lo : 0x80;
    const unsigned char h = (k == 1) ? hi : 0xBF;
    if (cc < l || cc > h) return -1;
  }
  return len;
}

class Utf8Decoder final : public Decoder {
public:
  std::string feed(std::string_view bytes) override {
    std::string joined;
    std::string_view in = bytes;
    if (!carry_.empty()) {
      joined.reserve(carry_.size() + bytes.size());
      joined.append(carry_).append(bytes);
      in = joined;
    }
    const std::uint64_t base = consumed_ - carry_.size();
    carry_.clear();

    std::size_t i = 0;
    while (i < in.size()) {
      // ASCII run
      while (i < in.size() && static_cast<unsigned char>(in[i]) < 0x80) ++i;
      if (i == in.size()) break;
      const int n = utf8_seq(in, i);
      if (n < 0) {
        char hex[8];
        std::snprintf(hex, sizeof(hex), "0x%02x", static_cast<unsigned char>(in[i]));
        throw decoding_error(name_, base + i, std::string("invalid byte ") + hex);
      }
      if (n == 0) {
        carry_.assign(in.substr(i));
        break;
      }
      i += static_cast<std::size_t>(n);
    }
    consumed_ += bytes.size();
    return std::string(in.substr(0, i));
  }

  std::string finish() override {
    if (!carry_.empty()) {
      const std::uint64_t at = consumed_ - carry_.size();
      carry_.clear();
      throw decoding_error(name_, at, "truncated multi-byte sequence at end of input");
    }
    return {};
  }

  const std::string& name() const noexcept override { return name_; }

private:
  std::string name_{"utf-8"};
  std::string carry_;
  std::uint64_t consumed_{0};
};

class IconvDecoder final : public Decoder {
public:
  explicit IconvDecoder(std::string codec) : name_(std::move(codec)) {
    cd_ = iconv_open("UTF-8", name_.c_str());
    if (cd_ == reinterpret_cast<iconv_t>(-1)) {
      const int err = errno;
      auto orig = std::make_exception_ptr(
          std::system_error(err, std::generic_category(), "iconv_open"));
      throw Error(ErrorKind::EncodingError, "encoding-lookup",
                  "unknown or unsupported encoding: " + name_, {}, orig);
    }
  }
  ~IconvDecoder() override { iconv_close(cd_); }

  IconvDecoder(const IconvDecoder&) = delete;
  IconvDecoder& operator=(const IconvDecoder&) = delete;

  std::string feed(std::string_view bytes) override {
    std::string in;
    in.reserve(carry_.size() + bytes.size());
    in.append(carry_).append(bytes);
    const std::uint64_t base = consumed_ - carry_.size();
    carry_.clear();
    consumed_ += bytes.size();

    std::string out;
    out.resize(in.size() * 2 + 16);
    char* inp = in.data();
    std::size_t inleft = in.size();
    char* outp = out.data();
    std::size_t outleft = out.size();

    while (inleft > 0) {
      if (iconv(cd_, &inp, &inleft, &outp, &outleft) != static_cast<std::size_t>(-1)) break;
      const int err = errno;
      if (err == E2BIG) {
        const std::size_t used = static_cast<std::size_t>(outp - out.data());
        out.resize(out.size() * 2);
        outp = out.data() + used;
        outleft = out.size() - used;
        continue;
      }
      if (err == EINVAL) {                  // incomplete sequence at the end
        carry_.assign(inp, inleft);
        break;
      }
      const std::uint64_t at = base + static_cast<std::uint64_t>(inp - in.data());
      auto orig = std::make_exception_ptr(
          std::system_error(err, std::generic_category(), "iconv"));
      throw Error(ErrorKind::DecodingError, "decoding",
                  "cannot decode input as " + name_ + " at byte " + std::to_string(at),
                  "invalid multi-byte sequence", orig);
    }
    out.resize(static_cast<std::size_t>(outp - out.data()));
    return out;
  }

  std::string finish() override {
    if (!carry_.empty()) {
      const std::uint64_t at = consumed_ - carry_.size();
      carry_.clear();
      throw decoding_error(name_, at, "truncated multi-byte sequence at end of input");
    }
    // flush shift state for stateful codecs
    std::string out(32, '\0');
    char* outp = out.data();
    std::size_t outleft = out.size();
    if (iconv(cd_, nullptr, nullptr, &outp, &outleft) == static_cast<std::size_t>(-1)) {
      throw decoding_error(name_, consumed_, "cannot flush shift state");
    }
    out.resize(static_cast<std::size_t>(outp - out.data()));
    return out;
  }

  const std::string& name() const noexcept override { return name_; }

private:
  std::string name_;
  iconv_t cd_;
  std::string carry_;
  std::uint64_t consumed_{0};
};

bool is_byte_order_family(std::string_view n) {
  return n == "utf-16" || n == "utf-32" || n == "ucs-2" || n == "ucs-4";
}

// Without a BOM, UTF-16/32 text is read as little-endian.
std::string little_endian_codec(std::string_view family) {
  return (family == "utf-32" || family == "ucs-4") ? "utf-32le" : "utf-16le";
}

void require_codec(const std::string& codec) {
  if (codec == "utf-8") return;
  IconvDecoder probe(codec); // throws EncodingError when iconv does not know it
}

}

std::string normalize_codec_name(std::string_view name) {
  std::string n;
  n.reserve(name.size());
  for (char c : name) {
    if (c == '_') c = '-';
    n.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (n == "utf8" || n == "u8" || n == "utf") return "utf-8";
  if (n == "utf8-sig") return "utf-8-sig";
  if (n == "utf16") return "utf-16";
  if (n == "utf32") return "utf-32";
  if (n == "utf-16-le" || n == "utf16le" || n == "utf16-le") return "utf-16le";
  if (n == "utf-16-be" || n == "utf16be" || n == "utf16-be") return "utf-16be";
  if (n == "utf-32-le" || n == "utf32le" || n == "utf32-le") return "utf-32le";
  if (n == "utf-32-be" || n == "utf32be" || n == "utf32-be") return "utf-32be";
  if (n == "latin-1" || n == "latin1" || n == "l1" || n == "iso8859-1" || n == "iso-8859-1")
    return "iso-8859-1";
  if (n == "us-ascii" || n == "ascii") return "ascii";
  if (n == "windows-1252" || n == "cp-1252") return "cp1252";
  return n;
}

CodecPlan probe_codec(std::string_view encoding, std::string_view head) {
  const std::string n = normalize_codec_name(encoding);
  if (n.empty()) {
    throw Error(ErrorKind::EncodingError, "encoding-lookup", "empty encoding name");
  }

  CodecPlan plan;
  if (n == "utf-8-sig") {
    plan.codec = "utf-8";
    if (starts_with(head, kUtf8Bom)) plan.skip_bytes = kUtf8Bom.size();
    return plan;
  }

  if (is_byte_order_family(n)) {
    const bool wide = (n == "utf-32" || n == "ucs-4");
    const std::string base = wide ? "utf-32" : "utf-16";
    if (wide && starts_with(head, std::string_view("\xFF\xFE\x00\x00", 4))) {
      plan.codec = "utf-32le"; plan.skip_bytes = 4;
    } else if (wide && starts_with(head, std::string_view("\x00\x00\xFE\xFF", 4))) {
      plan.codec = "utf-32be"; plan.skip_bytes = 4;
    } else if (!wide && starts_with(head, "\xFF\xFE")) {
      plan.codec = "utf-16le"; plan.skip_bytes = 2;
    } else if (!wide && starts_with(head, "\xFE\xFF")) {
      plan.codec = "utf-16be"; plan.skip_bytes = 2;
    } else {
      plan.path = CodecPlan::Path::FullBuffer;
      plan.codec = base;
      return plan;
    }
    require_codec(plan.codec);
    return plan;
  }

  plan.codec = n;
  require_codec(plan.codec);
  return plan;
}

std::unique_ptr<Decoder> make_decoder(std::string_view codec) {
  const std::string n = normalize_codec_name(codec);
  if (n == "utf-8") return std::make_unique<Utf8Decoder>();
  if (is_byte_order_family(n)) {
    throw Error(ErrorKind::EncodingError, "encoding-not-incremental",
                "byte order of " + n + " is not known; decode the whole buffer instead");
  }
  return std::make_unique<IconvDecoder>(n);
}

std::string decode_all(std::string_view codec, std::string_view bytes) {
  std::string n = normalize_codec_name(codec);
  if (is_byte_order_family(n)) n = little_endian_codec(n);
  auto dec = make_decoder(n);
  std::string out = dec->feed(bytes);
  out += dec->finish();
  return out;
}

}
