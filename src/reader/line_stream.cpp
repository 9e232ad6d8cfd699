#include "safe_text/line_stream.hpp"
#include "safe_text/byte_source.hpp"
#include "safe_text/decoder.hpp"
#include "safe_text/errors.hpp"
#include "safe_text/line_splitter.hpp"

#include <deque>
#include <memory>

namespace st {

struct LineStream::Impl {
  std::string path;
  Config cfg;

  std::unique_ptr<ByteSource> src;
  std::unique_ptr<Decoder> dec;
  LineSplitter splitter;
  LineFilter filter;
  ChunkAssembler assembler;
  std::deque<Chunk> ready;
  std::string raw;

  bool started{false};
  bool done{false};
  bool full_buffer{false};
  std::uint64_t bytes{0};
  std::uint64_t lines{0};

  Impl(std::string p, Config c)
    : path(std::move(p)), cfg(std::move(c)),
      filter(cfg.filter), assembler(cfg.chunk_size) {}

  void on_line(std::string&& line) {
    std::string kept;
    if (!filter.accept(std::move(line), kept)) return;
    ++lines;
    Chunk full;
    if (assembler.add(std::move(kept), full)) ready.push_back(std::move(full));
  }

  void push_text(std::string_view text) {
    splitter.push(text, [this](std::string&& l) { on_line(std::move(l)); });
  }

  void close() noexcept {
    if (src) {
      bytes = src->bytes_read();
      src->close();
      src.reset();
    }
  }

  void end_of_source() {
    if (dec) push_text(dec->finish());
    splitter.finish([this](std::string&& l) { on_line(std::move(l)); });
    filter.finish();
    Chunk rest;
    if (assembler.flush(rest)) ready.push_back(std::move(rest));
    close();
    done = true;
  }

  // Opens the file and settles the codec plan from the first block.
  void start() {
    started = true;
    src = std::make_unique<ByteSource>(path, cfg.buffer_size);
    const bool any = src->next(raw);
    const CodecPlan plan = probe_codec(cfg.encoding, raw);

    if (plan.path == CodecPlan::Path::FullBuffer) {
      full_buffer = true;
      std::string all = std::move(raw);
      while (src->next(raw)) all.append(raw);
      close();
      push_text(decode_all(plan.codec, std::string_view(all).substr(plan.skip_bytes)));
      end_of_source();
      return;
    }

    dec = make_decoder(plan.codec);
    if (!any) { end_of_source(); return; }
    push_text(dec->feed(std::string_view(raw).substr(plan.skip_bytes)));
  }

  void pump() {
    if (!started) { start(); return; }
    if (src->next(raw)) {
      push_text(dec->feed(raw));
    } else {
      end_of_source();
    }
  }

  std::optional<Chunk> next() {
    while (ready.empty() && !done) {
      try {
        pump();
      } catch (...) {
        close();
        done = true;
        ready.clear();
        rethrow_mapped(path);
      }
    }
    if (ready.empty()) return std::nullopt;
    Chunk c = std::move(ready.front());
    ready.pop_front();
    return c;
  }
};

LineStream::LineStream(std::string path, Config cfg)
  : p_(new Impl(std::move(path), std::move(cfg))) {}

LineStream::~LineStream() {
  if (p_) p_->close();
  delete p_;
}

LineStream::LineStream(LineStream&& o) noexcept : p_(o.p_) { o.p_ = nullptr; }

LineStream& LineStream::operator=(LineStream&& o) noexcept {
  if (this != &o) {
    if (p_) p_->close();
    delete p_;
    p_ = o.p_;
    o.p_ = nullptr;
  }
  return *this;
}

std::optional<Chunk> LineStream::next() {
  if (!p_) return std::nullopt;
  return p_->next();
}

bool LineStream::for_each_chunk(const ChunkCallback& cb) {
  while (auto chunk = next()) {
    bool go = false;
    try {
      go = cb(*chunk);
    } catch (...) {
      close();
      throw;
    }
    if (!go) { close(); return false; }
  }
  return true;
}

void LineStream::close() noexcept {
  if (!p_) return;
  p_->close();
  p_->done = true;
  p_->ready.clear();
}

bool LineStream::is_open() const noexcept { return p_ && p_->src != nullptr; }
bool LineStream::exhausted() const noexcept { return !p_ || (p_->done && p_->ready.empty()); }
bool LineStream::full_buffer() const noexcept { return p_ && p_->full_buffer; }

std::uint64_t LineStream::bytes_read() const noexcept {
  if (!p_) return 0;
  return p_->src ? p_->src->bytes_read() : p_->bytes;
}

std::uint64_t LineStream::lines_emitted() const noexcept { return p_ ? p_->lines : 0; }

}
