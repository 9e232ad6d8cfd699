#pragma once
#include <cstdint>
#include <string>

namespace st {

struct RunSummary {
  std::string path;
  std::string encoding;
  std::string mode;              // read | lines | stream | preview | count

  std::uint64_t lines = 0;
  std::uint64_t chunks = 0;
  std::uint64_t bytes = 0;
  std::uint64_t file_size = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  bool full_buffer = false;      // codec probe picked the whole-file decode
};

class RunSummaryWriter {
public:
  static std::string to_json(const RunSummary& s);
  static bool write_file(const std::string& out_path, const RunSummary& s,
                         std::string* err_out = nullptr);
};

}
