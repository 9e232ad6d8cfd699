#pragma once
#include "safe_text/text_reader.hpp"

#include <string>
#include <string_view>

namespace st {

// Overlays keys from a JSON object onto `base`. Keys mirror Options field
// names; unknown keys are ignored. Throws ParameterError("invalid-config").
TextFileReader::Options parse_options_json(std::string_view json,
                                           TextFileReader::Options base = {});

TextFileReader::Options load_options_file(const std::string& path,
                                          TextFileReader::Options base = {});

}
