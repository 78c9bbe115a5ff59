#pragma once
#include <cstddef>
#include <string>

namespace ssample::app {

struct Options {
  size_t lines{100};          // reservoir capacity
  std::string http_listen;    // empty: no HTTP exposure
  std::string append_path;    // tee input to this file (append)
  std::string gzip_path;      // tee input to this file (gzip, truncates)
  bool echo{false};           // tee input to stdout
  std::string config_path;    // file the settings were read from, if any
};

enum class ParseStatus { Ok, Help, Error };

struct ParseResult {
  ParseStatus status{ParseStatus::Ok};
  Options options;
  std::string error;
};

// Resolve options from argv, then the config file, then SSAMPLE_* env vars,
// then defaults (earlier sources win).
[[nodiscard]] ParseResult parse_options(int argc, const char* const* argv);

[[nodiscard]] std::string usage();

// $XDG_CONFIG_HOME/ssample/config.toml, else ~/.config/ssample/config.toml.
[[nodiscard]] std::string default_config_path();

} // namespace ssample::app
