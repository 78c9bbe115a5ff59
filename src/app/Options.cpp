#include "app/Options.hpp"
#include "util/TomlReader.hpp"
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string_view>

namespace ssample::app {

namespace {

struct CliValues {
  std::optional<std::string> lines;
  std::optional<std::string> http;
  std::optional<std::string> append;
  std::optional<std::string> gzip;
  std::optional<bool> echo;
  std::optional<std::string> config;
};

const char* getenv_nonempty(const char* name) {
  const char* v = std::getenv(name);
  return (v && *v) ? v : nullptr;
}

std::optional<long long> parse_int(std::string_view s) {
  long long out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

std::optional<bool> parse_bool(std::string_view s) {
  if (s == "1" || s == "t" || s == "T" || s == "true" || s == "True" || s == "TRUE") return true;
  if (s == "0" || s == "f" || s == "F" || s == "false" || s == "False" || s == "FALSE") return false;
  return std::nullopt;
}

ParseResult fail(std::string msg) {
  ParseResult r;
  r.status = ParseStatus::Error;
  r.error = std::move(msg);
  return r;
}

} // namespace

std::string usage() {
  return
    "Usage: ssample [flags] < input\n"
    "Keep a uniform random sample of the lines read from stdin; print it when\n"
    "input ends or on SIGINT/SIGTERM.\n"
    "\n"
    "  -l N            keep this many lines, uniformly sampled across all input (default 100)\n"
    "  -http ADDR      host:port (or :port) to serve the current sample over HTTP\n"
    "  -a PATH         also append all input to PATH\n"
    "  -teez PATH      also write all input to PATH (gzipped)\n"
    "  -echo           also write all lines to stdout as they are read\n"
    "  --config PATH   read settings from PATH (default: ~/.config/ssample/config.toml)\n"
    "  -h, --help      show this help\n"
    "\n"
    "HTTP: GET /        JSON {\"lines\":[...],\"lineNumbers\":[...],\"seen\":N}\n"
    "      GET /?t=1    <lineNumber>\\t<line> per line\n"
    "      GET /?p=1    <line> per line\n"
    "Env: SSAMPLE_LINES, SSAMPLE_HTTP, SSAMPLE_ECHO\n";
}

std::string default_config_path() {
  if (const char* xdg = getenv_nonempty("XDG_CONFIG_HOME"))
    return std::string(xdg) + "/ssample/config.toml";
  if (const char* home = getenv_nonempty("HOME"))
    return std::string(home) + "/.config/ssample/config.toml";
  return {};
}

ParseResult parse_options(int argc, const char* const* argv) {
  CliValues cli;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg.size() < 2 || arg[0] != '-') return fail("unexpected argument '" + std::string(arg) + "'");
    std::string_view body = arg.substr(arg.starts_with("--") ? 2 : 1);
    std::optional<std::string_view> inline_val;
    if (auto eq = body.find('='); eq != std::string_view::npos) {
      inline_val = body.substr(eq + 1);
      body = body.substr(0, eq);
    }

    if (body == "h" || body == "help") {
      ParseResult r;
      r.status = ParseStatus::Help;
      return r;
    }
    if (body == "echo") {
      if (!inline_val) { cli.echo = true; continue; }
      auto b = parse_bool(*inline_val);
      if (!b) return fail("invalid boolean value '" + std::string(*inline_val) + "' for -echo");
      cli.echo = *b;
      continue;
    }

    std::optional<std::string>* slot = nullptr;
    if (body == "l") slot = &cli.lines;
    else if (body == "http") slot = &cli.http;
    else if (body == "a") slot = &cli.append;
    else if (body == "teez") slot = &cli.gzip;
    else if (body == "config") slot = &cli.config;
    else return fail("flag provided but not defined: -" + std::string(body));

    if (inline_val) {
      *slot = std::string(*inline_val);
    } else if (i + 1 < argc) {
      *slot = std::string(argv[++i]);
    } else {
      return fail("flag needs an argument: -" + std::string(body));
    }
  }

  ParseResult r;
  Options& o = r.options;

  // config file: explicit path must exist, default path is optional
  util::TomlReader toml;
  bool have_toml = false;
  if (cli.config) {
    if (!toml.load(*cli.config)) return fail("cannot read config file " + *cli.config);
    o.config_path = *cli.config;
    have_toml = true;
  } else {
    std::string def = default_config_path();
    std::error_code ec;
    if (!def.empty() && std::filesystem::exists(def, ec) && toml.load(def)) {
      o.config_path = def;
      have_toml = true;
    }
  }

  // capacity: CLI -> config -> env -> default
  if (cli.lines) {
    auto n = parse_int(*cli.lines);
    if (!n || *n <= 0) return fail("invalid value '" + *cli.lines + "' for -l: want a positive integer");
    o.lines = static_cast<size_t>(*n);
  } else if (have_toml && toml.has("sample", "lines")) {
    auto n = toml.get_int("sample", "lines");
    if (!n || *n <= 0) return fail(o.config_path + ": sample.lines must be a positive integer");
    o.lines = static_cast<size_t>(*n);
  } else if (const char* env = getenv_nonempty("SSAMPLE_LINES")) {
    auto n = parse_int(env);
    if (n && *n > 0) o.lines = static_cast<size_t>(*n);
    else std::fprintf(stderr, "ssample: ignoring SSAMPLE_LINES='%s' (want a positive integer)\n", env);
  }

  if (cli.http) o.http_listen = *cli.http;
  else if (have_toml && toml.has("http", "listen")) o.http_listen = *toml.get_string("http", "listen");
  else if (const char* env = getenv_nonempty("SSAMPLE_HTTP")) o.http_listen = env;

  if (cli.append) o.append_path = *cli.append;
  else if (have_toml && toml.has("tee", "append")) o.append_path = *toml.get_string("tee", "append");

  if (cli.gzip) o.gzip_path = *cli.gzip;
  else if (have_toml && toml.has("tee", "gzip")) o.gzip_path = *toml.get_string("tee", "gzip");

  if (cli.echo) {
    o.echo = *cli.echo;
  } else if (have_toml && toml.has("tee", "echo")) {
    auto b = toml.get_bool("tee", "echo");
    if (!b) return fail(o.config_path + ": tee.echo must be true or false");
    o.echo = *b;
  } else if (const char* env = getenv_nonempty("SSAMPLE_ECHO")) {
    o.echo = parse_bool(env).value_or(false);
  }

  return r;
}

} // namespace ssample::app
