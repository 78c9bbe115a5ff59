#include "minitest.hpp"
#include "app/Options.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace ssample::app;

// Point HOME at an empty scratch dir and clear SSAMPLE_* so the host
// environment cannot leak into option resolution.
static fs::path isolate_env(const char* suffix) {
  auto home = fs::temp_directory_path() / ("ssample_opts_" + std::to_string(::getpid()) + "_" + suffix);
  fs::remove_all(home);
  fs::create_directories(home);
  ::setenv("HOME", home.c_str(), 1);
  ::unsetenv("XDG_CONFIG_HOME");
  ::unsetenv("SSAMPLE_LINES");
  ::unsetenv("SSAMPLE_HTTP");
  ::unsetenv("SSAMPLE_ECHO");
  return home;
}

static ParseResult parse(std::initializer_list<const char*> args) {
  std::vector<const char*> argv{"ssample"};
  argv.insert(argv.end(), args.begin(), args.end());
  return parse_options(static_cast<int>(argv.size()), argv.data());
}

TEST(options_defaults) {
  auto home = isolate_env("defaults");
  auto r = parse({});
  ASSERT_TRUE(r.status == ParseStatus::Ok);
  ASSERT_EQ(r.options.lines, 100u);
  ASSERT_TRUE(r.options.http_listen.empty());
  ASSERT_TRUE(r.options.append_path.empty());
  ASSERT_TRUE(r.options.gzip_path.empty());
  ASSERT_FALSE(r.options.echo);
  ASSERT_TRUE(r.options.config_path.empty());
  fs::remove_all(home);
}

TEST(options_flag_forms) {
  auto home = isolate_env("forms");
  auto r = parse({"-l", "5", "--http", ":8080", "-a=/tmp/a.log", "-teez", "/tmp/t.gz", "-echo"});
  ASSERT_TRUE(r.status == ParseStatus::Ok);
  ASSERT_EQ(r.options.lines, 5u);
  ASSERT_EQ(r.options.http_listen, ":8080");
  ASSERT_EQ(r.options.append_path, "/tmp/a.log");
  ASSERT_EQ(r.options.gzip_path, "/tmp/t.gz");
  ASSERT_TRUE(r.options.echo);

  auto r2 = parse({"--l=7", "-echo=false"});
  ASSERT_TRUE(r2.status == ParseStatus::Ok);
  ASSERT_EQ(r2.options.lines, 7u);
  ASSERT_FALSE(r2.options.echo);
  fs::remove_all(home);
}

TEST(options_help) {
  auto home = isolate_env("help");
  ASSERT_TRUE(parse({"-h"}).status == ParseStatus::Help);
  ASSERT_TRUE(parse({"--help"}).status == ParseStatus::Help);
  ASSERT_TRUE(usage().find("-teez") != std::string::npos);
  fs::remove_all(home);
}

TEST(options_rejects_bad_input) {
  auto home = isolate_env("bad");
  ASSERT_TRUE(parse({"-l", "0"}).status == ParseStatus::Error);
  ASSERT_TRUE(parse({"-l", "-3"}).status == ParseStatus::Error);
  ASSERT_TRUE(parse({"-l", "ten"}).status == ParseStatus::Error);
  ASSERT_TRUE(parse({"-l", "10x"}).status == ParseStatus::Error);
  ASSERT_TRUE(parse({"-l"}).status == ParseStatus::Error);
  ASSERT_TRUE(parse({"-bogus"}).status == ParseStatus::Error);
  ASSERT_TRUE(parse({"stray"}).status == ParseStatus::Error);
  ASSERT_TRUE(parse({"-echo=maybe"}).status == ParseStatus::Error);
  auto r = parse({"-nope"});
  ASSERT_TRUE(r.error.find("nope") != std::string::npos);
  fs::remove_all(home);
}

TEST(options_env_fallback) {
  auto home = isolate_env("env");
  ::setenv("SSAMPLE_LINES", "42", 1);
  ::setenv("SSAMPLE_HTTP", "127.0.0.1:9999", 1);
  ::setenv("SSAMPLE_ECHO", "1", 1);
  auto r = parse({});
  ASSERT_EQ(r.options.lines, 42u);
  ASSERT_EQ(r.options.http_listen, "127.0.0.1:9999");
  ASSERT_TRUE(r.options.echo);
  // command line beats env
  auto r2 = parse({"-l", "3"});
  ASSERT_EQ(r2.options.lines, 3u);
  // unusable env value falls back to the default
  ::setenv("SSAMPLE_LINES", "lots", 1);
  ASSERT_EQ(parse({}).options.lines, 100u);
  isolate_env("env");
  fs::remove_all(home);
}

TEST(options_config_file_precedence) {
  auto home = isolate_env("config");
  auto dir = home / ".config" / "ssample";
  fs::create_directories(dir);
  std::ofstream(dir / "config.toml") <<
    "# sampler settings\n"
    "[sample]\n"
    "lines = 25   # keep 25\n"
    "\n"
    "[http]\n"
    "listen = \":7070\"\n"
    "\n"
    "[tee]\n"
    "append = \"/tmp/all # lines.log\"\n"
    "echo = true\n";
  ::setenv("SSAMPLE_LINES", "42", 1);

  auto r = parse({});
  ASSERT_TRUE(r.status == ParseStatus::Ok);
  ASSERT_EQ(r.options.config_path, (dir / "config.toml").string());
  ASSERT_EQ(r.options.lines, 25u);            // config beats env
  ASSERT_EQ(r.options.http_listen, ":7070");
  ASSERT_EQ(r.options.append_path, "/tmp/all # lines.log");
  ASSERT_TRUE(r.options.echo);

  auto r2 = parse({"-l", "9", "-http", ":1"});
  ASSERT_EQ(r2.options.lines, 9u);            // command line beats config
  ASSERT_EQ(r2.options.http_listen, ":1");
  isolate_env("config");
  fs::remove_all(home);
}

TEST(options_explicit_config) {
  auto home = isolate_env("explicit");
  auto file = home / "custom.toml";
  std::ofstream(file) << "[sample]\nlines = 12\n";
  auto r = parse({"--config", file.c_str()});
  ASSERT_TRUE(r.status == ParseStatus::Ok);
  ASSERT_EQ(r.options.lines, 12u);

  ASSERT_TRUE(parse({"--config", (home / "missing.toml").c_str()}).status == ParseStatus::Error);

  std::ofstream(file) << "[sample]\nlines = zero\n";
  ASSERT_TRUE(parse({"--config", file.c_str()}).status == ParseStatus::Error);
  fs::remove_all(home);
}

TEST(options_xdg_config_home) {
  auto home = isolate_env("xdg");
  auto xdg = home / "xdg";
  ::setenv("XDG_CONFIG_HOME", xdg.c_str(), 1);
  ASSERT_EQ(default_config_path(), (xdg / "ssample" / "config.toml").string());
  ::unsetenv("XDG_CONFIG_HOME");
  ASSERT_EQ(default_config_path(), (home / ".config" / "ssample" / "config.toml").string());
  fs::remove_all(home);
}
