#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/options.hpp"

using hrseed::config::ParseOptions;
using hrseed::config::ToolOptions;

namespace {

bool ExpectThrow(const std::vector<std::string>& args, const char* label) {
  try {
    (void)ParseOptions(args);
  } catch (const std::runtime_error&) {
    return true;
  }
  std::cerr << label << ": expected std::runtime_error\n";
  return false;
}

}  // namespace

int main() {
  {
    const auto opts = ParseOptions({"--no-conf", "toread", "s3cr3t"});
    if (opts.command != "toread" || opts.inputs != std::vector<std::string>{"s3cr3t"}) {
      std::cerr << "positional parsing failed\n";
      return 1;
    }
    if (!opts.verify || opts.verbose || !opts.normalize || opts.chunk_size.has_value()) {
      std::cerr << "unexpected defaults\n";
      return 1;
    }
  }

  {
    const auto opts = ParseOptions({"--no-conf", "--chunk-size=4", "--verbose", "--no-check",
                                    "--json", "--wordlist", "/tmp/w.txt", "toseed", "ant bee",
                                    "cat"});
    if (!opts.chunk_size || *opts.chunk_size != 4 || !opts.verbose || opts.verify ||
        !opts.json_output || opts.wordlist_path != "/tmp/w.txt") {
      std::cerr << "flag parsing failed\n";
      return 1;
    }
    if (opts.inputs != std::vector<std::string>{"ant bee", "cat"}) {
      std::cerr << "toseed inputs not preserved\n";
      return 1;
    }
  }

  {
    const auto opts = ParseOptions({"--no-conf", "toread", "--", "--not-a-flag"});
    if (opts.inputs != std::vector<std::string>{"--not-a-flag"}) {
      std::cerr << "'--' did not end option parsing\n";
      return 1;
    }
  }

  // The input right after the command is taken verbatim even when it
  // looks like a flag; later flags still apply.
  {
    auto opts = ParseOptions({"--no-conf", "toread", "--version"});
    if (opts.show_version || opts.inputs != std::vector<std::string>{"--version"}) {
      std::cerr << "flag-like seed was parsed as an option\n";
      return 1;
    }
    opts = ParseOptions({"--no-conf", "toread", "--a=b", "-v"});
    if (opts.inputs != std::vector<std::string>{"--a=b"} || !opts.verbose) {
      std::cerr << "seed with '=' was split or trailing flag ignored\n";
      return 1;
    }
    opts = ParseOptions({"--no-conf", "--wordlist", "-odd-name.txt", "toread", "-v"});
    if (opts.wordlist_path != "-odd-name.txt" || opts.verbose ||
        opts.inputs != std::vector<std::string>{"-v"}) {
      std::cerr << "option values or seed misclassified\n";
      return 1;
    }
  }

  if (!ParseOptions({"--no-conf", "version"}).show_version ||
      !ParseOptions({"--no-conf", "--version"}).show_version ||
      !ParseOptions({"--no-conf", "-h"}).show_help) {
    std::cerr << "version/help flags not recognised\n";
    return 1;
  }

  if (!ExpectThrow({"--no-conf", "--chunk-size", "0", "toread", "x"}, "chunk size 0")) return 1;
  if (!ExpectThrow({"--no-conf", "--chunk-size", "64", "toread", "x"}, "chunk size 64")) return 1;
  if (!ExpectThrow({"--no-conf", "--chunk-size", "4x", "toread", "x"}, "chunk size 4x")) return 1;
  if (!ExpectThrow({"--no-conf", "--wordlist"}, "missing value")) return 1;
  if (!ExpectThrow({"--no-conf", "--frobnicate", "toread", "x"}, "unknown flag")) return 1;
  if (!ExpectThrow({"--no-conf", "--log-level", "chatty", "toread", "x"}, "bad log level")) {
    return 1;
  }

  const auto dir = std::filesystem::temp_directory_path() / "hrseed_options_tests";
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);

  // Config file, then environment, then command line.
  {
    const auto conf = dir / "hrseed.conf";
    {
      std::ofstream out(conf, std::ios::trunc);
      out << "# sample\n"
          << "wordlist = /srv/words.txt\n"
          << "chunk-size=3\n"
          << "json\n"
          << "log-level = warn  # trailing comment\n";
    }
    auto opts = ParseOptions({"--conf", conf.string(), "toread", "x"});
    if (opts.wordlist_path != "/srv/words.txt" || !opts.chunk_size || *opts.chunk_size != 3 ||
        !opts.json_output || opts.log_level != "warn") {
      std::cerr << "config file values not applied\n";
      return 1;
    }

    ::setenv("HRSEED_CHUNK_SIZE", "5", 1);
    opts = ParseOptions({"--conf", conf.string(), "toread", "x"});
    if (*opts.chunk_size != 5) {
      std::cerr << "environment did not override config file\n";
      ::unsetenv("HRSEED_CHUNK_SIZE");
      return 1;
    }
    opts = ParseOptions({"--conf=" + conf.string(), "--chunk-size", "7", "toread", "x"});
    ::unsetenv("HRSEED_CHUNK_SIZE");
    if (*opts.chunk_size != 7) {
      std::cerr << "command line did not override environment\n";
      return 1;
    }
  }

  {
    const auto conf = dir / "bad.conf";
    {
      std::ofstream out(conf, std::ios::trunc);
      out << "verbose = 1\n"
          << "colour = blue\n";
    }
    try {
      (void)ParseOptions({"--conf", conf.string(), "toread", "x"});
      std::cerr << "unknown config key accepted\n";
      return 1;
    } catch (const std::runtime_error& ex) {
      const std::string what = ex.what();
      if (what.find(":2:") == std::string::npos) {
        std::cerr << "config error should name line 2: " << what << "\n";
        return 1;
      }
    }
  }

  if (!ExpectThrow({"--conf", (dir / "absent.conf").string(), "toread", "x"},
                   "explicit missing config")) {
    return 1;
  }

  std::filesystem::remove_all(dir, ec);
  std::cout << "options_tests: OK\n";
  return 0;
}
