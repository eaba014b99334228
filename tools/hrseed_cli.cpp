#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/build_info.hpp"
#include "config/options.hpp"
#include "core/codec.hpp"
#include "core/errors.hpp"
#include "nlohmann/json.hpp"
#include "util/logging.hpp"
#include "util/strings.hpp"
#include "wordlist/wordlist_source.hpp"

namespace {

constexpr int kExitUserError = 1;
constexpr int kExitInternalError = 2;

void PrintUsage() {
  std::cout << "Usage: hrseed [options] <command> <input>\n"
            << "Commands:\n"
            << "  toread <seed>                 Convert an ASCII seed to words\n"
            << "  toseed \"<word1> <word2> ...\"  Convert words back to the seed\n"
            << "  version                       Print the package version\n"
            << "Options:\n"
            << "  --wordlist <path>   Wordlist file (one word per line, or .json array)\n"
            << "  --chunk-size <n>    Bits per word (default: floor(log2(wordlist size)))\n"
            << "  --raw-wordlist      Use the wordlist as-is (no filtering, title-case, sort)\n"
            << "  --no-check          Skip the round-trip self check\n"
            << "  --json              Print a JSON object instead of plain text\n"
            << "  --verbose, -v       Print chunk diagnostics to stderr\n"
            << "  --log-file <path>   Append log lines to a file\n"
            << "  --log-level <lvl>   debug|info|warn|error for the log file\n"
            << "  --conf <path>       Config file (default: " << hrseed::config::kDefaultConfigFile
            << ")\n"
            << "  --no-conf           Ignore the config file\n"
            << "  --version           Print the package version\n"
            << "  --help, -h          Show this help\n"
            << "The first input after the command is never read as an option; use\n"
            << "'--' to pass further inputs that start with '-'.\n";
}

void ConfigureLogging(const hrseed::config::ToolOptions& opts) {
  auto& logger = hrseed::util::GlobalLogger();
  logger.EnableConsole(opts.verbose ? hrseed::util::LogLevel::kDebug
                                    : hrseed::util::LogLevel::kWarn);
  if (!opts.log_file.empty()) {
    logger.EnableFile(opts.log_file, hrseed::util::ParseLogLevelString(opts.log_level));
  }
}

std::vector<std::string> LoadWords(const hrseed::config::ToolOptions& opts) {
  if (opts.wordlist_path.empty()) {
    if (!opts.normalize) {
      hrseed::util::LogWarn("--raw-wordlist has no effect on the default wordlist");
    }
    return hrseed::wordlist::DefaultWordlist();
  }
  auto words = hrseed::wordlist::LoadWordlistFile(opts.wordlist_path);
  if (opts.normalize) {
    return hrseed::wordlist::NormalizeWordlist(words);
  }
  return words;
}

hrseed::core::Codec BuildCodec(const hrseed::config::ToolOptions& opts) {
  hrseed::core::CodecOptions codec_opts;
  codec_opts.chunk_size = opts.chunk_size;
  codec_opts.verify = opts.verify;
  codec_opts.title_case_input = opts.normalize;
  codec_opts.verbose = opts.verbose;
  return hrseed::core::Codec(LoadWords(opts), codec_opts);
}

int RunToRead(const hrseed::config::ToolOptions& opts, const hrseed::core::Codec& codec) {
  if (opts.inputs.size() != 1) {
    throw std::runtime_error("toread expects exactly one seed argument (quote seeds with spaces)");
  }
  const std::string& seed = opts.inputs.front();
  const auto words = codec.SeedToHuman(seed);
  if (opts.json_output) {
    nlohmann::json out;
    out["seed"] = seed;
    out["words"] = words;
    out["chunk_size"] = codec.ChunkSize();
    out["padding"] = codec.Index().IndexOf(words.front());
    std::cout << out.dump(2) << "\n";
  } else {
    std::cout << hrseed::core::JoinWords(words) << "\n";
  }
  return EXIT_SUCCESS;
}

int RunToSeed(const hrseed::config::ToolOptions& opts, const hrseed::core::Codec& codec) {
  std::vector<std::string> words;
  for (const auto& input : opts.inputs) {
    for (auto& word : hrseed::util::SplitWhitespace(input)) {
      words.push_back(std::move(word));
    }
  }
  const std::string seed = codec.HumanToSeed(words);
  if (opts.json_output) {
    nlohmann::json out;
    out["seed"] = seed;
    out["words"] = words;
    out["chunk_size"] = codec.ChunkSize();
    std::cout << out.dump(2) << "\n";
  } else {
    std::cout << seed << "\n";
  }
  return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const auto opts = hrseed::config::ParseOptions(argc, argv);
    if (opts.show_help) {
      PrintUsage();
      return EXIT_SUCCESS;
    }
    if (opts.show_version) {
      std::cout << hrseed::config::kPackageName << " version: "
                << hrseed::config::kPackageVersion << "\n";
      return EXIT_SUCCESS;
    }
    if (opts.command.empty()) {
      PrintUsage();
      return kExitUserError;
    }
    if (opts.command != "toread" && opts.command != "toseed") {
      std::cerr << "hrseed: invalid action '" << opts.command << "'. Use 'toseed' or 'toread'.\n";
      PrintUsage();
      return kExitUserError;
    }
    ConfigureLogging(opts);
    hrseed::util::LogDebug(std::string("hrseed ") + hrseed::config::kPackageVersion +
                           " command=" + opts.command +
                           " wordlist=" + (opts.wordlist_path.empty() ? "<default>"
                                                                      : opts.wordlist_path));

    const auto codec = BuildCodec(opts);
    if (opts.command == "toread") {
      return RunToRead(opts, codec);
    }
    return RunToSeed(opts, codec);
  } catch (const hrseed::core::CodecError& ex) {
    if (hrseed::core::IsInternalError(ex.kind())) {
      hrseed::util::LogError(std::string("internal consistency failure: ") + ex.what());
      std::cerr << "hrseed: fatal: " << hrseed::core::ErrorKindName(ex.kind()) << ": " << ex.what()
                << "\n";
      return kExitInternalError;
    }
    std::cerr << "hrseed: " << hrseed::core::ErrorKindName(ex.kind()) << ": " << ex.what() << "\n";
    return kExitUserError;
  } catch (const std::exception& ex) {
    std::cerr << "hrseed: " << ex.what() << "\n";
    return kExitUserError;
  }
}
