#include "config/options.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "core/bit_packer.hpp"
#include "util/logging.hpp"
#include "util/strings.hpp"

namespace hrseed::config {

namespace {

std::optional<std::string> GetEnvValue(std::string_view name) {
  const char* value = std::getenv(std::string(name).c_str());
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

struct ArgToken {
  std::string text;
  // Never interpreted as an option: values, the seed after the command,
  // and everything after "--".
  bool literal{false};
};

constexpr std::string_view kValueFlags[] = {"--conf", "--wordlist", "--chunk-size",
                                            "--log-file", "--log-level"};

bool TakesValue(std::string_view flag) {
  for (auto candidate : kValueFlags) {
    if (candidate == flag) {
      return true;
    }
  }
  return false;
}

// Splits "--flag=value" into two tokens so both spellings parse the same,
// and marks tokens that must be taken verbatim. The first input after the
// command is a seed or word and may itself look like a flag.
std::vector<ArgToken> ExpandArgs(const std::vector<std::string>& raw) {
  std::vector<ArgToken> args;
  args.reserve(raw.size());
  bool options_done = false;
  bool value_expected = false;
  std::size_t positional = 0;
  for (const auto& token : raw) {
    if (options_done || value_expected) {
      args.push_back({token, true});
      value_expected = false;
      continue;
    }
    if (token == "--") {
      options_done = true;
      continue;
    }
    const bool looks_like_option = token.size() > 1 && token.front() == '-';
    if (!looks_like_option || positional == 1) {
      args.push_back({token, positional == 1});
      ++positional;
      continue;
    }
    const auto eq_pos = token.find('=');
    if (eq_pos != std::string::npos && token.rfind("--", 0) == 0) {
      args.push_back({token.substr(0, eq_pos), false});
      args.push_back({token.substr(eq_pos + 1), true});
    } else {
      args.push_back({token, false});
      value_expected = TakesValue(token);
    }
  }
  return args;
}

}  // namespace

bool ParseBool(std::string_view value) {
  const std::string lower = util::LowercaseAscii(value);
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    return false;
  }
  throw std::runtime_error("invalid boolean value: " + std::string(value));
}

unsigned ParseChunkSize(std::string_view value) {
  unsigned long parsed = 0;
  std::size_t consumed = 0;
  try {
    parsed = std::stoul(std::string(value), &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error("invalid chunk size: " + std::string(value));
  }
  if (consumed != value.size() || parsed < 1 || parsed > core::kMaxChunkBits) {
    throw std::runtime_error("invalid chunk size: " + std::string(value) + " (expected 1-" +
                             std::to_string(core::kMaxChunkBits) + ")");
  }
  return static_cast<unsigned>(parsed);
}

void ApplyConfigOption(const std::string& key, const std::string& value, ToolOptions* opts) {
  if (key == "wordlist") {
    opts->wordlist_path = value;
  } else if (key == "chunk-size" || key == "chunksize") {
    opts->chunk_size = ParseChunkSize(value);
  } else if (key == "verbose") {
    opts->verbose = ParseBool(value);
  } else if (key == "check") {
    opts->verify = ParseBool(value);
  } else if (key == "normalize") {
    opts->normalize = ParseBool(value);
  } else if (key == "json") {
    opts->json_output = ParseBool(value);
  } else if (key == "log-file" || key == "logfile") {
    opts->log_file = value;
  } else if (key == "log-level" || key == "loglevel") {
    (void)util::ParseLogLevelString(value);
    opts->log_level = value;
  } else {
    throw std::runtime_error("unknown option: " + key);
  }
}

void LoadConfigFile(const std::filesystem::path& path, ToolOptions* opts) {
  if (path.empty()) {
    return;
  }
  if (!std::filesystem::exists(path)) {
    return;
  }
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open config file: " + path.string());
  }
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.resize(comment_pos);
    }
    line = util::Trim(line);
    if (line.empty()) {
      continue;
    }
    std::string key;
    std::string value;
    const auto eq_pos = line.find_first_of("= ");
    if (eq_pos == std::string::npos) {
      key = line;
      value = "1";
    } else {
      key = util::Trim(line.substr(0, eq_pos));
      value = util::Trim(line.substr(eq_pos + 1));
      if (!value.empty() && value.front() == '=') {
        value = util::Trim(value.substr(1));
      }
      if (value.empty()) {
        value = "1";
      }
    }
    try {
      ApplyConfigOption(key, value, opts);
    } catch (const std::exception& ex) {
      throw std::runtime_error(path.string() + ":" + std::to_string(lineno) + ": " + ex.what());
    }
  }
}

void ApplyEnvironmentOverrides(ToolOptions* opts) {
  if (auto value = GetEnvValue("HRSEED_WORDLIST")) {
    opts->wordlist_path = std::move(*value);
  }
  if (auto value = GetEnvValue("HRSEED_CHUNK_SIZE")) {
    try {
      opts->chunk_size = ParseChunkSize(*value);
    } catch (const std::exception& ex) {
      throw std::runtime_error(std::string("HRSEED_CHUNK_SIZE: ") + ex.what());
    }
  }
  if (auto value = GetEnvValue("HRSEED_VERBOSE")) {
    opts->verbose = ParseBool(*value);
  }
  if (auto value = GetEnvValue("HRSEED_LOG_LEVEL")) {
    (void)util::ParseLogLevelString(*value);
    opts->log_level = std::move(*value);
  }
}

ToolOptions ParseOptions(const std::vector<std::string>& raw_args) {
  ToolOptions opts;
  const auto args = ExpandArgs(raw_args);
  auto ensure_value = [&](std::size_t& idx) -> std::string {
    if (idx + 1 >= args.size()) {
      throw std::runtime_error("missing value for " + args[idx].text);
    }
    return args[++idx].text;
  };

  // The config file location must be known before anything else applies.
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i].literal) {
      continue;
    }
    if (args[i].text == "--conf") {
      opts.config_path = ensure_value(i);
    } else if (args[i].text == "--no-conf") {
      opts.disable_config_file = true;
    }
  }
  if (!opts.disable_config_file) {
    const std::filesystem::path config_path = opts.config_path.empty()
                                                  ? std::filesystem::path(kDefaultConfigFile)
                                                  : std::filesystem::path(opts.config_path);
    if (!opts.config_path.empty() && !std::filesystem::exists(config_path)) {
      throw std::runtime_error("config file not found: " + config_path.string());
    }
    LoadConfigFile(config_path, &opts);
  }

  ApplyEnvironmentOverrides(&opts);

  std::vector<std::string> positional;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i].text;
    if (args[i].literal) {
      positional.push_back(arg);
    } else if (arg == "--help" || arg == "-h") {
      opts.show_help = true;
    } else if (arg == "--version") {
      opts.show_version = true;
    } else if (arg == "--conf") {
      ++i;
    } else if (arg == "--no-conf") {
      continue;
    } else if (arg == "--wordlist") {
      opts.wordlist_path = ensure_value(i);
    } else if (arg == "--chunk-size") {
      opts.chunk_size = ParseChunkSize(ensure_value(i));
    } else if (arg == "--verbose" || arg == "-v") {
      opts.verbose = true;
    } else if (arg == "--no-check") {
      opts.verify = false;
    } else if (arg == "--raw-wordlist") {
      opts.normalize = false;
    } else if (arg == "--json") {
      opts.json_output = true;
    } else if (arg == "--log-file") {
      opts.log_file = ensure_value(i);
    } else if (arg == "--log-level") {
      opts.log_level = ensure_value(i);
      (void)util::ParseLogLevelString(opts.log_level);
    } else if (arg.size() > 1 && arg.front() == '-') {
      throw std::runtime_error("unknown option: " + arg);
    } else {
      positional.push_back(arg);
    }
  }

  if (!positional.empty()) {
    opts.command = positional.front();
    opts.inputs.assign(positional.begin() + 1, positional.end());
  }
  if (opts.command == "version") {
    opts.show_version = true;
  }
  return opts;
}

ToolOptions ParseOptions(int argc, char** argv) {
  std::vector<std::string> args;
  args.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0);
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return ParseOptions(args);
}

}  // namespace hrseed::config
