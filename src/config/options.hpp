#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hrseed::config {

inline constexpr const char* kDefaultConfigFile = "hrseed.conf";

struct ToolOptions {
  // Positional arguments: the command ("toread", "toseed", "version")
  // followed by its inputs.
  std::string command;
  std::vector<std::string> inputs;
  std::string wordlist_path;
  std::optional<unsigned> chunk_size;
  bool verbose{false};
  bool verify{true};
  // Filter, title-case and sort the wordlist as loaded.
  bool normalize{true};
  bool json_output{false};
  std::string log_file;
  std::string log_level{"debug"};
  std::string config_path;
  bool disable_config_file{false};
  bool show_help{false};
  bool show_version{false};
};

// Applies one `key = value` setting. Throws std::runtime_error for
// unknown keys or malformed values.
void ApplyConfigOption(const std::string& key, const std::string& value, ToolOptions* opts);

// Missing files are ignored. Errors name the file and line.
void LoadConfigFile(const std::filesystem::path& path, ToolOptions* opts);

// HRSEED_WORDLIST, HRSEED_CHUNK_SIZE, HRSEED_VERBOSE, HRSEED_LOG_LEVEL.
void ApplyEnvironmentOverrides(ToolOptions* opts);

// Config file, then environment, then command line. `args` excludes the
// program name.
ToolOptions ParseOptions(const std::vector<std::string>& args);
ToolOptions ParseOptions(int argc, char** argv);

bool ParseBool(std::string_view value);
unsigned ParseChunkSize(std::string_view value);

}  // namespace hrseed::config
