#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hrseed::wordlist {

struct NormalizeOptions {
  bool drop_non_ascii{true};
  bool drop_with_whitespace{true};
  bool title_case{true};
  bool sort_unique{true};
};

// Reads one word per line, skipping blank lines and '#' comments. Files
// ending in ".json" must hold either an array of strings or an object
// with a "words" array. Throws std::runtime_error on I/O or parse errors.
std::vector<std::string> LoadWordlistFile(const std::filesystem::path& path);

// Filters, title-cases, sorts and deduplicates a raw word list. Throws
// core::CodecError(kInvalidWordlist) if an entry is empty after trimming.
std::vector<std::string> NormalizeWordlist(const std::vector<std::string>& words,
                                           const NormalizeOptions& options = {});

// HRSEED_WORDLIST if set, otherwise the first system dictionary found.
std::optional<std::filesystem::path> ResolveDefaultWordlistPath();

// Loaded and normalized on first use; the reference stays valid for the
// lifetime of the process. Throws std::runtime_error if no default
// wordlist can be found.
const std::vector<std::string>& DefaultWordlist();

}  // namespace hrseed::wordlist
