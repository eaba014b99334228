#include "wordlist/wordlist_source.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "core/errors.hpp"
#include "nlohmann/json.hpp"
#include "util/logging.hpp"
#include "util/strings.hpp"

namespace hrseed::wordlist {

namespace {

constexpr const char* kSystemDictionaries[] = {
    "/usr/share/dict/words",
    "/usr/share/dict/american-english",
    "/usr/share/dict/british-english",
};

std::vector<std::string> WordsFromJson(const nlohmann::json& json, const std::string& origin) {
  const nlohmann::json* array = &json;
  if (json.is_object()) {
    if (!json.contains("words")) {
      throw std::runtime_error("wordlist JSON object has no \"words\" array: " + origin);
    }
    array = &json.at("words");
  }
  if (!array->is_array()) {
    throw std::runtime_error("wordlist JSON must be an array of strings: " + origin);
  }
  std::vector<std::string> words;
  words.reserve(array->size());
  for (const auto& item : *array) {
    if (!item.is_string()) {
      throw std::runtime_error("wordlist JSON contains a non-string entry: " + origin);
    }
    words.push_back(item.get<std::string>());
  }
  return words;
}

bool HasSpace(const std::string& word) {
  return util::SplitWhitespace(word).size() > 1;
}

}  // namespace

std::vector<std::string> LoadWordlistFile(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("unable to read wordlist file: " + path.string());
  }
  if (path.extension() == ".json") {
    nlohmann::json json;
    try {
      in >> json;
    } catch (const nlohmann::json::parse_error& ex) {
      throw std::runtime_error("invalid wordlist JSON in " + path.string() + ": " + ex.what());
    }
    return WordsFromJson(json, path.string());
  }

  std::vector<std::string> words;
  std::string line;
  while (std::getline(in, line)) {
    std::string word = util::Trim(line);
    if (word.empty() || word.front() == '#') {
      continue;
    }
    words.push_back(std::move(word));
  }
  if (in.bad()) {
    throw std::runtime_error("error while reading wordlist file: " + path.string());
  }
  util::LogDebug("loaded " + std::to_string(words.size()) + " words from " + path.string());
  return words;
}

std::vector<std::string> NormalizeWordlist(const std::vector<std::string>& words,
                                           const NormalizeOptions& options) {
  std::vector<std::string> out;
  out.reserve(words.size());
  std::size_t dropped = 0;
  for (const auto& raw : words) {
    std::string word = util::Trim(raw);
    if (word.empty()) {
      throw core::CodecError(core::ErrorKind::kInvalidWordlist,
                             "wordlist must not contain empty words");
    }
    if ((options.drop_non_ascii && !util::IsAscii(word)) ||
        (options.drop_with_whitespace && HasSpace(word))) {
      ++dropped;
      continue;
    }
    out.push_back(options.title_case ? util::TitleCase(word) : std::move(word));
  }
  if (options.sort_unique) {
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
  }
  util::LogDebug("wordlist size after filtering and sorting: " + std::to_string(out.size()) +
                 " (dropped " + std::to_string(dropped) + ")");
  return out;
}

std::optional<std::filesystem::path> ResolveDefaultWordlistPath() {
  if (const char* env = std::getenv("HRSEED_WORDLIST"); env != nullptr && *env != '\0') {
    return std::filesystem::path(env);
  }
  for (const char* candidate : kSystemDictionaries) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec)) {
      return std::filesystem::path(candidate);
    }
  }
  return std::nullopt;
}

const std::vector<std::string>& DefaultWordlist() {
  static const std::vector<std::string> wordlist = [] {
    auto path = ResolveDefaultWordlistPath();
    if (!path) {
      throw std::runtime_error(
          "no default wordlist found; set HRSEED_WORDLIST or pass --wordlist <path>");
    }
    return NormalizeWordlist(LoadWordlistFile(*path));
  }();
  return wordlist;
}

}  // namespace hrseed::wordlist
