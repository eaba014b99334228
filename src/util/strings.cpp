#include "util/strings.hpp"

#include <cctype>

namespace hrseed::util {

namespace {

bool IsSpace(char ch) {
  return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

bool IsAlpha(char ch) {
  return std::isalpha(static_cast<unsigned char>(ch)) != 0;
}

}  // namespace

std::string Trim(std::string_view input) {
  std::size_t begin = 0;
  std::size_t end = input.size();
  while (begin < end && IsSpace(input[begin])) {
    ++begin;
  }
  while (end > begin && IsSpace(input[end - 1])) {
    --end;
  }
  return std::string(input.substr(begin, end - begin));
}

std::vector<std::string> SplitWhitespace(std::string_view input) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (pos < input.size()) {
    while (pos < input.size() && IsSpace(input[pos])) {
      ++pos;
    }
    if (pos >= input.size()) {
      break;
    }
    const std::size_t start = pos;
    while (pos < input.size() && !IsSpace(input[pos])) {
      ++pos;
    }
    out.emplace_back(input.substr(start, pos - start));
  }
  return out;
}

std::string JoinWithSpaces(const std::vector<std::string>& parts) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i != 0) {
      out.push_back(' ');
    }
    out.append(parts[i]);
  }
  return out;
}

bool IsAscii(std::string_view input) {
  for (char ch : input) {
    if (static_cast<unsigned char>(ch) >= 0x80) {
      return false;
    }
  }
  return true;
}

std::string LowercaseAscii(std::string_view input) {
  std::string out(input);
  for (char& ch : out) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return out;
}

std::string TitleCase(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  bool previous_alpha = false;
  for (char ch : input) {
    const auto uch = static_cast<unsigned char>(ch);
    if (IsAlpha(ch)) {
      out.push_back(static_cast<char>(previous_alpha ? std::tolower(uch) : std::toupper(uch)));
      previous_alpha = true;
    } else {
      out.push_back(ch);
      previous_alpha = false;
    }
  }
  return out;
}

}  // namespace hrseed::util
