#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace hrseed::util {

std::string Trim(std::string_view input);
// Splits on runs of ASCII whitespace; empty tokens are never produced.
std::vector<std::string> SplitWhitespace(std::string_view input);
std::string JoinWithSpaces(const std::vector<std::string>& parts);
bool IsAscii(std::string_view input);
std::string LowercaseAscii(std::string_view input);
// Uppercases every letter that follows a non-letter and lowercases the
// rest ("o'neil" -> "O'Neil").
std::string TitleCase(std::string_view input);

}  // namespace hrseed::util
