#include <iostream>
#include <string>
#include <vector>

#include "util/strings.hpp"

using namespace hrseed::util;

int main() {
  if (Trim("  \tabc \r\n") != "abc" || !Trim("   ").empty()) {
    std::cerr << "Trim failed\n";
    return 1;
  }
  const std::vector<std::string> expected = {"ant", "bee", "cat"};
  if (SplitWhitespace("\n ant  bee\tcat ") != expected || !SplitWhitespace("").empty()) {
    std::cerr << "SplitWhitespace failed\n";
    return 1;
  }
  if (JoinWithSpaces(expected) != "ant bee cat" || !JoinWithSpaces({}).empty()) {
    std::cerr << "JoinWithSpaces failed\n";
    return 1;
  }
  if (!IsAscii("plain ~ text\x7f") || IsAscii("caf\xC3\xA9")) {
    std::cerr << "IsAscii failed\n";
    return 1;
  }
  // Any non-letter starts a new word.
  if (TitleCase("hELLO") != "Hello" || TitleCase("don't") != "Don'T" ||
      TitleCase("jack-in-the-box") != "Jack-In-The-Box" || TitleCase("x2y") != "X2Y") {
    std::cerr << "TitleCase failed: " << TitleCase("don't") << "\n";
    return 1;
  }
  std::cout << "strings_tests: OK\n";
  return 0;
}
