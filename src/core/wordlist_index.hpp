#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace hrseed::core {

// Immutable two-way mapping between words and their positions.
//
// Build() keeps the first occurrence of each word, so the position of a
// word is stable for a given input order. The chunk size is the number
// of bits one word can carry: floor(log2(Size())).
class WordlistIndex {
 public:
  // Throws CodecError(kInvalidWordlist) if a word is empty or contains
  // whitespace, or if fewer than two unique words remain.
  static WordlistIndex Build(const std::vector<std::string>& words);

  std::size_t Size() const { return words_.size(); }
  const std::vector<std::string>& Words() const { return words_; }

  unsigned ChunkSize() const;

  // Throws CodecError(kIndexOutOfRange).
  const std::string& WordAt(std::size_t index) const;

  // Throws CodecError(kUnknownWord).
  std::size_t IndexOf(std::string_view word) const;
  std::optional<std::size_t> FindIndex(std::string_view word) const;

  // Throws CodecError(kInvalidChunkSize) for zero and
  // CodecError(kChunkSizeTooLarge) when 2^chunk_size > Size().
  void ValidateChunkSize(unsigned chunk_size) const;

 private:
  WordlistIndex() = default;

  std::vector<std::string> words_;
  std::unordered_map<std::string, std::size_t> positions_;
};

}  // namespace hrseed::core
