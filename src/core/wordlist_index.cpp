#include "core/wordlist_index.hpp"

#include <bit>
#include <cctype>

#include "core/errors.hpp"

namespace hrseed::core {

namespace {

bool HasSpace(std::string_view word) {
  for (char ch : word) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      return true;
    }
  }
  return false;
}

}  // namespace

WordlistIndex WordlistIndex::Build(const std::vector<std::string>& words) {
  WordlistIndex index;
  index.words_.reserve(words.size());
  index.positions_.reserve(words.size());
  for (const auto& word : words) {
    if (word.empty()) {
      throw CodecError(ErrorKind::kInvalidWordlist, "wordlist must not contain empty words");
    }
    if (HasSpace(word)) {
      throw CodecError(ErrorKind::kInvalidWordlist,
                       "wordlist entry contains whitespace: '" + word + "'");
    }
    if (index.positions_.emplace(word, index.words_.size()).second) {
      index.words_.push_back(word);
    }
  }
  if (index.words_.size() < 2) {
    throw CodecError(ErrorKind::kInvalidWordlist,
                     "wordlist must contain at least 2 unique words, got " +
                         std::to_string(index.words_.size()));
  }
  return index;
}

unsigned WordlistIndex::ChunkSize() const {
  // bit_width(W) - 1 == floor(log2(W)) for W >= 1.
  return static_cast<unsigned>(std::bit_width(words_.size())) - 1u;
}

const std::string& WordlistIndex::WordAt(std::size_t index) const {
  if (index >= words_.size()) {
    throw CodecError(ErrorKind::kIndexOutOfRange,
                     "word index " + std::to_string(index) + " out of range (wordlist size " +
                         std::to_string(words_.size()) + ")");
  }
  return words_[index];
}

std::size_t WordlistIndex::IndexOf(std::string_view word) const {
  auto found = FindIndex(word);
  if (!found) {
    throw CodecError(ErrorKind::kUnknownWord,
                     "word '" + std::string(word) + "' is not in the wordlist");
  }
  return *found;
}

std::optional<std::size_t> WordlistIndex::FindIndex(std::string_view word) const {
  auto it = positions_.find(std::string(word));
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void WordlistIndex::ValidateChunkSize(unsigned chunk_size) const {
  if (chunk_size < 1) {
    throw CodecError(ErrorKind::kInvalidChunkSize, "chunk size must be at least 1");
  }
  if (chunk_size > ChunkSize()) {
    throw CodecError(ErrorKind::kChunkSizeTooLarge,
                     "chunk size " + std::to_string(chunk_size) +
                         " needs a wordlist of at least 2^" + std::to_string(chunk_size) +
                         " words, got " + std::to_string(words_.size()));
  }
}

}  // namespace hrseed::core
