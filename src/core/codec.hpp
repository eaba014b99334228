#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/wordlist_index.hpp"

namespace hrseed::core {

struct CodecOptions {
  // Manual bits-per-word override; validated against the wordlist.
  std::optional<unsigned> chunk_size;
  // Run the opposite direction after every call and compare.
  bool verify{true};
  // Title-case input words that have no exact match before lookup, for
  // wordlists normalized the same way.
  bool title_case_input{false};
  // Log every chunk/word mapping at debug level.
  bool verbose{false};
};

// Reversible mapping between ASCII seeds and word sequences.
//
// The first word of an encoded sequence is metadata: its index is the
// number of zero bits appended to the seed's bit string to reach a
// multiple of the chunk size. Every following word carries ChunkSize()
// bits of the seed, in order, MSB first.
//
// A Codec is immutable after construction; const members may be called
// concurrently.
class Codec {
 public:
  explicit Codec(WordlistIndex index, CodecOptions options = {});
  explicit Codec(const std::vector<std::string>& words, CodecOptions options = {});

  unsigned ChunkSize() const { return chunk_size_; }
  const WordlistIndex& Index() const { return index_; }
  const CodecOptions& Options() const { return options_; }

  // Throws CodecError(kNonAsciiInput) for bytes >= 0x80 and
  // CodecError(kRoundtripVerificationFailed) if the result does not decode
  // back to `seed`.
  std::vector<std::string> SeedToHuman(std::string_view seed) const;

  // Accepts only sequences the encoder could have produced. Lookup misses
  // raise kUnknownWord; a sequence whose canonical re-encoding differs
  // from the input raises kRoundtripVerificationFailed.
  std::string HumanToSeed(const std::vector<std::string>& words) const;
  // Splits `sentence` on whitespace first.
  std::string HumanToSeedSentence(std::string_view sentence) const;

  // Single-direction conversions without the round-trip check.
  std::vector<std::string> EncodeUnchecked(std::string_view seed) const;
  std::string DecodeUnchecked(const std::vector<std::string>& words) const;

 private:
  std::vector<std::size_t> EncodeIndices(std::string_view seed, bool trace) const;
  std::string DecodeIndices(const std::vector<std::size_t>& indices, bool trace) const;
  std::vector<std::size_t> ResolveIndices(const std::vector<std::string>& words) const;
  std::vector<std::string> IndicesToWords(const std::vector<std::size_t>& indices) const;

  WordlistIndex index_;
  CodecOptions options_;
  unsigned chunk_size_{0};
};

std::string JoinWords(const std::vector<std::string>& words);

}  // namespace hrseed::core
