#include "core/codec.hpp"

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <utility>

#include "core/bit_packer.hpp"
#include "core/errors.hpp"
#include "util/logging.hpp"
#include "util/strings.hpp"

namespace hrseed::core {

namespace {

void RequireAscii(std::string_view seed) {
  for (std::size_t i = 0; i < seed.size(); ++i) {
    const auto byte = static_cast<unsigned char>(seed[i]);
    if (byte < 0x80) {
      continue;
    }
    std::ostringstream msg;
    msg << "input token must contain only ASCII characters; conversion successful up to '"
        << seed.substr(0, i) << "'; problematic byte at position " << i << ": 0x" << std::hex
        << std::uppercase << std::setw(2) << std::setfill('0') << static_cast<unsigned>(byte)
        << std::dec << "; successful bit conversion: " << BytesToBits(seed.substr(0, i)).ToString();
    throw CodecError(ErrorKind::kNonAsciiInput, msg.str());
  }
}

}  // namespace

Codec::Codec(WordlistIndex index, CodecOptions options)
    : index_(std::move(index)), options_(std::move(options)) {
  if (options_.chunk_size) {
    index_.ValidateChunkSize(*options_.chunk_size);
    chunk_size_ = *options_.chunk_size;
  } else {
    chunk_size_ = index_.ChunkSize();
  }
  if (options_.verbose) {
    util::LogDebug("wordlist size " + std::to_string(index_.Size()) + ", chunk size " +
                   std::to_string(chunk_size_));
  }
}

Codec::Codec(const std::vector<std::string>& words, CodecOptions options)
    : Codec(WordlistIndex::Build(words), std::move(options)) {}

std::vector<std::string> Codec::SeedToHuman(std::string_view seed) const {
  const auto indices = EncodeIndices(seed, options_.verbose);
  auto words = IndicesToWords(indices);
  if (options_.verify) {
    // Decode through the same word lookup HumanToSeed uses.
    const std::string reconstructed = DecodeIndices(ResolveIndices(words), false);
    if (reconstructed != seed) {
      throw CodecError(ErrorKind::kRoundtripVerificationFailed,
                       "roundtrip check failed: original '" + std::string(seed) +
                           "', reconstructed '" + reconstructed + "'");
    }
  }
  return words;
}

std::string Codec::HumanToSeed(const std::vector<std::string>& words) const {
  const auto indices = ResolveIndices(words);
  std::string seed = DecodeIndices(indices, options_.verbose);
  if (options_.verify) {
    const auto reencoded = EncodeIndices(seed, false);
    if (reencoded != indices) {
      throw CodecError(ErrorKind::kRoundtripVerificationFailed,
                       "roundtrip check failed: '" + JoinWords(words) +
                           "' is not the canonical encoding of its seed, expected '" +
                           JoinWords(IndicesToWords(reencoded)) + "'");
    }
  }
  return seed;
}

std::string Codec::HumanToSeedSentence(std::string_view sentence) const {
  return HumanToSeed(util::SplitWhitespace(sentence));
}

std::vector<std::string> Codec::EncodeUnchecked(std::string_view seed) const {
  return IndicesToWords(EncodeIndices(seed, options_.verbose));
}

std::string Codec::DecodeUnchecked(const std::vector<std::string>& words) const {
  return DecodeIndices(ResolveIndices(words), options_.verbose);
}

std::vector<std::size_t> Codec::EncodeIndices(std::string_view seed, bool trace) const {
  RequireAscii(seed);
  const PaddedBits padded = PadToMultiple(BytesToBits(seed), chunk_size_);
  if (trace) {
    util::LogDebug("seed bits: " + padded.bits.ToString() + " (padding " +
                   std::to_string(padded.padding_count) + ")");
  }
  const auto chunks = SplitChunks(padded.bits, chunk_size_);

  std::vector<std::size_t> indices;
  indices.reserve(chunks.size() + 1);
  indices.push_back(padded.padding_count);
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    const auto value = static_cast<std::size_t>(ChunkToIndex(chunks[i]));
    indices.push_back(value);
    if (trace) {
      util::LogDebug("chunk " + std::to_string(i + 1) + ": " + chunks[i].ToString() + " -> " +
                     std::to_string(value) + " -> " + index_.WordAt(value));
    }
  }
  return indices;
}

std::string Codec::DecodeIndices(const std::vector<std::size_t>& indices, bool trace) const {
  if (indices.empty()) {
    throw CodecError(ErrorKind::kEmptyInput, "input must contain at least 1 word");
  }
  const std::size_t padding = indices.front();
  if (padding >= chunk_size_) {
    throw CodecError(ErrorKind::kPaddingOutOfRange,
                     "padding word '" + index_.WordAt(padding) + "' encodes " +
                         std::to_string(padding) + " padding bits, chunk size is " +
                         std::to_string(chunk_size_));
  }

  BitString bits;
  for (std::size_t i = 1; i < indices.size(); ++i) {
    const BitString chunk = IndexToChunk(indices[i], chunk_size_);
    if (trace) {
      util::LogDebug("word " + std::to_string(i) + ": " + index_.WordAt(indices[i]) + " -> " +
                     std::to_string(indices[i]) + " -> " + chunk.ToString());
    }
    bits.Append(chunk);
  }
  return BitsToBytes(RemovePadding(bits, padding));
}

std::vector<std::size_t> Codec::ResolveIndices(const std::vector<std::string>& words) const {
  if (words.empty()) {
    throw CodecError(ErrorKind::kEmptyInput, "input must contain at least 1 word");
  }
  std::vector<std::size_t> indices;
  indices.reserve(words.size());
  for (const auto& word : words) {
    // An exact match wins, so a wordlist that is not title-cased still
    // decodes its own output.
    if (options_.title_case_input && !index_.FindIndex(word)) {
      indices.push_back(index_.IndexOf(util::TitleCase(word)));
    } else {
      indices.push_back(index_.IndexOf(word));
    }
  }
  return indices;
}

std::vector<std::string> Codec::IndicesToWords(const std::vector<std::size_t>& indices) const {
  std::vector<std::string> words;
  words.reserve(indices.size());
  for (std::size_t index : indices) {
    words.push_back(index_.WordAt(index));
  }
  return words;
}

std::string JoinWords(const std::vector<std::string>& words) {
  return util::JoinWithSpaces(words);
}

}  // namespace hrseed::core
