#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hrseed::core {

// Bit sequence packed MSB-first into bytes. Bits past Size() in the last
// byte are always zero so that equal sequences compare equal.
class BitString {
 public:
  BitString() = default;

  std::size_t Size() const { return size_; }
  bool Empty() const { return size_ == 0; }
  bool Get(std::size_t pos) const;
  const std::vector<std::uint8_t>& Bytes() const { return bytes_; }

  void PushBack(bool bit);
  // Appends the low `count` bits of `value`, most significant first.
  void AppendBits(std::uint64_t value, unsigned count);
  void Append(const BitString& other);
  void Truncate(std::size_t new_size);
  BitString Slice(std::size_t begin, std::size_t count) const;

  // "0100..." rendering for diagnostics.
  std::string ToString() const;

  bool operator==(const BitString& other) const = default;

 private:
  std::vector<std::uint8_t> bytes_;
  std::size_t size_{0};
};

struct PaddedBits {
  BitString bits;
  unsigned padding_count{0};
};

// Largest chunk width the packer handles; indices must fit in 64 bits.
inline constexpr unsigned kMaxChunkBits = 63;

BitString BytesToBits(std::span<const std::uint8_t> data);
BitString BytesToBits(std::string_view data);

// Throws CodecError(kInvalidBitLength) if the length is not a multiple of
// 8 and CodecError(kNonAsciiByte) if any byte is >= 0x80.
std::string BitsToBytes(const BitString& bits);

PaddedBits PadToMultiple(const BitString& bits, unsigned chunk_size);

// Requires bits.Size() % chunk_size == 0 (kInvalidBitLength otherwise).
std::vector<BitString> SplitChunks(const BitString& bits, unsigned chunk_size);
BitString JoinChunks(const std::vector<BitString>& chunks);

std::uint64_t ChunkToIndex(const BitString& chunk);
// Throws CodecError(kIndexOutOfChunkRange) if index >= 2^chunk_size.
BitString IndexToChunk(std::uint64_t index, unsigned chunk_size);

// Throws CodecError(kPaddingExceedsLength) if padding_count > bits.Size().
BitString RemovePadding(const BitString& bits, std::size_t padding_count);

}  // namespace hrseed::core
