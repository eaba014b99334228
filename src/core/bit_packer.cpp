#include "core/bit_packer.hpp"

#include "core/errors.hpp"

namespace hrseed::core {

namespace {

void RequireChunkSize(unsigned chunk_size) {
  if (chunk_size < 1 || chunk_size > kMaxChunkBits) {
    throw CodecError(ErrorKind::kInvalidChunkSize,
                     "chunk size " + std::to_string(chunk_size) + " outside [1, " +
                         std::to_string(kMaxChunkBits) + "]");
  }
}

}  // namespace

bool BitString::Get(std::size_t pos) const {
  return ((bytes_[pos / 8] >> (7 - (pos % 8))) & 0x01u) != 0;
}

void BitString::PushBack(bool bit) {
  if (size_ % 8 == 0) {
    bytes_.push_back(0);
  }
  if (bit) {
    bytes_.back() = static_cast<std::uint8_t>(bytes_.back() | (1u << (7 - (size_ % 8))));
  }
  ++size_;
}

void BitString::AppendBits(std::uint64_t value, unsigned count) {
  for (int bit = static_cast<int>(count) - 1; bit >= 0; --bit) {
    PushBack(((value >> bit) & 0x01u) != 0);
  }
}

void BitString::Append(const BitString& other) {
  if (size_ % 8 == 0) {
    // Byte aligned: copy whole bytes.
    bytes_.insert(bytes_.end(), other.bytes_.begin(), other.bytes_.end());
    size_ += other.size_;
    return;
  }
  for (std::size_t i = 0; i < other.size_; ++i) {
    PushBack(other.Get(i));
  }
}

void BitString::Truncate(std::size_t new_size) {
  if (new_size >= size_) {
    return;
  }
  size_ = new_size;
  bytes_.resize((size_ + 7) / 8);
  if (size_ % 8 != 0) {
    const auto keep = static_cast<std::uint8_t>(0xFFu << (8 - (size_ % 8)));
    bytes_.back() = static_cast<std::uint8_t>(bytes_.back() & keep);
  }
}

BitString BitString::Slice(std::size_t begin, std::size_t count) const {
  BitString out;
  for (std::size_t i = begin; i < begin + count && i < size_; ++i) {
    out.PushBack(Get(i));
  }
  return out;
}

std::string BitString::ToString() const {
  std::string out;
  out.reserve(size_);
  for (std::size_t i = 0; i < size_; ++i) {
    out.push_back(Get(i) ? '1' : '0');
  }
  return out;
}

BitString BytesToBits(std::span<const std::uint8_t> data) {
  BitString bits;
  for (std::uint8_t byte : data) {
    bits.AppendBits(byte, 8);
  }
  return bits;
}

BitString BytesToBits(std::string_view data) {
  return BytesToBits(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
}

std::string BitsToBytes(const BitString& bits) {
  if (bits.Size() % 8 != 0) {
    throw CodecError(ErrorKind::kInvalidBitLength,
                     "bit length " + std::to_string(bits.Size()) + " is not a multiple of 8");
  }
  std::string out;
  out.reserve(bits.Bytes().size());
  for (std::size_t i = 0; i < bits.Bytes().size(); ++i) {
    const std::uint8_t byte = bits.Bytes()[i];
    if (byte >= 0x80) {
      throw CodecError(ErrorKind::kNonAsciiByte,
                       "decoded byte " + std::to_string(byte) + " at position " +
                           std::to_string(i) + " is not ASCII");
    }
    out.push_back(static_cast<char>(byte));
  }
  return out;
}

PaddedBits PadToMultiple(const BitString& bits, unsigned chunk_size) {
  RequireChunkSize(chunk_size);
  PaddedBits out;
  out.bits = bits;
  out.padding_count =
      static_cast<unsigned>((chunk_size - (bits.Size() % chunk_size)) % chunk_size);
  out.bits.AppendBits(0, out.padding_count);
  return out;
}

std::vector<BitString> SplitChunks(const BitString& bits, unsigned chunk_size) {
  RequireChunkSize(chunk_size);
  if (bits.Size() % chunk_size != 0) {
    throw CodecError(ErrorKind::kInvalidBitLength,
                     "bit length " + std::to_string(bits.Size()) +
                         " is not a multiple of chunk size " + std::to_string(chunk_size));
  }
  std::vector<BitString> chunks;
  chunks.reserve(bits.Size() / chunk_size);
  for (std::size_t pos = 0; pos < bits.Size(); pos += chunk_size) {
    chunks.push_back(bits.Slice(pos, chunk_size));
  }
  return chunks;
}

BitString JoinChunks(const std::vector<BitString>& chunks) {
  BitString out;
  for (const auto& chunk : chunks) {
    out.Append(chunk);
  }
  return out;
}

std::uint64_t ChunkToIndex(const BitString& chunk) {
  RequireChunkSize(static_cast<unsigned>(chunk.Size()));
  std::uint64_t value = 0;
  for (std::size_t i = 0; i < chunk.Size(); ++i) {
    value = (value << 1) | (chunk.Get(i) ? 1u : 0u);
  }
  return value;
}

BitString IndexToChunk(std::uint64_t index, unsigned chunk_size) {
  RequireChunkSize(chunk_size);
  if ((index >> chunk_size) != 0) {
    throw CodecError(ErrorKind::kIndexOutOfChunkRange,
                     "index " + std::to_string(index) + " does not fit in " +
                         std::to_string(chunk_size) + " bits");
  }
  BitString chunk;
  chunk.AppendBits(index, chunk_size);
  return chunk;
}

BitString RemovePadding(const BitString& bits, std::size_t padding_count) {
  if (padding_count > bits.Size()) {
    throw CodecError(ErrorKind::kPaddingExceedsLength,
                     "padding of " + std::to_string(padding_count) + " bits exceeds length " +
                         std::to_string(bits.Size()));
  }
  BitString out = bits;
  out.Truncate(bits.Size() - padding_count);
  return out;
}

}  // namespace hrseed::core
