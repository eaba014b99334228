#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "core/bit_packer.hpp"
#include "core/errors.hpp"

using namespace hrseed::core;

namespace {

template <typename Fn>
bool ExpectKind(Fn&& fn, ErrorKind expected, const char* label) {
  try {
    fn();
  } catch (const CodecError& ex) {
    if (ex.kind() != expected) {
      std::cerr << label << ": expected " << ErrorKindName(expected) << ", got "
                << ErrorKindName(ex.kind()) << "\n";
      return false;
    }
    return true;
  }
  std::cerr << label << ": expected " << ErrorKindName(expected) << ", nothing thrown\n";
  return false;
}

BitString FromString(const std::string& text) {
  BitString bits;
  for (char c : text) {
    bits.PushBack(c == '1');
  }
  return bits;
}

}  // namespace

int main() {
  {
    const auto bits = BytesToBits(std::string("A~"));
    if (bits.ToString() != "0100000101111110" || bits.Size() != 16) {
      std::cerr << "BytesToBits: got " << bits.ToString() << "\n";
      return 1;
    }
    if (BitsToBytes(bits) != "A~") {
      std::cerr << "BitsToBytes did not restore \"A~\"\n";
      return 1;
    }
    if (!BytesToBits(std::string()).Empty() || !BitsToBytes(BitString()).empty()) {
      std::cerr << "empty input should map to empty output\n";
      return 1;
    }
  }

  if (!ExpectKind([] { (void)BitsToBytes(FromString("0100000")); }, ErrorKind::kInvalidBitLength,
                  "7-bit string")) {
    return 1;
  }
  if (!ExpectKind([] { (void)BitsToBytes(FromString("10000000")); }, ErrorKind::kNonAsciiByte,
                  "byte 0x80")) {
    return 1;
  }

  // Padding is (n - len mod n) mod n zero bits.
  {
    const auto bits = BytesToBits(std::string("A"));
    const struct {
      unsigned n;
      unsigned padding;
    } cases[] = {{1, 0}, {2, 0}, {3, 1}, {5, 2}, {7, 6}, {8, 0}, {11, 3}};
    for (const auto& c : cases) {
      const auto padded = PadToMultiple(bits, c.n);
      if (padded.padding_count != c.padding || padded.bits.Size() != 8 + c.padding) {
        std::cerr << "PadToMultiple(n=" << c.n << "): padding " << padded.padding_count
                  << ", expected " << c.padding << "\n";
        return 1;
      }
      for (std::size_t i = 8; i < padded.bits.Size(); ++i) {
        if (padded.bits.Get(i)) {
          std::cerr << "PadToMultiple appended a non-zero bit\n";
          return 1;
        }
      }
    }
  }

  {
    const auto chunks = SplitChunks(FromString("010000010"), 3);
    const std::vector<std::uint64_t> expected = {2, 0, 2};
    if (chunks.size() != expected.size()) {
      std::cerr << "SplitChunks: got " << chunks.size() << " chunks\n";
      return 1;
    }
    for (std::size_t i = 0; i < chunks.size(); ++i) {
      if (ChunkToIndex(chunks[i]) != expected[i]) {
        std::cerr << "SplitChunks: chunk " << i << " = " << chunks[i].ToString() << "\n";
        return 1;
      }
    }
    if (JoinChunks(chunks).ToString() != "010000010") {
      std::cerr << "JoinChunks did not restore the bit string\n";
      return 1;
    }
  }
  if (!ExpectKind([] { (void)SplitChunks(FromString("0100"), 3); }, ErrorKind::kInvalidBitLength,
                  "split uneven")) {
    return 1;
  }
  if (!ExpectKind([] { (void)SplitChunks(FromString("0100"), 0); }, ErrorKind::kInvalidChunkSize,
                  "split zero width")) {
    return 1;
  }

  if (IndexToChunk(5, 4).ToString() != "0101" || IndexToChunk(0, 1).ToString() != "0") {
    std::cerr << "IndexToChunk produced the wrong bits\n";
    return 1;
  }
  if (ChunkToIndex(IndexToChunk((1ull << 40) + 7, 41)) != (1ull << 40) + 7) {
    std::cerr << "wide chunk did not survive IndexToChunk/ChunkToIndex\n";
    return 1;
  }
  if (!ExpectKind([] { (void)IndexToChunk(4, 2); }, ErrorKind::kIndexOutOfChunkRange,
                  "index 4 in 2 bits")) {
    return 1;
  }

  {
    const auto trimmed = RemovePadding(FromString("010000011"), 1);
    if (trimmed.ToString() != "01000001") {
      std::cerr << "RemovePadding: got " << trimmed.ToString() << "\n";
      return 1;
    }
    // Truncation clears the dropped bits, so equality is by value.
    if (!(trimmed == FromString("01000001"))) {
      std::cerr << "truncated bit string compares unequal\n";
      return 1;
    }
    if (!RemovePadding(FromString("01"), 2).Empty()) {
      std::cerr << "RemovePadding of the full length should be empty\n";
      return 1;
    }
  }
  if (!ExpectKind([] { (void)RemovePadding(FromString("01"), 3); },
                  ErrorKind::kPaddingExceedsLength, "padding past length")) {
    return 1;
  }

  {
    BitString unaligned = FromString("101");
    unaligned.Append(FromString("0011"));
    BitString aligned = FromString("10100110");
    aligned.Append(FromString("1"));
    if (unaligned.ToString() != "1010011" || aligned.ToString() != "101001101") {
      std::cerr << "Append: got " << unaligned.ToString() << " / " << aligned.ToString() << "\n";
      return 1;
    }
  }

  std::cout << "bit_packer_tests: OK\n";
  return 0;
}
