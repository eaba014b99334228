#include "core/errors.hpp"

namespace hrseed::core {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalidWordlist:
      return "InvalidWordlist";
    case ErrorKind::kChunkSizeTooLarge:
      return "ChunkSizeTooLarge";
    case ErrorKind::kInvalidChunkSize:
      return "InvalidChunkSize";
    case ErrorKind::kNonAsciiInput:
      return "NonAsciiInput";
    case ErrorKind::kNonAsciiByte:
      return "NonAsciiByte";
    case ErrorKind::kUnknownWord:
      return "UnknownWord";
    case ErrorKind::kIndexOutOfRange:
      return "IndexOutOfRange";
    case ErrorKind::kIndexOutOfChunkRange:
      return "IndexOutOfChunkRange";
    case ErrorKind::kInvalidBitLength:
      return "InvalidBitLength";
    case ErrorKind::kPaddingExceedsLength:
      return "PaddingExceedsLength";
    case ErrorKind::kPaddingOutOfRange:
      return "PaddingOutOfRange";
    case ErrorKind::kEmptyInput:
      return "EmptyInput";
    case ErrorKind::kRoundtripVerificationFailed:
      return "RoundtripVerificationFailed";
  }
  return "Unknown";
}

bool IsInternalError(ErrorKind kind) {
  return kind == ErrorKind::kRoundtripVerificationFailed;
}

CodecError::CodecError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

}  // namespace hrseed::core
