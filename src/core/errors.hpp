#pragma once

#include <stdexcept>
#include <string>

namespace hrseed::core {

enum class ErrorKind {
  kInvalidWordlist,
  kChunkSizeTooLarge,
  kInvalidChunkSize,
  kNonAsciiInput,
  kNonAsciiByte,
  kUnknownWord,
  kIndexOutOfRange,
  kIndexOutOfChunkRange,
  kInvalidBitLength,
  kPaddingExceedsLength,
  kPaddingOutOfRange,
  kEmptyInput,
  kRoundtripVerificationFailed,
};

// Stable, human-readable name for an error kind (e.g. "UnknownWord").
const char* ErrorKindName(ErrorKind kind);

// True for kinds that indicate a defect in the codec itself rather than
// bad input. Only the round-trip self check qualifies.
bool IsInternalError(ErrorKind kind);

// Every failure raised by the codec core carries one of the kinds above.
class CodecError : public std::runtime_error {
 public:
  CodecError(ErrorKind kind, const std::string& message);

  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

}  // namespace hrseed::core
