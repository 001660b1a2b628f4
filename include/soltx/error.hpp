#pragma once

#include <stdexcept>
#include <string>

namespace soltx {

enum class TransactionErrc {
  /** build without a fee payer */
  NoFeePayer,
  /** build without a recent blockhash */
  NoRecentBlockhash,
  /** build without any instruction */
  NoInstructions,
  /** more unique accounts than a one byte index can address */
  TooManyAccountKeys,
  /** an instruction references a key missing from the account keys */
  AccountNotFound,
  /** required signature slots are absent or still unsigned */
  NotEnoughSigners,
  /** a required signer never signed */
  MissingSigner,
  /** a present signature does not verify */
  SignatureVerificationFailed,
};

std::string toString(TransactionErrc errc);

/**
 * Failure to build, sign or verify a transaction
 */
class TransactionError : public std::runtime_error {
 public:
  TransactionError(TransactionErrc errc, const std::string &what);

  TransactionErrc code() const noexcept { return errc_; }

 private:
  TransactionErrc errc_;
};

enum class DecodeErrc {
  /** compact-u16 input ended while the continuation bit was set */
  TooShort,
  /** compact-u16 longer than three bytes */
  TooLong,
  /** compact-u16 value does not fit 16 bits */
  Overflow,
  /** non-canonical compact-u16 encoding */
  Alias,
  /** continuation bit set on the third compact-u16 byte */
  ByteThreeContinues,
  /** input ended before the structure was complete */
  Truncated,
  /** bytes left over after the structure was complete */
  TrailingBytes,
  InvalidBase58,
  InvalidBase64,
  /** decoded value has the wrong size */
  InvalidLength,
};

std::string toString(DecodeErrc errc);

/**
 * Failure to decode wire bytes or a text encoding
 */
class DecodeError : public std::runtime_error {
 public:
  DecodeError(DecodeErrc errc, const std::string &what);

  DecodeErrc code() const noexcept { return errc_; }

 private:
  DecodeErrc errc_;
};

}  // namespace soltx
