#include "soltx/error.hpp"

#include <string>

namespace soltx {

///
/// TransactionError
std::string toString(TransactionErrc errc) {
  switch (errc) {
    case TransactionErrc::NoFeePayer:
      return "NoFeePayer";
    case TransactionErrc::NoRecentBlockhash:
      return "NoRecentBlockhash";
    case TransactionErrc::NoInstructions:
      return "NoInstructions";
    case TransactionErrc::TooManyAccountKeys:
      return "TooManyAccountKeys";
    case TransactionErrc::AccountNotFound:
      return "AccountNotFound";
    case TransactionErrc::NotEnoughSigners:
      return "NotEnoughSigners";
    case TransactionErrc::MissingSigner:
      return "MissingSigner";
    case TransactionErrc::SignatureVerificationFailed:
      return "SignatureVerificationFailed";
  }
  return "Unknown";
}

TransactionError::TransactionError(TransactionErrc errc,
                                   const std::string &what)
    : std::runtime_error(toString(errc) + ": " + what), errc_(errc) {}

///
/// DecodeError
std::string toString(DecodeErrc errc) {
  switch (errc) {
    case DecodeErrc::TooShort:
      return "TooShort";
    case DecodeErrc::TooLong:
      return "TooLong";
    case DecodeErrc::Overflow:
      return "Overflow";
    case DecodeErrc::Alias:
      return "Alias";
    case DecodeErrc::ByteThreeContinues:
      return "ByteThreeContinues";
    case DecodeErrc::Truncated:
      return "Truncated";
    case DecodeErrc::TrailingBytes:
      return "TrailingBytes";
    case DecodeErrc::InvalidBase58:
      return "InvalidBase58";
    case DecodeErrc::InvalidBase64:
      return "InvalidBase64";
    case DecodeErrc::InvalidLength:
      return "InvalidLength";
  }
  return "Unknown";
}

DecodeError::DecodeError(DecodeErrc errc, const std::string &what)
    : std::runtime_error(toString(errc) + ": " + what), errc_(errc) {}

}  // namespace soltx
