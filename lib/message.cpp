#include "soltx/message.hpp"

#include <sodium.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "soltx/compact_u16.hpp"
#include "soltx/error.hpp"
#include "soltx/instruction.hpp"

namespace soltx {

///
/// CompactU16
namespace CompactU16 {
void encode(uint16_t num, std::vector<uint8_t> &buffer) {
  buffer.push_back(num & 0x7f);
  num >>= 7;
  if (num == 0) return;

  buffer.back() |= 0x80;
  buffer.push_back(num & 0x7f);
  num >>= 7;
  if (num == 0) return;

  buffer.back() |= 0x80;
  buffer.push_back(num & 0x3);
}

void encode(const std::vector<uint8_t> &vec, std::vector<uint8_t> &buffer) {
  if (vec.size() > std::numeric_limits<uint16_t>::max())
    throw std::length_error("compact-u16 vector of " +
                            std::to_string(vec.size()) + " bytes");
  encode(static_cast<uint16_t>(vec.size()), buffer);
  buffer.insert(buffer.end(), vec.begin(), vec.end());
}

uint16_t decode(const std::vector<uint8_t> &buffer, size_t &offset) {
  uint32_t value = 0;
  for (size_t nth = 0; nth < MAX_ENCODING_LENGTH; ++nth) {
    if (offset + nth >= buffer.size())
      throw DecodeError(DecodeErrc::TooShort,
                        "compact-u16 ends after " + std::to_string(nth) +
                            " bytes with the continuation bit set");
    const uint8_t elem = buffer[offset + nth];
    // a zero byte after the first one encodes nothing, so it is an alias
    // of a shorter encoding
    if (elem == 0 && nth != 0)
      throw DecodeError(DecodeErrc::Alias, "non-canonical compact-u16");

    const bool done = (elem & 0x80) == 0;
    if (nth == MAX_ENCODING_LENGTH - 1 && !done)
      throw DecodeError(DecodeErrc::ByteThreeContinues,
                        "continuation bit set on third compact-u16 byte");

    value |= static_cast<uint32_t>(elem & 0x7f) << (nth * 7);
    if (value > std::numeric_limits<uint16_t>::max())
      throw DecodeError(DecodeErrc::Overflow,
                        "compact-u16 value " + std::to_string(value));

    if (done) {
      offset += nth + 1;
      return static_cast<uint16_t>(value);
    }
  }
  // unreachable, the third byte either terminates or throws
  throw DecodeError(DecodeErrc::TooLong, "compact-u16 longer than 3 bytes");
}
}  // namespace CompactU16

namespace {
/// Bounds checked cursor over wire bytes
class Reader {
 public:
  Reader(const std::vector<uint8_t> &buffer, size_t &offset)
      : buffer_(buffer), offset_(offset) {}

  uint8_t byte() {
    require(1);
    return buffer_[offset_++];
  }

  template <typename T>
  T fixed() {
    require(T::SIZE);
    T result = {};
    std::copy_n(buffer_.begin() + offset_, T::SIZE, result.data.begin());
    offset_ += T::SIZE;
    return result;
  }

  std::vector<uint8_t> bytes(size_t count) {
    require(count);
    std::vector<uint8_t> result(buffer_.begin() + offset_,
                                buffer_.begin() + offset_ + count);
    offset_ += count;
    return result;
  }

  uint16_t compactU16() { return CompactU16::decode(buffer_, offset_); }

 private:
  void require(size_t count) const {
    if (offset_ > buffer_.size() || buffer_.size() - offset_ < count)
      throw DecodeError(DecodeErrc::Truncated,
                        "need " + std::to_string(count) + " bytes at offset " +
                            std::to_string(offset_) + " of " +
                            std::to_string(buffer_.size()));
  }

  const std::vector<uint8_t> &buffer_;
  size_t &offset_;
};

std::optional<uint8_t> findAccountIndex(const PublicKey &pubkey,
                                        const std::vector<PublicKey> &keys) {
  const auto it = std::find(keys.begin(), keys.end(), pubkey);
  if (it == keys.end()) return std::nullopt;
  return static_cast<uint8_t>(it - keys.begin());
}
}  // namespace

///
/// AccountMeta
bool AccountMeta::operator==(const AccountMeta &other) const {
  return pubkey == other.pubkey && isSigner == other.isSigner &&
         isWritable == other.isWritable;
}

///
/// CompiledInstruction
CompiledInstruction CompiledInstruction::fromInstruction(
    const Instruction &ix, const std::vector<PublicKey> &accounts) {
  const auto programIdIndex = findAccountIndex(ix.programId, accounts);
  if (!programIdIndex)
    throw TransactionError(TransactionErrc::AccountNotFound,
                           "program id " + ix.programId.toBase58() +
                               " not in account keys");

  std::vector<uint8_t> accountIndices;
  accountIndices.reserve(ix.accounts.size());
  for (const auto &account : ix.accounts) {
    const auto index = findAccountIndex(account.pubkey, accounts);
    if (!index)
      throw TransactionError(TransactionErrc::AccountNotFound,
                             "account " + account.pubkey.toBase58() +
                                 " not in account keys");
    accountIndices.push_back(*index);
  }
  return {*programIdIndex, accountIndices, ix.data};
}

void CompiledInstruction::serializeTo(std::vector<uint8_t> &buffer) const {
  buffer.push_back(programIdIndex);
  CompactU16::encode(accountIndices, buffer);
  CompactU16::encode(data, buffer);
}

bool CompiledInstruction::operator==(const CompiledInstruction &other) const {
  return programIdIndex == other.programIdIndex &&
         accountIndices == other.accountIndices && data == other.data;
}

bool CompiledInstruction::operator!=(const CompiledInstruction &other) const {
  return !(*this == other);
}

///
/// account resolution and ordering
std::vector<ResolvedAccount> resolveAccounts(
    const PublicKey &feePayer, const std::vector<Instruction> &instructions) {
  std::vector<ResolvedAccount> resolved;

  // merge metas referencing the same key, assign maximum privileges
  const auto addOrPromote = [&resolved](const PublicKey &pubkey, bool isSigner,
                                        bool isWritable) {
    auto dup = std::find_if(
        resolved.begin(), resolved.end(),
        [&pubkey](const ResolvedAccount &r) { return r.pubkey == pubkey; });
    if (dup == resolved.end()) {
      resolved.push_back({pubkey, isSigner, isWritable});
    } else {
      dup->isSigner |= isSigner;
      dup->isWritable |= isWritable;
    }
  };

  addOrPromote(feePayer, true, true);
  for (const auto &instruction : instructions) {
    addOrPromote(instruction.programId, false, false);
    for (const auto &meta : instruction.accounts) {
      addOrPromote(meta.pubkey, meta.isSigner, meta.isWritable);
    }
  }
  return resolved;
}

OrderedAccounts orderAccounts(const std::vector<ResolvedAccount> &resolved) {
  if (resolved.size() > MAX_ACCOUNT_KEYS)
    throw TransactionError(TransactionErrc::TooManyAccountKeys,
                           std::to_string(resolved.size()) +
                               " unique accounts, at most " +
                               std::to_string(MAX_ACCOUNT_KEYS) +
                               " can be indexed");

  std::vector<PublicKey> writableSigners;
  std::vector<PublicKey> readonlySigners;
  std::vector<PublicKey> writableNonSigners;
  std::vector<PublicKey> readonlyNonSigners;
  for (const auto &account : resolved) {
    if (account.isSigner) {
      (account.isWritable ? writableSigners : readonlySigners)
          .push_back(account.pubkey);
    } else {
      (account.isWritable ? writableNonSigners : readonlyNonSigners)
          .push_back(account.pubkey);
    }
  }

  OrderedAccounts ordered;
  ordered.accountKeys.reserve(resolved.size());
  for (const auto *bucket : {&writableSigners, &readonlySigners,
                             &writableNonSigners, &readonlyNonSigners}) {
    ordered.accountKeys.insert(ordered.accountKeys.end(), bucket->begin(),
                               bucket->end());
  }
  const size_t numSigners = writableSigners.size() + readonlySigners.size();
  if (numSigners > std::numeric_limits<uint8_t>::max())
    throw TransactionError(TransactionErrc::TooManyAccountKeys,
                           std::to_string(numSigners) +
                               " signers do not fit the message header");
  if (readonlyNonSigners.size() > std::numeric_limits<uint8_t>::max())
    throw TransactionError(TransactionErrc::TooManyAccountKeys,
                           std::to_string(readonlyNonSigners.size()) +
                               " read-only accounts do not fit the message "
                               "header");
  ordered.header = {
      static_cast<uint8_t>(numSigners),
      static_cast<uint8_t>(readonlySigners.size()),
      static_cast<uint8_t>(readonlyNonSigners.size())};
  return ordered;
}

///
/// MessageHeader
bool MessageHeader::operator==(const MessageHeader &other) const {
  return numRequiredSignatures == other.numRequiredSignatures &&
         numReadonlySignedAccounts == other.numReadonlySignedAccounts &&
         numReadonlyUnsignedAccounts == other.numReadonlyUnsignedAccounts;
}

bool MessageHeader::operator!=(const MessageHeader &other) const {
  return !(*this == other);
}

///
/// Message
Message Message::fromInstructions(const std::vector<Instruction> &instructions,
                                  const PublicKey &payer,
                                  const Hash &recentBlockhash) {
  const auto resolved = resolveAccounts(payer, instructions);
  auto ordered = orderAccounts(resolved);
  spdlog::debug(
      "compiled {} instructions over {} accounts, header {{{}, {}, {}}}",
      instructions.size(), ordered.accountKeys.size(),
      ordered.header.numRequiredSignatures,
      ordered.header.numReadonlySignedAccounts,
      ordered.header.numReadonlyUnsignedAccounts);

  // dictionary encode individual instructions
  std::vector<CompiledInstruction> compiled;
  compiled.reserve(instructions.size());
  for (const auto &instruction : instructions) {
    compiled.push_back(
        CompiledInstruction::fromInstruction(instruction, ordered.accountKeys));
  }
  return {ordered.header, std::move(ordered.accountKeys), recentBlockhash,
          std::move(compiled)};
}

Message Message::deserialize(const std::vector<uint8_t> &buffer) {
  size_t offset = 0;
  Message message = deserializeFrom(buffer, offset);
  if (offset != buffer.size())
    throw DecodeError(DecodeErrc::TrailingBytes,
                      std::to_string(buffer.size() - offset) +
                          " bytes after message");
  return message;
}

Message Message::deserializeFrom(const std::vector<uint8_t> &buffer,
                                 size_t &offset) {
  Reader reader(buffer, offset);
  Message message = {};

  message.header.numRequiredSignatures = reader.byte();
  message.header.numReadonlySignedAccounts = reader.byte();
  message.header.numReadonlyUnsignedAccounts = reader.byte();

  const size_t numKeys = reader.compactU16();
  if (numKeys > MAX_ACCOUNT_KEYS)
    throw DecodeError(DecodeErrc::InvalidLength,
                      std::to_string(numKeys) + " account keys");
  message.accountKeys.reserve(numKeys);
  for (size_t i = 0; i < numKeys; ++i) {
    message.accountKeys.push_back(reader.fixed<PublicKey>());
  }

  message.recentBlockhash = reader.fixed<Hash>();

  const size_t numInstructions = reader.compactU16();
  message.instructions.reserve(numInstructions);
  for (size_t i = 0; i < numInstructions; ++i) {
    CompiledInstruction ix = {};
    ix.programIdIndex = reader.byte();
    ix.accountIndices = reader.bytes(reader.compactU16());
    ix.data = reader.bytes(reader.compactU16());
    message.instructions.push_back(std::move(ix));
  }
  return message;
}

void Message::serializeTo(std::vector<uint8_t> &buffer) const {
  buffer.push_back(header.numRequiredSignatures);
  buffer.push_back(header.numReadonlySignedAccounts);
  buffer.push_back(header.numReadonlyUnsignedAccounts);

  CompactU16::encode(static_cast<uint16_t>(accountKeys.size()), buffer);
  for (const auto &account : accountKeys) {
    buffer.insert(buffer.end(), account.data.begin(), account.data.end());
  }

  buffer.insert(buffer.end(), recentBlockhash.data.begin(),
                recentBlockhash.data.end());

  CompactU16::encode(static_cast<uint16_t>(instructions.size()), buffer);
  for (const auto &instruction : instructions) {
    instruction.serializeTo(buffer);
  }
}

std::vector<uint8_t> Message::serialize() const {
  std::vector<uint8_t> buffer;
  serializeTo(buffer);
  return buffer;
}

Hash Message::hash() const { return hashRawMessage(serialize()); }

Hash Message::hashRawMessage(const std::vector<uint8_t> &messageBytes) {
  static_assert(Hash::SIZE == crypto_hash_sha256_BYTES,
                "message hash is a SHA-256 digest");
  initSodium();
  Hash result = {};
  if (0 != crypto_hash_sha256(result.data.data(), messageBytes.data(),
                              messageBytes.size()))
    throw std::runtime_error("could not hash message of " +
                             std::to_string(messageBytes.size()) + " bytes");
  return result;
}

bool Message::isSigner(size_t index) const {
  return index < header.numRequiredSignatures;
}

bool Message::isWritable(size_t index) const {
  if (index >= accountKeys.size()) return false;
  const size_t numSigned = header.numRequiredSignatures;
  if (index < numSigned) {
    if (header.numReadonlySignedAccounts > numSigned) return false;
    return index < numSigned - header.numReadonlySignedAccounts;
  }
  const size_t numUnsigned = accountKeys.size() - numSigned;
  if (header.numReadonlyUnsignedAccounts > numUnsigned) return false;
  return index - numSigned < numUnsigned - header.numReadonlyUnsignedAccounts;
}

std::optional<PublicKey> Message::programId(size_t instructionIndex) const {
  if (instructionIndex >= instructions.size()) return std::nullopt;
  const auto index = instructions[instructionIndex].programIdIndex;
  if (index >= accountKeys.size()) return std::nullopt;
  return accountKeys[index];
}

std::vector<PublicKey> Message::programIds() const {
  std::vector<PublicKey> result;
  result.reserve(instructions.size());
  for (const auto &ix : instructions) {
    if (ix.programIdIndex < accountKeys.size())
      result.push_back(accountKeys[ix.programIdIndex]);
  }
  return result;
}

std::vector<PublicKey> Message::signerKeys() const {
  const size_t count =
      std::min<size_t>(header.numRequiredSignatures, accountKeys.size());
  return {accountKeys.begin(), accountKeys.begin() + count};
}

bool Message::hasDuplicates() const {
  for (size_t i = 0; i < accountKeys.size(); ++i) {
    for (size_t j = i + 1; j < accountKeys.size(); ++j) {
      if (accountKeys[i] == accountKeys[j]) return true;
    }
  }
  return false;
}

bool Message::operator==(const Message &other) const {
  return header == other.header && accountKeys == other.accountKeys &&
         recentBlockhash == other.recentBlockhash &&
         instructions == other.instructions;
}

bool Message::operator!=(const Message &other) const {
  return !(*this == other);
}

}  // namespace soltx
