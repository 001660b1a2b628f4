#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "soltx/instruction.hpp"
#include "soltx/types.hpp"

namespace soltx {

/**
 * Account indices are a single byte on the wire
 */
constexpr size_t MAX_ACCOUNT_KEYS = 256;

/**
 * One entry per unique key after merging every AccountMeta that references
 * it. Flags are the logical or over all occurrences.
 */
struct ResolvedAccount {
  PublicKey pubkey;
  bool isSigner;
  bool isWritable;
};

/**
 * Collect the fee payer and every key referenced by instructions in first
 * seen order: the fee payer as a writable signer, then for each instruction
 * its program id as a read-only non-signer followed by its accounts.
 * Repeated keys only ever gain privileges.
 */
std::vector<ResolvedAccount> resolveAccounts(
    const PublicKey &feePayer, const std::vector<Instruction> &instructions);

struct MessageHeader {
  /** number of leading account keys that must sign */
  uint8_t numRequiredSignatures;
  /** last numReadonlySignedAccounts of the signers are read-only */
  uint8_t numReadonlySignedAccounts;
  /** last numReadonlyUnsignedAccounts of the keys are read-only */
  uint8_t numReadonlyUnsignedAccounts;

  bool operator==(const MessageHeader &other) const;
  bool operator!=(const MessageHeader &other) const;
};

struct OrderedAccounts {
  std::vector<PublicKey> accountKeys;
  MessageHeader header;
};

/**
 * Stable partition into writable signers, read-only signers, writable
 * non-signers and read-only non-signers, with the header counting the
 * buckets. Throws TransactionError(TooManyAccountKeys) past
 * MAX_ACCOUNT_KEYS.
 */
OrderedAccounts orderAccounts(const std::vector<ResolvedAccount> &resolved);

struct Message {
  MessageHeader header;
  std::vector<PublicKey> accountKeys;
  Hash recentBlockhash;
  std::vector<CompiledInstruction> instructions;

  /**
   * resolve, order and compile instructions into a message paid by payer
   */
  static Message fromInstructions(const std::vector<Instruction> &instructions,
                                  const PublicKey &payer,
                                  const Hash &recentBlockhash);

  /**
   * Parse exactly one message covering all of buffer
   */
  static Message deserialize(const std::vector<uint8_t> &buffer);

  /**
   * Parse one message starting at offset and advance offset past it
   */
  static Message deserializeFrom(const std::vector<uint8_t> &buffer,
                                 size_t &offset);

  void serializeTo(std::vector<uint8_t> &buffer) const;

  std::vector<uint8_t> serialize() const;

  /**
   * SHA-256 of the serialized message
   */
  Hash hash() const;

  static Hash hashRawMessage(const std::vector<uint8_t> &messageBytes);

  bool isSigner(size_t index) const;

  bool isWritable(size_t index) const;

  /**
   * program id of the instruction at instructionIndex, if both exist
   */
  std::optional<PublicKey> programId(size_t instructionIndex) const;

  std::vector<PublicKey> programIds() const;

  /**
   * the first numRequiredSignatures account keys
   */
  std::vector<PublicKey> signerKeys() const;

  bool hasDuplicates() const;

  bool operator==(const Message &other) const;
  bool operator!=(const Message &other) const;
};

}  // namespace soltx
