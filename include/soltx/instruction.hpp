#pragma once

#include <cstdint>
#include <vector>

#include "soltx/types.hpp"

namespace soltx {

/**
 * Account metadata used to define instructions
 */
struct AccountMeta {
  PublicKey pubkey;
  bool isSigner;
  bool isWritable;

  bool operator==(const AccountMeta &other) const;
};

/**
 * An instruction to execute by a program. data is opaque to this library.
 */
struct Instruction {
  PublicKey programId;
  std::vector<AccountMeta> accounts;
  std::vector<uint8_t> data;
};

/**
 * An instruction with its program id and accounts replaced by indices into
 * the message account keys
 */
struct CompiledInstruction {
  uint8_t programIdIndex;
  std::vector<uint8_t> accountIndices;
  std::vector<uint8_t> data;

  /**
   * Resolve every key of ix against accounts.
   * Throws TransactionError(AccountNotFound) if a key is missing.
   */
  static CompiledInstruction fromInstruction(
      const Instruction &ix, const std::vector<PublicKey> &accounts);

  void serializeTo(std::vector<uint8_t> &buffer) const;

  bool operator==(const CompiledInstruction &other) const;
  bool operator!=(const CompiledInstruction &other) const;
};

}  // namespace soltx
