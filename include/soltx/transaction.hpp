#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "soltx/instruction.hpp"
#include "soltx/message.hpp"
#include "soltx/signer.hpp"
#include "soltx/types.hpp"

namespace soltx {

/**
 * A message plus one signature slot per required signer. Unsigned slots
 * hold the all-zero signature.
 *
 * Not thread safe: concurrent signing of one instance must be serialized by
 * the caller.
 */
struct BuiltTransaction {
  Message message;
  std::optional<std::vector<Signature>> signatures = std::nullopt;

  /**
   * Parse the wire format: compact-u16 signature count, signatures, message
   */
  static BuiltTransaction deserialize(const std::vector<uint8_t> &buffer);

  /**
   * Replace the recent blockhash. A different hash clears every signature
   * slot since the signed bytes changed.
   */
  void setRecentBlockhash(const Hash &recentBlockhash);

  /**
   * Sign with every signer that owns one of the required signer keys;
   * other signers are skipped. Slots of signers not given are kept.
   */
  void partialSign(const std::vector<const Signer *> &signers);

  /**
   * partialSign after moving the message to recentBlockhash
   */
  void partialSign(const std::vector<const Signer *> &signers,
                   const Hash &recentBlockhash);

  /**
   * partialSign, then require every slot to be filled.
   * Throws TransactionError(NotEnoughSigners).
   */
  void sign(const std::vector<const Signer *> &signers,
            const Hash &recentBlockhash);

  /**
   * Presence check only: every required slot exists and is non-zero.
   * This does NOT check the signatures cryptographically, use verify().
   */
  bool isSigned() const;

  /**
   * Check every required signature against the serialized message.
   * Throws TransactionError with NotEnoughSigners, MissingSigner or
   * SignatureVerificationFailed.
   */
  void verify() const;

  /**
   * verify, then return the message hash
   */
  Hash verifyAndHashMessage() const;

  /**
   * wire format: compact-u16 signature count, signatures, message
   */
  std::vector<uint8_t> serialize() const;

  /**
   * the first signature, which identifies the transaction on the network
   */
  std::optional<Signature> getSignature() const;

  std::optional<std::vector<uint8_t>> data(size_t instructionIndex) const;

  /**
   * key of the accountsIndex-th account of an instruction
   */
  std::optional<PublicKey> key(size_t instructionIndex,
                               size_t accountsIndex) const;

  /**
   * like key(), but only if that account is a required signer
   */
  std::optional<PublicKey> signerKey(size_t instructionIndex,
                                     size_t accountsIndex) const;
};

/**
 * For each signer, its signature slot in message or nullopt if it is not a
 * required signer
 */
std::vector<std::optional<size_t>> getSignerPositions(
    const Message &message, const std::vector<const Signer *> &signers);

/**
 * Sign with all required signers. A changed recentBlockhash clears existing
 * signatures first. Throws TransactionError(NotEnoughSigners) if any slot
 * is still unsigned afterwards.
 */
void signTransaction(BuiltTransaction &tx,
                     const std::vector<const Signer *> &signers,
                     const Hash &recentBlockhash);

/**
 * Add the signatures of a subset of the required signers
 */
void partialSignTransaction(BuiltTransaction &tx,
                            const std::vector<const Signer *> &signers,
                            const Hash &recentBlockhash);

void verifyTransaction(const BuiltTransaction &tx);

/**
 * Collects a fee payer, a recent blockhash and instructions, then compiles
 * them into a BuiltTransaction.
 *
 * Accounts are ordered as:
 * 1. writable signers (fee payer first)
 * 2. read-only signers
 * 3. writable non-signers
 * 4. read-only non-signers
 */
class TransactionBuilder {
 public:
  TransactionBuilder &setFeePayer(const PublicKey &feePayer);

  TransactionBuilder &setRecentBlockhash(const Hash &recentBlockhash);

  /**
   * instructions execute in the order they are added
   */
  TransactionBuilder &addInstruction(const Instruction &instruction);

  TransactionBuilder &addInstructions(
      const std::vector<Instruction> &instructions);

  const std::optional<PublicKey> &feePayer() const { return feePayer_; }

  const std::optional<Hash> &recentBlockhash() const {
    return recentBlockhash_;
  }

  const std::vector<Instruction> &instructions() const {
    return instructions_;
  }

  /**
   * Compile an unsigned transaction.
   * Throws TransactionError: NoFeePayer, NoRecentBlockhash, NoInstructions,
   * TooManyAccountKeys.
   */
  BuiltTransaction build() const;

  /**
   * build(), sign with signers and verify the result
   */
  BuiltTransaction buildSigned(
      const std::vector<const Signer *> &signers) const;

 private:
  std::optional<PublicKey> feePayer_;
  std::optional<Hash> recentBlockhash_;
  std::vector<Instruction> instructions_;
};

}  // namespace soltx
