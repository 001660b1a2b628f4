#include "soltx/transaction.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "soltx/compact_u16.hpp"
#include "soltx/error.hpp"

namespace soltx {

///
/// BuiltTransaction
BuiltTransaction BuiltTransaction::deserialize(
    const std::vector<uint8_t> &buffer) {
  size_t offset = 0;
  BuiltTransaction tx;

  const size_t numSignatures = CompactU16::decode(buffer, offset);
  if (buffer.size() - offset < numSignatures * Signature::SIZE)
    throw DecodeError(DecodeErrc::Truncated,
                      std::to_string(numSignatures) +
                          " signatures announced, " +
                          std::to_string(buffer.size() - offset) +
                          " bytes left");
  if (numSignatures > 0) {
    std::vector<Signature> signatures(numSignatures);
    for (auto &sig : signatures) {
      std::copy_n(buffer.begin() + offset, Signature::SIZE, sig.data.begin());
      offset += Signature::SIZE;
    }
    tx.signatures = std::move(signatures);
  }

  tx.message = Message::deserializeFrom(buffer, offset);
  if (offset != buffer.size())
    throw DecodeError(DecodeErrc::TrailingBytes,
                      std::to_string(buffer.size() - offset) +
                          " bytes after transaction");
  return tx;
}

void BuiltTransaction::setRecentBlockhash(const Hash &recentBlockhash) {
  if (message.recentBlockhash == recentBlockhash) return;
  message.recentBlockhash = recentBlockhash;
  if (signatures.has_value()) {
    spdlog::debug("recent blockhash changed to {}, clearing {} signatures",
                  recentBlockhash.toBase58(), signatures->size());
    std::fill(signatures->begin(), signatures->end(), Signature::empty());
  }
}

void BuiltTransaction::partialSign(const std::vector<const Signer *> &signers) {
  const size_t numRequired = message.header.numRequiredSignatures;
  if (!signatures.has_value()) {
    signatures = std::vector<Signature>(numRequired, Signature::empty());
  } else if (signatures->size() < numRequired) {
    signatures->resize(numRequired, Signature::empty());
  }

  // every signer signs the same bytes
  const auto messageBytes = message.serialize();
  const auto positions = getSignerPositions(message, signers);
  for (size_t i = 0; i < signers.size(); ++i) {
    if (!positions[i].has_value()) {
      if (spdlog::should_log(spdlog::level::debug))
        spdlog::debug("skipping signer {}, not a required signer",
                      signers[i]->publicKey().toBase58());
      continue;
    }
    (*signatures)[*positions[i]] = signers[i]->sign(messageBytes);
  }
}

void BuiltTransaction::partialSign(const std::vector<const Signer *> &signers,
                                   const Hash &recentBlockhash) {
  setRecentBlockhash(recentBlockhash);
  partialSign(signers);
}

void BuiltTransaction::sign(const std::vector<const Signer *> &signers,
                            const Hash &recentBlockhash) {
  partialSign(signers, recentBlockhash);
  if (!isSigned()) {
    size_t missing = 0;
    for (size_t i = 0; i < message.header.numRequiredSignatures; ++i) {
      if ((*signatures)[i].isDefault()) missing++;
    }
    throw TransactionError(
        TransactionErrc::NotEnoughSigners,
        std::to_string(missing) + " of " +
            std::to_string(message.header.numRequiredSignatures) +
            " required signatures missing after signing");
  }
}

bool BuiltTransaction::isSigned() const {
  if (!signatures.has_value()) return false;
  const size_t numRequired = message.header.numRequiredSignatures;
  if (signatures->size() < numRequired) return false;
  return std::none_of(signatures->begin(), signatures->begin() + numRequired,
                      [](const Signature &sig) { return sig.isDefault(); });
}

void BuiltTransaction::verify() const {
  const size_t numRequired = message.header.numRequiredSignatures;
  const size_t numPresent = signatures.has_value() ? signatures->size() : 0;
  if (numPresent < numRequired)
    throw TransactionError(TransactionErrc::NotEnoughSigners,
                           std::to_string(numPresent) +
                               " signature slots, " +
                               std::to_string(numRequired) + " required");
  if (numRequired > message.accountKeys.size())
    throw TransactionError(TransactionErrc::NotEnoughSigners,
                           std::to_string(numRequired) +
                               " required signers but only " +
                               std::to_string(message.accountKeys.size()) +
                               " account keys");

  const auto messageBytes = message.serialize();
  for (size_t i = 0; i < numRequired; ++i) {
    const auto &sig = (*signatures)[i];
    const auto &pubkey = message.accountKeys[i];
    if (sig.isDefault())
      throw TransactionError(TransactionErrc::MissingSigner,
                             "no signature from " + pubkey.toBase58() +
                                 " at slot " + std::to_string(i));
    if (!sig.verify(messageBytes, pubkey))
      throw TransactionError(TransactionErrc::SignatureVerificationFailed,
                             "signature at slot " + std::to_string(i) +
                                 " is not valid for " + pubkey.toBase58());
  }
}

Hash BuiltTransaction::verifyAndHashMessage() const {
  verify();
  return message.hash();
}

std::vector<uint8_t> BuiltTransaction::serialize() const {
  std::vector<uint8_t> buffer;
  if (signatures.has_value()) {
    CompactU16::encode(static_cast<uint16_t>(signatures->size()), buffer);
    for (const auto &sig : *signatures) {
      buffer.insert(buffer.end(), sig.data.begin(), sig.data.end());
    }
  } else {
    CompactU16::encode(0, buffer);
  }
  message.serializeTo(buffer);
  return buffer;
}

std::optional<Signature> BuiltTransaction::getSignature() const {
  if (!signatures.has_value() || signatures->empty()) return std::nullopt;
  return signatures->front();
}

std::optional<std::vector<uint8_t>> BuiltTransaction::data(
    size_t instructionIndex) const {
  if (instructionIndex >= message.instructions.size()) return std::nullopt;
  return message.instructions[instructionIndex].data;
}

std::optional<PublicKey> BuiltTransaction::key(size_t instructionIndex,
                                               size_t accountsIndex) const {
  if (instructionIndex >= message.instructions.size()) return std::nullopt;
  const auto &ix = message.instructions[instructionIndex];
  if (accountsIndex >= ix.accountIndices.size()) return std::nullopt;
  const auto accountIndex = ix.accountIndices[accountsIndex];
  if (accountIndex >= message.accountKeys.size()) return std::nullopt;
  return message.accountKeys[accountIndex];
}

std::optional<PublicKey> BuiltTransaction::signerKey(
    size_t instructionIndex, size_t accountsIndex) const {
  const auto pubkey = key(instructionIndex, accountsIndex);
  if (!pubkey.has_value()) return std::nullopt;
  const auto signers = message.signerKeys();
  if (std::find(signers.begin(), signers.end(), *pubkey) == signers.end())
    return std::nullopt;
  return pubkey;
}

///
/// signing
std::vector<std::optional<size_t>> getSignerPositions(
    const Message &message, const std::vector<const Signer *> &signers) {
  const auto signerKeys = message.signerKeys();
  std::vector<std::optional<size_t>> positions;
  positions.reserve(signers.size());
  for (const auto *signer : signers) {
    const auto it =
        std::find(signerKeys.begin(), signerKeys.end(), signer->publicKey());
    if (it == signerKeys.end()) {
      positions.push_back(std::nullopt);
    } else {
      positions.push_back(static_cast<size_t>(it - signerKeys.begin()));
    }
  }
  return positions;
}

void signTransaction(BuiltTransaction &tx,
                     const std::vector<const Signer *> &signers,
                     const Hash &recentBlockhash) {
  tx.sign(signers, recentBlockhash);
}

void partialSignTransaction(BuiltTransaction &tx,
                            const std::vector<const Signer *> &signers,
                            const Hash &recentBlockhash) {
  tx.partialSign(signers, recentBlockhash);
}

void verifyTransaction(const BuiltTransaction &tx) { tx.verify(); }

///
/// TransactionBuilder
TransactionBuilder &TransactionBuilder::setFeePayer(const PublicKey &feePayer) {
  feePayer_ = feePayer;
  return *this;
}

TransactionBuilder &TransactionBuilder::setRecentBlockhash(
    const Hash &recentBlockhash) {
  recentBlockhash_ = recentBlockhash;
  return *this;
}

TransactionBuilder &TransactionBuilder::addInstruction(
    const Instruction &instruction) {
  instructions_.push_back(instruction);
  return *this;
}

TransactionBuilder &TransactionBuilder::addInstructions(
    const std::vector<Instruction> &instructions) {
  instructions_.insert(instructions_.end(), instructions.begin(),
                       instructions.end());
  return *this;
}

BuiltTransaction TransactionBuilder::build() const {
  if (!feePayer_.has_value())
    throw TransactionError(TransactionErrc::NoFeePayer, "fee payer not set");
  if (!recentBlockhash_.has_value())
    throw TransactionError(TransactionErrc::NoRecentBlockhash,
                           "recent blockhash not set");
  if (instructions_.empty())
    throw TransactionError(TransactionErrc::NoInstructions,
                           "no instructions added");

  BuiltTransaction tx;
  tx.message =
      Message::fromInstructions(instructions_, *feePayer_, *recentBlockhash_);
  return tx;
}

BuiltTransaction TransactionBuilder::buildSigned(
    const std::vector<const Signer *> &signers) const {
  auto tx = build();
  tx.partialSign(signers);
  tx.verify();
  return tx;
}

}  // namespace soltx
