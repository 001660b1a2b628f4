#pragma once

#include <cstdint>
#include <vector>

#include "soltx/types.hpp"

namespace soltx {

/**
 * Anything that can produce a signature for one public key
 */
class Signer {
 public:
  virtual ~Signer() = default;

  virtual PublicKey publicKey() const = 0;

  virtual Signature sign(const std::vector<uint8_t> &message) const = 0;

  /**
   * true for signers that need a human in the loop, e.g. hardware wallets
   */
  virtual bool isInteractive() const { return false; }
};

/**
 * Signs with an in-memory keypair
 */
class KeypairSigner : public Signer {
 public:
  explicit KeypairSigner(const Keypair &keypair);

  PublicKey publicKey() const override;

  Signature sign(const std::vector<uint8_t> &message) const override;

 private:
  Keypair keypair_;
};

/**
 * Holds a signature computed elsewhere, e.g. by an offline signer, and
 * returns it for any message
 */
class Presigner : public Signer {
 public:
  Presigner(const PublicKey &pubkey, const Signature &signature);

  PublicKey publicKey() const override;

  Signature sign(const std::vector<uint8_t> &message) const override;

 private:
  PublicKey pubkey_;
  Signature signature_;
};

/**
 * Placeholder for a key whose signature is collected later; always
 * returns the all-zero signature
 */
class NullSigner : public Signer {
 public:
  explicit NullSigner(const PublicKey &pubkey);

  PublicKey publicKey() const override;

  Signature sign(const std::vector<uint8_t> &message) const override;

 private:
  PublicKey pubkey_;
};

/**
 * sign message with every signer, in order
 */
std::vector<Signature> signMessage(const std::vector<uint8_t> &message,
                                   const std::vector<const Signer *> &signers);

/**
 * drop signers whose public key already appeared earlier in the list
 */
std::vector<const Signer *> uniqueSigners(
    const std::vector<const Signer *> &signers);

}  // namespace soltx
