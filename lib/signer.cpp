#include "soltx/signer.hpp"

#include <algorithm>
#include <vector>

namespace soltx {

///
/// KeypairSigner
KeypairSigner::KeypairSigner(const Keypair &keypair) : keypair_(keypair) {}

PublicKey KeypairSigner::publicKey() const { return keypair_.publicKey; }

Signature KeypairSigner::sign(const std::vector<uint8_t> &message) const {
  return keypair_.privateKey.signMessage(message);
}

///
/// Presigner
Presigner::Presigner(const PublicKey &pubkey, const Signature &signature)
    : pubkey_(pubkey), signature_(signature) {}

PublicKey Presigner::publicKey() const { return pubkey_; }

Signature Presigner::sign(const std::vector<uint8_t> &) const {
  return signature_;
}

///
/// NullSigner
NullSigner::NullSigner(const PublicKey &pubkey) : pubkey_(pubkey) {}

PublicKey NullSigner::publicKey() const { return pubkey_; }

Signature NullSigner::sign(const std::vector<uint8_t> &) const {
  return Signature::empty();
}

std::vector<Signature> signMessage(const std::vector<uint8_t> &message,
                                   const std::vector<const Signer *> &signers) {
  std::vector<Signature> signatures;
  signatures.reserve(signers.size());
  for (const auto *signer : signers) {
    signatures.push_back(signer->sign(message));
  }
  return signatures;
}

std::vector<const Signer *> uniqueSigners(
    const std::vector<const Signer *> &signers) {
  std::vector<const Signer *> unique;
  std::vector<PublicKey> seen;
  for (const auto *signer : signers) {
    const auto pubkey = signer->publicKey();
    if (std::find(seen.begin(), seen.end(), pubkey) != seen.end()) continue;
    seen.push_back(pubkey);
    unique.push_back(signer);
  }
  return unique;
}

}  // namespace soltx
