#include <doctest/doctest.h>

#include <cstdint>
#include <vector>

#include "soltx.hpp"
#include "test_helpers.hpp"

TEST_CASE("keypair signer") {
  const auto keypair = keypairOf(1);
  const soltx::KeypairSigner signer(keypair);
  const std::vector<uint8_t> message = {1, 2, 3};

  CHECK(signer.publicKey() == keypair.publicKey);
  CHECK_FALSE(signer.isInteractive());
  const auto signature = signer.sign(message);
  CHECK(signature == keypair.privateKey.signMessage(message));
  CHECK(signature.verify(message, signer.publicKey()));
}

TEST_CASE("presigner hands out its stored signature") {
  const auto payer = keypairOf(1);
  auto tx = soltx::TransactionBuilder()
                .setFeePayer(payer.publicKey)
                .setRecentBlockhash(hashOf(2))
                .addInstruction({keyOf(3), {}, {0x01}})
                .build();
  // signed elsewhere, e.g. on an offline machine
  const auto offline = payer.privateKey.signMessage(tx.message.serialize());

  const soltx::Presigner presigner(payer.publicKey, offline);
  CHECK(presigner.sign({}) == offline);
  tx.partialSign({&presigner});
  CHECK(tx.getSignature() == offline);
  CHECK_NOTHROW(tx.verify());
}

TEST_CASE("null signer leaves its slot empty") {
  const auto payer = keypairOf(1);
  const soltx::NullSigner nullSigner(payer.publicKey);
  CHECK(nullSigner.publicKey() == payer.publicKey);
  CHECK(nullSigner.sign({1}).isDefault());

  auto tx = soltx::TransactionBuilder()
                .setFeePayer(payer.publicKey)
                .setRecentBlockhash(hashOf(2))
                .addInstruction({keyOf(3), {}, {0x01}})
                .build();
  tx.partialSign({&nullSigner});
  REQUIRE(tx.signatures.has_value());
  CHECK_EQ(tx.signatures->size(), 1);
  CHECK_FALSE(tx.isSigned());
  CHECK(thrownCode<soltx::TransactionError>([&tx] { tx.verify(); }) ==
        soltx::TransactionErrc::MissingSigner);
}

TEST_CASE("sign a message with several signers") {
  const soltx::KeypairSigner first(keypairOf(1));
  const soltx::KeypairSigner second(keypairOf(2));
  const std::vector<uint8_t> message = {0xde, 0xad};

  const auto signatures = soltx::signMessage(message, {&first, &second});
  REQUIRE_EQ(signatures.size(), 2);
  CHECK(signatures[0].verify(message, first.publicKey()));
  CHECK(signatures[1].verify(message, second.publicKey()));
  CHECK(soltx::signMessage(message, {}).empty());
}

TEST_CASE("unique signers keep the first signer per key") {
  const auto keypair = keypairOf(1);
  const soltx::KeypairSigner signer(keypair);
  const soltx::NullSigner sameKey(keypair.publicKey);
  const soltx::KeypairSigner other(keypairOf(2));

  const auto unique = soltx::uniqueSigners({&signer, &other, &sameKey});
  REQUIRE_EQ(unique.size(), 2);
  CHECK(unique[0] == &signer);
  CHECK(unique[1] == &other);
}
