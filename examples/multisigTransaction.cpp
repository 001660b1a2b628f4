#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <string>

#include "soltx.hpp"

/**
 * Two parties co-sign a memo offline. The fee payer builds the transaction,
 * each party adds its own signature, and the assembled wire bytes are
 * printed as base64, ready to be submitted by anyone.
 */
int main() {
  spdlog::set_level(spdlog::level::debug);

  try {
    const auto payer = soltx::Keypair::generate();
    const auto coSigner = soltx::Keypair::generate();
    // any recent blockhash works for an offline demo
    const auto blockhash =
        soltx::Hash::fromBase58("EtWTRABZaYq6iMfeYKouRu166VU2xqa1wcaWoxPkrZBG");

    const std::string memo = "signed by two";
    const soltx::Instruction ix = {soltx::programs::memo(),
                                   {{coSigner.publicKey, true, false}},
                                   {memo.begin(), memo.end()}};
    auto tx = soltx::TransactionBuilder()
                  .setFeePayer(payer.publicKey)
                  .setRecentBlockhash(blockhash)
                  .addInstruction(ix)
                  .build();

    // the co-signer only ever sees the wire bytes
    auto forCoSigner = soltx::BuiltTransaction::deserialize(tx.serialize());
    const soltx::KeypairSigner coSignerSigner(coSigner);
    forCoSigner.partialSign({&coSignerSigner});
    const auto coSignature = (*forCoSigner.signatures)[1];

    // back at the fee payer
    const soltx::KeypairSigner payerSigner(payer);
    const soltx::Presigner presigned(coSigner.publicKey, coSignature);
    tx.sign({&payerSigner, &presigned}, blockhash);
    tx.verify();

    spdlog::info("transaction {} signed by {} parties",
                 tx.getSignature()->toBase58(),
                 tx.message.header.numRequiredSignatures);
    spdlog::info("wire: {}", soltx::b64encode(tx.serialize()));
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
