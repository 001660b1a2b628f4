#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <string>
#include <vector>

#include "soltx.hpp"

int main(int argc, char **argv) {
  const std::string keypairFile =
      argc > 1 ? argv[1] : "../tests/fixtures/id.json";
  spdlog::set_level(spdlog::level::debug);

  try {
    const auto connection =
        soltx::rpc::Connection(soltx::rpc::DEVNET, "confirmed");
    const auto keypair = soltx::Keypair::fromFile(keypairFile);
    const soltx::KeypairSigner signer(keypair);

    // 1. fetch recent blockhash to anchor tx to
    const auto recentBlockhash = connection.getLatestBlockhash();

    // 2. assemble and sign tx
    const std::string memo = "Hello \xF0\x9F\xA5\xAD";
    const soltx::Instruction ix = {
        soltx::programs::memo(), {}, {memo.begin(), memo.end()}};
    const auto tx = soltx::TransactionBuilder()
                        .setFeePayer(keypair.publicKey)
                        .setRecentBlockhash(recentBlockhash.hash)
                        .addInstruction(ix)
                        .buildSigned({&signer});

    // 3. dry run, then send
    const auto simulation = connection.simulateTransaction(tx);
    if (simulation.err.has_value()) {
      spdlog::error("simulation failed: {}", *simulation.err);
      return EXIT_FAILURE;
    }
    const auto b58Sig = connection.sendTransaction(tx);
    spdlog::info(
        "sent tx. check: https://explorer.solana.com/tx/{}?cluster=devnet",
        b58Sig);
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
