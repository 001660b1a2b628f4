#include <doctest/doctest.h>

#include <cstdint>
#include <vector>

#include "soltx.hpp"
#include "test_helpers.hpp"

using soltx::AccountMeta;
using soltx::Instruction;
using soltx::Message;
using soltx::PublicKey;

namespace {
std::vector<uint8_t> append(std::vector<uint8_t> buffer,
                            const std::vector<uint8_t> &tail) {
  buffer.insert(buffer.end(), tail.begin(), tail.end());
  return buffer;
}

std::vector<uint8_t> bytesOf(const PublicKey &key) {
  return {key.data.begin(), key.data.end()};
}
}  // namespace

TEST_CASE("single instruction message wire bytes") {
  const auto feePayer = keyOf(1);
  const auto program = keyOf(3);
  const auto blockhash = hashOf(2);
  const Instruction ix = {program, {}, {0x01, 0x02, 0x03}};

  const auto message = Message::fromInstructions({ix}, feePayer, blockhash);
  CHECK(message.accountKeys == std::vector<PublicKey>{feePayer, program});
  // the program id is a read-only non-signer
  CHECK(message.header == soltx::MessageHeader{1, 0, 1});

  std::vector<uint8_t> expected = {0x01, 0x00, 0x01, 0x02};
  expected = append(expected, bytesOf(feePayer));
  expected = append(expected, bytesOf(program));
  expected = append(expected, {blockhash.data.begin(), blockhash.data.end()});
  expected = append(expected, {0x01, 0x01, 0x00, 0x03, 0x01, 0x02, 0x03});
  CHECK(message.serialize() == expected);

  const soltx::BuiltTransaction tx = {message};
  const auto wire = tx.serialize();
  CHECK_EQ(wire.front(), 0x00);
  CHECK(std::vector<uint8_t>(wire.begin() + 1, wire.end()) == expected);
}

TEST_CASE("fee payer comes first and is a writable signer") {
  const auto feePayer = keyOf(7);
  // the fee payer is referenced read-only further down
  const Instruction ix = {keyOf(3),
                          {{keyOf(4), true, true}, {feePayer, false, false}},
                          {}};
  const auto message = Message::fromInstructions({ix}, feePayer, hashOf(2));
  REQUIRE_FALSE(message.accountKeys.empty());
  CHECK(message.accountKeys[0] == feePayer);
  CHECK_GE(message.header.numRequiredSignatures, 1);
  CHECK(message.isSigner(0));
  CHECK(message.isWritable(0));
  CHECK_FALSE(message.hasDuplicates());
}

TEST_CASE("shared account is deduplicated with promoted privileges") {
  const auto feePayer = keyOf(1);
  const auto program = keyOf(3);
  const auto shared = keyOf(4);
  const Instruction first = {program, {{shared, false, false}}, {0x01}};
  const Instruction second = {program, {{shared, false, true}}, {0x02}};

  const auto resolved = soltx::resolveAccounts(feePayer, {first, second});
  REQUIRE_EQ(resolved.size(), 3);
  CHECK(resolved[2].pubkey == shared);
  CHECK_FALSE(resolved[2].isSigner);
  CHECK(resolved[2].isWritable);

  const auto message =
      Message::fromInstructions({first, second}, feePayer, hashOf(2));
  CHECK(message.accountKeys ==
        std::vector<PublicKey>{feePayer, shared, program});
  CHECK(message.header == soltx::MessageHeader{1, 0, 1});
  CHECK(message.isWritable(1));
  CHECK_FALSE(message.isWritable(2));
  REQUIRE_EQ(message.instructions.size(), 2);
  CHECK(message.instructions[0] ==
        soltx::CompiledInstruction{2, {1}, {0x01}});
  CHECK(message.instructions[1] ==
        soltx::CompiledInstruction{2, {1}, {0x02}});
}

TEST_CASE("accounts are ordered into four stable buckets") {
  const auto feePayer = keyOf(1);
  const auto program = keyOf(3);
  const auto readonlySigner = keyOf(10);
  const auto writableNonSigner = keyOf(11);
  const auto readonlyNonSigner = keyOf(12);
  const auto writableSigner = keyOf(13);
  const Instruction ix = {program,
                          {{readonlySigner, true, false},
                           {writableNonSigner, false, true},
                           {readonlyNonSigner, false, false},
                           {writableSigner, true, true}},
                          {}};

  const auto message = Message::fromInstructions({ix}, feePayer, hashOf(2));
  CHECK(message.accountKeys ==
        std::vector<PublicKey>{feePayer, writableSigner, readonlySigner,
                               writableNonSigner, program,
                               readonlyNonSigner});
  CHECK(message.header == soltx::MessageHeader{3, 1, 2});
  CHECK(message.instructions[0].programIdIndex == 4);
  CHECK(message.instructions[0].accountIndices ==
        std::vector<uint8_t>{2, 3, 5, 1});

  const std::vector<bool> signer = {true, true, true, false, false, false};
  const std::vector<bool> writable = {true, true, false, true, false, false};
  for (size_t i = 0; i < message.accountKeys.size(); ++i) {
    CAPTURE(i);
    CHECK_EQ(message.isSigner(i), signer[i]);
    CHECK_EQ(message.isWritable(i), writable[i]);
  }
  CHECK_FALSE(message.isWritable(message.accountKeys.size()));
  CHECK(message.signerKeys() ==
        std::vector<PublicKey>{feePayer, writableSigner, readonlySigner});
}

TEST_CASE("program used as a writable account elsewhere is promoted") {
  const auto feePayer = keyOf(1);
  const auto program = keyOf(3);
  const Instruction invoke = {program, {}, {}};
  const Instruction touch = {keyOf(5), {{program, false, true}}, {}};

  const auto message =
      Message::fromInstructions({invoke, touch}, feePayer, hashOf(2));
  CHECK(message.accountKeys ==
        std::vector<PublicKey>{feePayer, program, keyOf(5)});
  CHECK(message.header == soltx::MessageHeader{1, 0, 1});
  CHECK(message.programIds() == std::vector<PublicKey>{program, keyOf(5)});
  CHECK(message.programId(1) == keyOf(5));
  CHECK_FALSE(message.programId(2).has_value());
}

TEST_CASE("building twice yields identical bytes") {
  const std::vector<Instruction> ixs = {
      {keyOf(3), {{keyOf(9), false, false}, {keyOf(8), true, false}}, {1}},
      {keyOf(6), {{keyOf(9), false, true}, {keyOf(4), false, false}}, {2}},
      {soltx::programs::memo(), {{keyOf(8), true, true}}, {3, 4}}};

  const auto first = Message::fromInstructions(ixs, keyOf(1), hashOf(2));
  const auto second = Message::fromInstructions(ixs, keyOf(1), hashOf(2));
  CHECK(first == second);
  CHECK(first.serialize() == second.serialize());
}

TEST_CASE("messages survive decoding") {
  const std::vector<Instruction> ixs = {
      {keyOf(3), {{keyOf(9), false, false}, {keyOf(8), true, false}}, {1}},
      {soltx::programs::computeBudget(), {}, {2, 0x40, 0x0d, 0x03, 0x00}}};
  const auto message = Message::fromInstructions(ixs, keyOf(1), hashOf(2));
  const auto bytes = message.serialize();

  const auto decoded = Message::deserialize(bytes);
  CHECK(decoded == message);
  CHECK(decoded.serialize() == bytes);

  auto truncated = bytes;
  truncated.pop_back();
  CHECK(thrownCode<soltx::DecodeError>([&truncated] {
          Message::deserialize(truncated);
        }) == soltx::DecodeErrc::Truncated);

  auto trailing = bytes;
  trailing.push_back(0x00);
  CHECK(thrownCode<soltx::DecodeError>([&trailing] {
          Message::deserialize(trailing);
        }) == soltx::DecodeErrc::TrailingBytes);
}

TEST_CASE("compiling needs every account in the key list") {
  const Instruction ix = {keyOf(3), {{keyOf(4), false, true}}, {}};
  CHECK(thrownCode<soltx::TransactionError>([&ix] {
          soltx::CompiledInstruction::fromInstruction(ix, {keyOf(1)});
        }) == soltx::TransactionErrc::AccountNotFound);
  CHECK(thrownCode<soltx::TransactionError>([&ix] {
          soltx::CompiledInstruction::fromInstruction(ix,
                                                      {keyOf(1), keyOf(3)});
        }) == soltx::TransactionErrc::AccountNotFound);

  const auto compiled = soltx::CompiledInstruction::fromInstruction(
      ix, {keyOf(1), keyOf(4), keyOf(3)});
  CHECK(compiled == soltx::CompiledInstruction{2, {1}, {}});
}

TEST_CASE("more than 256 unique accounts cannot be indexed") {
  std::vector<AccountMeta> metas;
  // fee payer and program make 257
  for (uint16_t i = 0; i < 255; ++i) {
    metas.push_back({indexedKey(i), false, true});
  }
  const Instruction ix = {keyOf(3), metas, {}};
  CHECK(thrownCode<soltx::TransactionError>([&ix] {
          Message::fromInstructions({ix}, keyOf(1), hashOf(2));
        }) == soltx::TransactionErrc::TooManyAccountKeys);

  metas.pop_back();
  const Instruction fits = {keyOf(3), metas, {}};
  const auto message = Message::fromInstructions({fits}, keyOf(1), hashOf(2));
  CHECK_EQ(message.accountKeys.size(), soltx::MAX_ACCOUNT_KEYS);
  CHECK(Message::deserialize(message.serialize()) == message);
}

TEST_CASE("decoding rejects more than 256 account keys") {
  // header, then a key count of 257
  const std::vector<uint8_t> bytes = {0x01, 0x00, 0x00, 0x81, 0x02};
  CHECK(thrownCode<soltx::DecodeError>([&bytes] {
          Message::deserialize(bytes);
        }) == soltx::DecodeErrc::InvalidLength);
}

TEST_CASE("header counts must fit a byte") {
  std::vector<soltx::ResolvedAccount> readonly;
  for (uint16_t i = 0; i < soltx::MAX_ACCOUNT_KEYS; ++i) {
    readonly.push_back({indexedKey(i), false, false});
  }
  CHECK(thrownCode<soltx::TransactionError>([&readonly] {
          soltx::orderAccounts(readonly);
        }) == soltx::TransactionErrc::TooManyAccountKeys);

  readonly.front().isSigner = true;
  const auto ordered = soltx::orderAccounts(readonly);
  CHECK(ordered.header == soltx::MessageHeader{1, 1, 255});
}

TEST_CASE("message hash is the SHA-256 of its bytes") {
  CHECK(Message::hashRawMessage({'a', 'b', 'c'}) ==
        soltx::Hash::fromBase58("DYu3G8aGTMBW1WrTw76zxQJQU4DHLw9MLyy7peG4LKkY"));
  CHECK(Message::hashRawMessage({}) ==
        soltx::Hash::fromBase58("GKot5hBsd81kMupNCXHaqbhv3huEbxAFMLnpcX2hniwn"));

  const Instruction ix = {keyOf(3), {}, {0x01, 0x02, 0x03}};
  const auto message = Message::fromInstructions({ix}, keyOf(1), hashOf(2));
  CHECK(message.hash() == Message::hashRawMessage(message.serialize()));
  const auto other = Message::fromInstructions({ix}, keyOf(1), hashOf(4));
  CHECK(message.hash() != other.hash());
}
