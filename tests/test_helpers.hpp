#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "soltx.hpp"

#ifndef SOLTX_FIXTURES_DIR
#define SOLTX_FIXTURES_DIR "../tests/fixtures"
#endif

const std::string KEY_PAIR_FILE = std::string(SOLTX_FIXTURES_DIR) + "/id.json";

/// key with every byte set to fill
inline soltx::PublicKey keyOf(uint8_t fill) {
  soltx::PublicKey key;
  key.data.fill(fill);
  return key;
}

/// distinct key for every index below 65536
inline soltx::PublicKey indexedKey(uint16_t index) {
  soltx::PublicKey key = soltx::PublicKey::empty();
  key.data[0] = 0xAA;
  key.data[1] = index & 0xff;
  key.data[2] = index >> 8;
  return key;
}

inline soltx::Hash hashOf(uint8_t fill) {
  soltx::Hash hash;
  hash.data.fill(fill);
  return hash;
}

inline soltx::Keypair keypairOf(uint8_t fill) {
  std::array<uint8_t, soltx::Keypair::SEED_SIZE> seed;
  seed.fill(fill);
  return soltx::Keypair::fromSeed(seed);
}

/// error code thrown by fn, nullopt if it returned normally
template <typename Error, typename Fn>
auto thrownCode(Fn &&fn) -> std::optional<decltype(
    std::declval<Error>().code())> {
  try {
    fn();
  } catch (const Error &e) {
    return e.code();
  }
  return std::nullopt;
}
