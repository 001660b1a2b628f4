#pragma once

#include <sodium.h>

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace soltx {

const std::string SYSTEM_PROGRAM_ID = "11111111111111111111111111111111";
const std::string MEMO_PROGRAM_ID =
    "MemoSq4gqABAXKb96qnH8TysNcWxMyWCqXgDLGmfcHr";
const std::string COMPUTE_BUDGET_PROGRAM_ID =
    "ComputeBudget111111111111111111111111111111";
const std::string TOKEN_PROGRAM_ID =
    "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA";
const std::string NATIVE_MINT = "So11111111111111111111111111111111111111112";

/**
 * Initialize libsodium. Safe to call from any thread and any number of
 * times; every key operation calls it before touching libsodium.
 */
void initSodium();

/**
 * base58 (bitcoin alphabet) encode
 */
std::string b58encode(const uint8_t *data, size_t size);

/**
 * base58 decode, throws DecodeError on characters outside the alphabet
 */
std::vector<uint8_t> b58decode(const std::string &b58);

/**
 * base64 (standard alphabet, padded) encode
 */
std::string b64encode(const std::vector<uint8_t> &data);

/**
 * base64 decode, throws DecodeError on malformed input
 */
std::vector<uint8_t> b64decode(const std::string &b64);

struct PublicKey {
  static constexpr size_t SIZE = crypto_sign_PUBLICKEYBYTES;
  typedef std::array<uint8_t, SIZE> array_t;

  array_t data;

  static PublicKey empty();

  static PublicKey fromBase58(const std::string &b58);

  bool operator==(const PublicKey &other) const;
  bool operator!=(const PublicKey &other) const;

  std::string toBase58() const;
};

/**
 * 32 byte hash of a recent block, embedded in every message for replay
 * protection
 */
struct Hash {
  static constexpr size_t SIZE = 32;
  typedef std::array<uint8_t, SIZE> array_t;

  array_t data;

  static Hash empty();

  static Hash fromBase58(const std::string &b58);

  bool operator==(const Hash &other) const;
  bool operator!=(const Hash &other) const;

  std::string toBase58() const;
};

struct Signature {
  static constexpr size_t SIZE = crypto_sign_BYTES;
  typedef std::array<uint8_t, SIZE> array_t;

  array_t data;

  /**
   * the all-zero signature, marks a slot that has not been signed yet
   */
  static Signature empty();

  static Signature fromBase58(const std::string &b58);

  bool operator==(const Signature &other) const;
  bool operator!=(const Signature &other) const;

  /**
   * true if every byte is zero
   */
  bool isDefault() const;

  /**
   * Ed25519 verification of this signature over message by key
   */
  bool verify(const std::vector<uint8_t> &message, const PublicKey &key) const;

  std::string toBase58() const;
};

struct PrivateKey {
  static constexpr size_t SIZE = crypto_sign_SECRETKEYBYTES;
  typedef std::array<uint8_t, SIZE> array_t;

  array_t data;

  Signature signMessage(const std::vector<uint8_t> &message) const;
};

struct Keypair {
  static constexpr size_t SEED_SIZE = crypto_sign_SEEDBYTES;

  PublicKey publicKey;
  PrivateKey privateKey;

  /**
   * create a new random keypair
   */
  static Keypair generate();

  /**
   * derive the keypair for a 32 byte Ed25519 seed
   */
  static Keypair fromSeed(const std::array<uint8_t, SEED_SIZE> &seed);

  /**
   * Read a keypair file written by the network CLI: a json array of 64
   * integers, the seed followed by the public key
   */
  static Keypair fromFile(const std::string &path);
};

/**
 * Well-known program ids as keys, each decoded once
 */
namespace programs {
const PublicKey &system();
const PublicKey &memo();
const PublicKey &computeBudget();
const PublicKey &token();
}  // namespace programs

}  // namespace soltx
