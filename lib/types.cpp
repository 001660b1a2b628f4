#include "soltx/types.hpp"

#include <libbase58.h>
#include <sodium.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <limits>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "soltx/error.hpp"

namespace soltx {
using json = nlohmann::json;

namespace {
template <typename T>
T fixedFromBase58(const std::string &b58, const std::string &name) {
  const auto decoded = b58decode(b58);
  if (decoded.size() != T::SIZE)
    throw DecodeError(DecodeErrc::InvalidLength,
                      "not a valid " + name + " '" + b58 + "' (" +
                          std::to_string(decoded.size()) +
                          " != " + std::to_string(T::SIZE) + ")");
  T result = {};
  std::copy(decoded.begin(), decoded.end(), result.data.begin());
  return result;
}
}  // namespace

void initSodium() {
  static const int sodiumResult = sodium_init();
  if (sodiumResult < 0)
    throw std::runtime_error("Error initializing sodium: " +
                             std::to_string(sodiumResult));
}

///
/// base58 / base64
std::string b58encode(const uint8_t *data, size_t size) {
  std::string result(size * 138 / 100 + 2, '\0');
  size_t encodedSize = result.size();
  if (!b58enc(&result[0], &encodedSize, data, size))
    throw std::runtime_error("base58 encoding of " + std::to_string(size) +
                             " bytes failed");
  // encodedSize counts the terminating nul
  result.resize(encodedSize - 1);
  return result;
}

std::vector<uint8_t> b58decode(const std::string &b58) {
  if (b58.empty()) return {};
  std::vector<uint8_t> buffer(b58.size());
  size_t decodedSize = buffer.size();
  if (!b58tobin(buffer.data(), &decodedSize, b58.c_str(), b58.size()))
    throw DecodeError(DecodeErrc::InvalidBase58, "invalid base58 '" + b58 + "'");
  // b58tobin right-aligns the result in the buffer
  buffer.erase(buffer.begin(), buffer.end() - decodedSize);
  return buffer;
}

std::string b64encode(const std::vector<uint8_t> &data) {
  std::string result(
      sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL),
      '\0');
  sodium_bin2base64(&result[0], result.size(), data.data(), data.size(),
                    sodium_base64_VARIANT_ORIGINAL);
  result.resize(result.size() - 1);
  return result;
}

std::vector<uint8_t> b64decode(const std::string &b64) {
  std::vector<uint8_t> result(b64.size() / 4 * 3 + 3);
  size_t decodedSize = 0;
  if (0 != sodium_base642bin(result.data(), result.size(), b64.data(),
                             b64.size(), nullptr, &decodedSize, nullptr,
                             sodium_base64_VARIANT_ORIGINAL))
    throw DecodeError(DecodeErrc::InvalidBase64, "invalid base64 input of " +
                                                     std::to_string(b64.size()) +
                                                     " characters");
  result.resize(decodedSize);
  return result;
}

///
/// PublicKey
PublicKey PublicKey::empty() { return {}; }

PublicKey PublicKey::fromBase58(const std::string &b58) {
  return fixedFromBase58<PublicKey>(b58, "PublicKey");
}

bool PublicKey::operator==(const PublicKey &other) const {
  return data == other.data;
}

bool PublicKey::operator!=(const PublicKey &other) const {
  return !(*this == other);
}

std::string PublicKey::toBase58() const {
  return b58encode(data.data(), data.size());
}

///
/// Hash
Hash Hash::empty() { return {}; }

Hash Hash::fromBase58(const std::string &b58) {
  return fixedFromBase58<Hash>(b58, "Hash");
}

bool Hash::operator==(const Hash &other) const { return data == other.data; }

bool Hash::operator!=(const Hash &other) const { return !(*this == other); }

std::string Hash::toBase58() const {
  return b58encode(data.data(), data.size());
}

///
/// Signature
Signature Signature::empty() { return {}; }

Signature Signature::fromBase58(const std::string &b58) {
  return fixedFromBase58<Signature>(b58, "Signature");
}

bool Signature::operator==(const Signature &other) const {
  return data == other.data;
}

bool Signature::operator!=(const Signature &other) const {
  return !(*this == other);
}

bool Signature::isDefault() const {
  return std::all_of(data.begin(), data.end(),
                     [](uint8_t b) { return b == 0; });
}

bool Signature::verify(const std::vector<uint8_t> &message,
                       const PublicKey &key) const {
  initSodium();
  return 0 == crypto_sign_verify_detached(data.data(), message.data(),
                                          message.size(), key.data.data());
}

std::string Signature::toBase58() const {
  return b58encode(data.data(), data.size());
}

///
/// PrivateKey
Signature PrivateKey::signMessage(const std::vector<uint8_t> &message) const {
  initSodium();
  Signature sig = {};
  unsigned long long sigSize;
  if (0 != crypto_sign_detached(sig.data.data(), &sigSize, message.data(),
                                message.size(), data.data()))
    throw std::runtime_error("could not sign message with private key");
  return sig;
}

///
/// Keypair
Keypair Keypair::generate() {
  initSodium();
  Keypair result = {};
  crypto_sign_keypair(result.publicKey.data.data(),
                      result.privateKey.data.data());
  return result;
}

Keypair Keypair::fromSeed(const std::array<uint8_t, SEED_SIZE> &seed) {
  initSodium();
  Keypair result = {};
  if (0 != crypto_sign_seed_keypair(result.publicKey.data.data(),
                                    result.privateKey.data.data(), seed.data()))
    throw std::runtime_error("could not derive keypair from seed");
  return result;
}

Keypair Keypair::fromFile(const std::string &path) {
  std::ifstream fileStream(path);
  if (!fileStream)
    throw std::runtime_error("could not open keypair file '" + path + "'");
  std::string fileContent(std::istreambuf_iterator<char>(fileStream), {});
  const std::vector<int> values = json::parse(fileContent);
  if (values.size() != PrivateKey::SIZE)
    throw DecodeError(DecodeErrc::InvalidLength,
                      "keypair file '" + path + "' holds " +
                          std::to_string(values.size()) + " bytes, expected " +
                          std::to_string(PrivateKey::SIZE));
  std::vector<uint8_t> bytes;
  bytes.reserve(values.size());
  for (const auto value : values) {
    if (value < 0 || value > std::numeric_limits<uint8_t>::max())
      throw DecodeError(DecodeErrc::InvalidLength,
                        "keypair file '" + path + "' holds " +
                            std::to_string(value) + ", not a byte");
    bytes.push_back(static_cast<uint8_t>(value));
  }

  std::array<uint8_t, SEED_SIZE> seed;
  std::copy_n(bytes.begin(), SEED_SIZE, seed.begin());
  const Keypair result = fromSeed(seed);
  sodium_memzero(seed.data(), seed.size());

  if (!std::equal(result.privateKey.data.begin(),
                  result.privateKey.data.end(), bytes.begin()))
    throw std::runtime_error("keypair file '" + path +
                             "' public key does not match its seed");
  return result;
}

///
/// well-known programs
namespace programs {
const PublicKey &system() {
  static const PublicKey key = PublicKey::fromBase58(SYSTEM_PROGRAM_ID);
  return key;
}

const PublicKey &memo() {
  static const PublicKey key = PublicKey::fromBase58(MEMO_PROGRAM_ID);
  return key;
}

const PublicKey &computeBudget() {
  static const PublicKey key =
      PublicKey::fromBase58(COMPUTE_BUDGET_PROGRAM_ID);
  return key;
}

const PublicKey &token() {
  static const PublicKey key = PublicKey::fromBase58(TOKEN_PROGRAM_ID);
  return key;
}
}  // namespace programs

}  // namespace soltx
