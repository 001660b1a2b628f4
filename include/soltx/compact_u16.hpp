#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace soltx {

/**
 * Variable width length prefix of the wire format: 7 bits of magnitude per
 * byte, high bit set on every byte but the last, at most 3 bytes
 */
namespace CompactU16 {
constexpr size_t MAX_ENCODING_LENGTH = 3;

void encode(uint16_t num, std::vector<uint8_t> &buffer);

/**
 * length prefix followed by the raw bytes of vec
 */
void encode(const std::vector<uint8_t> &vec, std::vector<uint8_t> &buffer);

/**
 * Decode the value starting at buffer[offset] and advance offset past it.
 * Throws DecodeError on truncated, overlong or non-canonical input.
 */
uint16_t decode(const std::vector<uint8_t> &buffer, size_t &offset);
}  // namespace CompactU16

}  // namespace soltx
