#pragma once

#include <cstdint>
#include <string>

namespace nip98
{
namespace cryptography
{
/**
 * @brief Encodes a byte buffer as lowercase hex.
 */
std::string toHex(const uint8_t* data, size_t length);

/**
 * @brief Decodes a hex string into a fixed-size buffer.
 * @returns True if `hex` is exactly `2 * length` hex digits and was decoded, false otherwise.
 * @remark Upper- and lowercase digits are both accepted.
 */
bool fromHex(const std::string& hex, uint8_t* output, size_t length);
} // namespace cryptography
} // namespace nip98
