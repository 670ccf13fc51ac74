#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace hydrator
{
namespace internal
{
/**
 * @brief Encodes the given bytes as a lowercase hex string.
 */
std::string toHex(const uint8_t* bytes, size_t length);

/**
 * @brief Decodes a hex string into exactly `length` bytes.
 * @returns False if the string is not `2 * length` hex digits, in which case the contents of
 * `bytes` are unspecified.
 */
bool fromHex(const std::string& hex, uint8_t* bytes, size_t length);
} // namespace internal
} // namespace hydrator
