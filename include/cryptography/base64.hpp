#pragma once

#include <string>

namespace nip98
{
namespace cryptography
{
/**
 * @brief Standard (RFC 4648) base64 with padding, backed by OpenSSL.
 */
class Base64
{
public:
    /**
     * @brief Computes the length of a base64 encoded string, excluding the terminating null.
     * @param n The length of the string to be encoded.
     */
    inline static size_t encodedSize(const size_t n)
    {
        return ((n + 2) / 3) << 2;
    };

    static std::string encode(const std::string& str);

    /**
     * @brief Decodes a padded base64 string.
     * @throws `std::invalid_argument` if the input is empty, is not a multiple of four characters
     * long, or contains characters outside the base64 alphabet (whitespace included).
     */
    static std::string decode(const std::string& str);
};
} // namespace cryptography
} // namespace nip98
