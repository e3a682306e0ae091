#pragma once

#include <cstdint>
#include <memory>
#include <vector>

namespace nip98
{
namespace cryptography
{

class NostrSecureRng
{
public:

    /**
     * @brief Fills the given buffer with secure random bytes.
     * @param buffer The buffer to fill with random bytes.
     * @param length The number of bytes to fill.
     * @throws `std::runtime_error` if the system RNG could not produce the bytes.
     */
    static void fill(void* buffer, size_t length);

    /**
     * @brief Fills the given vector with secure random bytes.
     * @throws `std::runtime_error` if the system RNG could not produce the bytes.
     */
    static inline void fill(std::vector<uint8_t>& buffer)
    {
        fill(buffer.data(), buffer.size());
    }

    /**
     * @brief Overwrites key material and entropy so it does not linger in memory.
     * @remark The write is not elided by the optimizer.
     */
    static void zero(void* buffer, size_t length);

    /**
     * @brief Overwrites the contents of the given vector.  Its size is unchanged.
     */
    static inline void zero(std::vector<uint8_t>& buffer)
    {
        zero(buffer.data(), buffer.size());
    }
};

} // namespace cryptography
} // namespace nip98
