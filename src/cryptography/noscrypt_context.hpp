#pragma once

#include <memory>

#include <noscrypt.h>

namespace nip98
{
namespace cryptography
{
/**
 * @brief Allocates and initializes a noscrypt library context with fresh random entropy.
 * @returns A context that is destroyed and freed when the last reference is released.
 * @throws `std::runtime_error` if the context could not be initialized.
 */
std::shared_ptr<NCContext> createNoscryptContext();
} // namespace cryptography
} // namespace nip98
