#pragma once

#include <memory>

#include <noscrypt.h>

namespace hydrator
{
namespace internal
{
/**
 * @brief Allocates and initializes a noscrypt context seeded with secure random entropy.
 * @returns A shared pointer that destroys and frees the context when released.
 * @throws `std::runtime_error` if the context cannot be initialized.
 */
std::shared_ptr<NCContext> initNoscryptContext();
} // namespace internal
} // namespace hydrator
