#pragma once

#include <xpii/schema/primitives.hpp>
#include <cstddef>

namespace xpii::crypto {

/// Cryptographically secure random bytes from the OpenSSL DRBG.
xpii::schema::bytes_t random_bytes(std::size_t count);

}  // namespace xpii::crypto
