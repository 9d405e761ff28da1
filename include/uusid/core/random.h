#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace uusid::core {

// secure_random_bytes returns count bytes from the OpenSSL CSPRNG.
// Throws std::runtime_error if the generator cannot be seeded; this never
// happens on a healthy host and is not a recoverable condition for callers.
[[nodiscard]] std::vector<std::uint8_t> secure_random_bytes(std::size_t count);

// fill_secure_random overwrites [data, data + size) with CSPRNG output.
void fill_secure_random(std::uint8_t* data, std::size_t size);

}  // namespace uusid::core
