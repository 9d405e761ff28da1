#include "uusid/core/random.h"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <algorithm>
#include <climits>
#include <stdexcept>
#include <string>

namespace uusid::core {

void fill_secure_random(std::uint8_t* data, const std::size_t size) {
  std::size_t offset = 0;
  while (offset < size) {
    // RAND_bytes takes an int length; chunk very large requests.
    const std::size_t chunk = std::min<std::size_t>(size - offset, INT_MAX);
    if (RAND_bytes(data + offset, static_cast<int>(chunk)) != 1) {
      throw std::runtime_error("RAND_bytes failed: " + std::to_string(ERR_get_error()));
    }
    offset += chunk;
  }
}

std::vector<std::uint8_t> secure_random_bytes(const std::size_t count) {
  std::vector<std::uint8_t> out(count);
  fill_secure_random(out.data(), out.size());
  return out;
}

}  // namespace uusid::core
