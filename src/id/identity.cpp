#include "uusid/id/identity.h"

#include "uusid/core/hex.h"
#include "uusid/core/random.h"

#include <ifaddrs.h>
#include <linux/if_packet.h>
#include <net/if.h>
#include <sys/socket.h>

#include <array>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>

namespace uusid::id {

namespace {

// RAII owner for the getifaddrs() list.
struct IfAddrsDeleter {
  void operator()(ifaddrs* list) const {
    if (list != nullptr) {
      freeifaddrs(list);
    }
  }
};

std::uint64_t bytes_to_node(const std::uint8_t* bytes) {
  std::uint64_t node = 0;
  for (unsigned i = 0; i < 6U; ++i) {
    node = (node << 8U) | bytes[i];
  }
  return node;
}

}  // namespace

std::optional<std::uint64_t> hardware_node_id() {
  ifaddrs* raw = nullptr;
  if (getifaddrs(&raw) != 0) {
    return std::nullopt;
  }
  const std::unique_ptr<ifaddrs, IfAddrsDeleter> list(raw);

  for (const ifaddrs* it = list.get(); it != nullptr; it = it->ifa_next) {
    if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_PACKET) {
      continue;
    }
    if ((it->ifa_flags & IFF_LOOPBACK) != 0U) {
      continue;
    }

    const auto* link = reinterpret_cast<const sockaddr_ll*>(it->ifa_addr);  // NOLINT
    if (link->sll_halen != 6) {
      continue;
    }

    const std::uint64_t node = bytes_to_node(link->sll_addr);
    if (node != 0U) {
      return node;
    }
  }

  return std::nullopt;
}

std::uint64_t random_node_id() {
  std::array<std::uint8_t, 6> bytes{};
  core::fill_secure_random(bytes.data(), bytes.size());
  return bytes_to_node(bytes.data()) | kMulticastBit;
}

std::uint16_t random_clock_seq() {
  std::array<std::uint8_t, 2> bytes{};
  core::fill_secure_random(bytes.data(), bytes.size());
  return static_cast<std::uint16_t>(((bytes[0] << 8U) | bytes[1]) & kClockSeqMask);
}

core::Result<std::uint64_t> parse_node_id(const std::string_view text) {
  std::string digits;
  digits.reserve(12);
  for (const char ch : text) {
    if (ch == ':' || ch == '-') {
      continue;
    }
    if (!core::is_hex_digit(ch)) {
      return core::fail<std::uint64_t>(core::ErrorKind::kConfiguration,
                                       "node id contains a non-hex character: '" +
                                           std::string{text} + "'");
    }
    digits.push_back(ch);
  }

  if (digits.size() != 12U) {
    return core::fail<std::uint64_t>(core::ErrorKind::kConfiguration,
                                     "node id must be 12 hex digits (48 bits), got " +
                                         std::to_string(digits.size()));
  }

  std::uint64_t node = 0;
  for (const char ch : digits) {
    node = (node << 4U) | core::hex_value(ch);
  }
  return core::Result<std::uint64_t>::ok(node);
}

std::string format_node_id(const std::uint64_t node_id) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0') << std::setw(12) << (node_id & kNodeMask);
  return oss.str();
}

GeneratorIdentity make_identity(const std::optional<std::uint64_t> node_id,
                                const std::optional<std::uint16_t> clock_seq,
                                const NodeSource source) {
  GeneratorIdentity identity;

  if (node_id.has_value()) {
    identity.node_id = node_id.value() & kNodeMask;
  } else {
    std::optional<std::uint64_t> hardware;
    if (source == NodeSource::kHardwareThenRandom) {
      hardware = hardware_node_id();
    }
    identity.node_id = hardware.has_value() ? hardware.value() : random_node_id();
  }

  identity.clock_seq = clock_seq.has_value()
                           ? static_cast<std::uint16_t>(clock_seq.value() & kClockSeqMask)
                           : random_clock_seq();
  return identity;
}

}  // namespace uusid::id
