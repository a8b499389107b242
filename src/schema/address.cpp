#include <orca/schema/address.hpp>

#include <algorithm>
#include <iterator>

namespace orca::schema {

namespace {

// Shelley header nibble values (CIP-19).
inline constexpr uint8_t kEnterpriseKey = 0b0110;
inline constexpr uint8_t kEnterpriseScript = 0b0111;

bytes_t make_address(const uint8_t type,
                     const network_t network,
                     const hash28_t& credential) {
  auto out = bytes_t{};
  out.reserve(1 + credential.size());
  out.push_back(static_cast<uint8_t>((type << 4u) |
                                     static_cast<uint8_t>(network)));
  out.insert(std::end(out), std::begin(credential), std::end(credential));
  return out;
}

std::optional<hash28_t> payment_credential(const bytes_view_t& address,
                                           const bool want_script) {
  if (address.size() < 29) {
    return std::nullopt;
  }
  auto type = static_cast<uint8_t>(address[0] >> 4u);
  if (type > kEnterpriseScript) {
    return std::nullopt;
  }
  // Odd header types carry a script payment credential.
  auto is_script = (type & 0x1u) != 0;
  if (is_script != want_script) {
    return std::nullopt;
  }
  auto out = hash28_t{};
  std::copy_n(address.data() + 1, out.size(), out.data());
  return out;
}

}  // namespace

bytes_t make_enterprise_address(const network_t network, const key_hash_t& key) {
  return make_address(kEnterpriseKey, network, key);
}

bytes_t make_script_address(const network_t network,
                            const script_hash_t& script) {
  return make_address(kEnterpriseScript, network, script);
}

std::optional<key_hash_t> payment_key_hash(const bytes_view_t& address) {
  return payment_credential(address, false);
}

std::optional<script_hash_t> payment_script_hash(const bytes_view_t& address) {
  return payment_credential(address, true);
}

std::optional<network_t> address_network(const bytes_view_t& address) {
  if (address.empty()) {
    return std::nullopt;
  }
  switch (address[0] & 0x0Fu) {
    case 0:
      return network_t::testnet;
    case 1:
      return network_t::mainnet;
    default:
      return std::nullopt;
  }
}

}  // namespace orca::schema
