#pragma once

#include <orca/schema/network.hpp>
#include <orca/schema/primitives.hpp>

#include <optional>

// Shelley address helpers. Only the payment part is interpreted; stake
// credentials are carried through untouched.
namespace orca::schema {

bytes_t make_enterprise_address(network_t network, const key_hash_t& key);
bytes_t make_script_address(network_t network, const script_hash_t& script);

std::optional<key_hash_t> payment_key_hash(const bytes_view_t& address);
std::optional<script_hash_t> payment_script_hash(const bytes_view_t& address);
std::optional<network_t> address_network(const bytes_view_t& address);

}  // namespace orca::schema
