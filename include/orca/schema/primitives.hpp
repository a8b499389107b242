#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace orca::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using hash28_t = std::array<uint8_t, 28>;
using tx_id_t = hash32_t;
using key_hash_t = hash28_t;     // blake2b-224 of an ed25519 verification key
using script_hash_t = hash28_t;  // blake2b-224 of a tagged script
using policy_id_t = script_hash_t;
using lovelace_t = uint64_t;
using quantity_t = int64_t;
using slot_t = uint64_t;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

using ed25519_public_key_t = std::array<uint8_t, 32>;
using ed25519_secret_key_t = std::array<uint8_t, 32>;  // RFC 8032 seed
using ed25519_signature_t = std::array<uint8_t, 64>;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view& hex);
bytes_t from_hex(const std::string_view& hex);

hash32_t make_hash32(const bytes_view_t& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
std::optional<hash28_t> try_make_hash28(const std::string_view& hex);
hash28_t make_hash28(const std::string_view& hex);
hash32_t make_zero_hash();

template <std::size_t N>
std::string to_hex(const std::array<uint8_t, N>& bytes) {
  return to_hex(bytes_view_t{bytes.data(), bytes.size()});
}

}  // namespace orca::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
