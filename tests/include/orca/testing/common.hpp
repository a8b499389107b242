#pragma once

#include <orca/crypto/sign.hpp>
#include <orca/hash/blake2b.hpp>
#include <orca/schema/primitives.hpp>
#include <orca/schema/transaction.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace orca::testing {

inline orca::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = orca::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline orca::schema::key_hash_t make_key_hash(const uint8_t seed) {
  auto out = orca::schema::key_hash_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Deterministic ed25519 key pair with its credential.
struct signing_key_t final {
  orca::schema::ed25519_secret_key_t secret{};
  orca::schema::ed25519_public_key_t vkey{};
  orca::schema::key_hash_t key_hash{};
};

inline signing_key_t make_signing_key(const uint8_t seed) {
  auto key = signing_key_t{};
  for (std::size_t i = 0; i < key.secret.size(); ++i) {
    key.secret[i] = static_cast<uint8_t>((seed * 31) + static_cast<uint8_t>(i));
  }
  auto vkey = orca::crypto::derive_public_key(key.secret);
  if (!vkey) {
    throw std::runtime_error{"ed25519 key derivation failed"};
  }
  key.vkey = *vkey;
  key.key_hash = orca::hash::key_hash(key.vkey);
  return key;
}

inline orca::schema::vkey_witness_t make_witness(
    const signing_key_t& key,
    const orca::schema::tx_id_t& tx_id) {
  auto signature = orca::crypto::sign(
      orca::schema::bytes_view_t{tx_id.data(), tx_id.size()}, key.secret);
  if (!signature) {
    throw std::runtime_error{"ed25519 signing failed"};
  }
  return orca::schema::vkey_witness_t{.vkey = key.vkey,
                                      .signature = *signature};
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace orca::testing
