#pragma once

#include <orca/schema/primitives.hpp>

#include <optional>

namespace orca::crypto {

std::optional<orca::schema::ed25519_public_key_t> derive_public_key(
    const orca::schema::ed25519_secret_key_t& secret_key);

/// Pure ed25519 signature over the message; nullopt when OpenSSL rejects the
/// key material.
std::optional<orca::schema::ed25519_signature_t> sign(
    const orca::schema::bytes_view_t& message,
    const orca::schema::ed25519_secret_key_t& secret_key);

}  // namespace orca::crypto
