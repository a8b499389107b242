#pragma once

#include <orca/schema/primitives.hpp>

namespace orca::crypto {

bool available();

bool verify_signature(const orca::schema::bytes_view_t& message,
                      const orca::schema::ed25519_public_key_t& public_key,
                      const orca::schema::ed25519_signature_t& signature);

}  // namespace orca::crypto
