#pragma once

#include <orca/schema/primitives.hpp>

#include <functional>

namespace orca::signing {

using signature_verifier_t =
    std::function<bool(const orca::schema::bytes_view_t& message,
                       const orca::schema::ed25519_public_key_t& public_key,
                       const orca::schema::ed25519_signature_t& signature)>;

}  // namespace orca::signing
