#pragma once
#include <orca/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace orca::hash {

/// blake2b with a 256-bit digest; transaction ids and script data hashes.
orca::schema::hash32_t blake2b_256(const orca::schema::bytes_view_t& bytes);

/// blake2b with a 224-bit digest; key hashes and script hashes.
orca::schema::hash28_t blake2b_224(const orca::schema::bytes_view_t& bytes);

orca::schema::key_hash_t key_hash(
    const orca::schema::ed25519_public_key_t& public_key);

/// Hash of a Plutus V2 script: blake2b-224 over the language tag 0x02
/// followed by the script bytes.
orca::schema::script_hash_t plutus_v2_script_hash(
    const orca::schema::bytes_view_t& script);

}  // namespace orca::hash
