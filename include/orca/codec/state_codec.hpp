#pragma once

#include <orca/schema/action_request.hpp>
#include <orca/schema/oracle_settings.hpp>
#include <orca/schema/oracle_state.hpp>
#include <orca/schema/primitives.hpp>
#include <orca/schema/result.hpp>
#include <orca/schema/transaction.hpp>

#include <optional>
#include <string>

// Boundary between typed oracle records and their on-chain CBOR. Every decode
// failure surfaces as schema_mismatch carrying the decoder's reason; nothing
// is coerced into a default.
namespace orca::codec {

orca::schema::bytes_t encode_state(const orca::schema::oracle_state_t& state);

/// Decode an inline datum and check its structure (unique node credentials,
/// non-negative rewards).
orca::schema::result<orca::schema::oracle_state_t> decode_state(
    const orca::schema::bytes_view_t& datum);

orca::schema::bytes_t encode_redeemer(
    const orca::schema::action_payload_t& payload);

orca::schema::result<orca::schema::action_payload_t> decode_redeemer(
    const orca::schema::bytes_view_t& redeemer);

/// Redeemer of the state NFT minting policy when Close burns the token.
orca::schema::bytes_t encode_burn_redeemer();

/// First rule the settings record breaks, or std::nullopt when it is usable.
std::optional<std::string> settings_violation(
    const orca::schema::oracle_settings_t& settings);

orca::schema::bytes_t encode_transaction(
    const orca::schema::transaction_t& transaction);

orca::schema::result<orca::schema::transaction_t> decode_transaction(
    const orca::schema::bytes_view_t& bytes);

orca::schema::bytes_t encode_body(const orca::schema::transaction_body_t& body);

/// blake2b-256 of the canonical body encoding.
orca::schema::tx_id_t transaction_id(
    const orca::schema::transaction_body_t& body);

}  // namespace orca::codec
