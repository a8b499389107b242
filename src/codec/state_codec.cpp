#include <orca/codec/state_codec.hpp>
#include <orca/hash/blake2b.hpp>
#include <orca/schema/encoding/cbor/encoder.hpp>
#include <orca/schema/encoding/cbor/plutus_data.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <set>

namespace orca::codec {

namespace {

using encoder_t = orca::schema::encoding::encoder<
    orca::schema::encoding::cbor_encoder_tag>;

template <typename T>
orca::schema::result<T> decode_checked(const orca::schema::bytes_view_t& bytes,
                                       const std::string_view what) {
  auto encoder = encoder_t{};
  auto error = std::string{};
  auto decoded = encoder.try_decode<T>(bytes, error);
  if (!decoded) {
    spdlog::warn("Rejected {} encoding: {}", what, error);
    return orca::schema::make_error<T>(
        orca::schema::error_code::schema_mismatch,
        fmt::format("malformed {}", what), error);
  }
  return orca::schema::make_result(std::move(*decoded));
}

}  // namespace

orca::schema::bytes_t encode_state(const orca::schema::oracle_state_t& state) {
  return encoder_t{}.encode(state);
}

orca::schema::result<orca::schema::oracle_state_t> decode_state(
    const orca::schema::bytes_view_t& datum) {
  auto decoded = decode_checked<orca::schema::oracle_state_t>(datum, "datum");
  if (!decoded) {
    return decoded;
  }

  auto operators = std::set<orca::schema::key_hash_t>{};
  for (const auto& node : decoded->nodes) {
    if (!operators.insert(node.operator_key).second) {
      return orca::schema::make_error<orca::schema::oracle_state_t>(
          orca::schema::error_code::schema_mismatch,
          "datum lists a node twice",
          orca::schema::to_hex(node.operator_key));
    }
    if (node.reward < 0) {
      return orca::schema::make_error<orca::schema::oracle_state_t>(
          orca::schema::error_code::schema_mismatch,
          "datum carries a negative node reward",
          orca::schema::to_hex(node.operator_key));
    }
  }
  if (decoded->platform_reward < 0) {
    return orca::schema::make_error<orca::schema::oracle_state_t>(
        orca::schema::error_code::schema_mismatch,
        "datum carries a negative platform reward");
  }
  return decoded;
}

orca::schema::bytes_t encode_redeemer(
    const orca::schema::action_payload_t& payload) {
  return encoder_t{}.encode(payload);
}

orca::schema::result<orca::schema::action_payload_t> decode_redeemer(
    const orca::schema::bytes_view_t& redeemer) {
  return decode_checked<orca::schema::action_payload_t>(redeemer, "redeemer");
}

orca::schema::bytes_t encode_burn_redeemer() {
  auto out = orca::schema::encoding::cbor::writer{};
  orca::schema::encoding::cbor::begin_constr(out, 0, 0);
  orca::schema::encoding::cbor::end_list(out, 0);
  return out.release();
}

std::optional<std::string> settings_violation(
    const orca::schema::oracle_settings_t& settings) {
  if (settings.min_nodes < 1) {
    return "minimum node count must be at least 1";
  }
  if (settings.node_staleness == 0) {
    return "node staleness must be positive";
  }
  if (settings.aggregate_time == 0) {
    return "aggregate time must be positive";
  }
  if (settings.aggregate_change == 0) {
    return "aggregate change must be positive";
  }
  if (settings.iqr_multiplier == 0) {
    return "IQR multiplier must be positive";
  }
  if (settings.divergence == 0) {
    return "divergence must be positive";
  }
  const auto& rewards = settings.rewards;
  if (rewards.node_fee < 0 || rewards.aggregate_fee < 0 ||
      rewards.platform_fee < 0) {
    return "fees must not be negative";
  }
  const auto& platform = settings.platform;
  if (platform.threshold > platform.signers.size()) {
    return fmt::format("platform threshold {} exceeds {} platform keys",
                       platform.threshold, platform.signers.size());
  }
  auto unique = std::set<orca::schema::key_hash_t>{
      std::begin(platform.signers), std::end(platform.signers)};
  if (unique.size() != platform.signers.size()) {
    return "platform keys must be unique";
  }
  if (settings.fee_token.asset_name.size() > 32) {
    return "fee token name exceeds 32 bytes";
  }
  return std::nullopt;
}

orca::schema::bytes_t encode_transaction(
    const orca::schema::transaction_t& transaction) {
  return encoder_t{}.encode(transaction);
}

orca::schema::result<orca::schema::transaction_t> decode_transaction(
    const orca::schema::bytes_view_t& bytes) {
  return decode_checked<orca::schema::transaction_t>(bytes, "transaction");
}

orca::schema::bytes_t encode_body(
    const orca::schema::transaction_body_t& body) {
  return encoder_t{}.encode(body);
}

orca::schema::tx_id_t transaction_id(
    const orca::schema::transaction_body_t& body) {
  auto encoded = encode_body(body);
  return orca::hash::blake2b_256(orca::schema::make_bytes_view(encoded));
}

}  // namespace orca::codec
