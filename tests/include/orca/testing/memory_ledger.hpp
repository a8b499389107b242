#pragma once

#include <orca/chain/chain_backend.hpp>
#include <orca/codec/state_codec.hpp>
#include <orca/crypto/verify.hpp>
#include <orca/hash/blake2b.hpp>
#include <orca/schema/value.hpp>
#include <orca/submission/submission_service.hpp>

#include <algorithm>
#include <cstdint>
#include <map>
#include <set>
#include <vector>

namespace orca::testing {

/// Single-process stand-in for the indexer and the node. Submitted
/// transactions are validated the way the ledger phase-1 rules would
/// (unspent inputs, validity interval, witnesses, value conservation) and
/// applied immediately.
class memory_ledger final : public orca::chain::chain_backend,
                            public orca::submission::submission_service {
 public:
  memory_ledger() {
    slot_config_.zero_time = 1'700'000'000'000;
    slot_config_.zero_slot = 0;
    slot_config_.slot_length = 1000;
  }

  orca::schema::output_reference_t add_utxo(
      orca::schema::transaction_output_t output) {
    auto reference = orca::schema::output_reference_t{
        .tx_id = genesis_id(), .index = next_genesis_index_++};
    utxos_.emplace(reference, std::move(output));
    return reference;
  }

  void remove_utxo(const orca::schema::output_reference_t& reference) {
    utxos_.erase(reference);
  }

  void advance(const orca::schema::slot_t slots) { tip_ += slots; }
  void set_tip(const orca::schema::slot_t tip) { tip_ = tip; }
  void set_network_down(const bool down) { network_down_ = down; }
  void set_confirmation_delay(const std::size_t polls) {
    confirmation_delay_ = polls;
  }

  orca::schema::protocol_parameters_t& parameters() { return parameters_; }
  orca::schema::timestamp_milliseconds_t now() const {
    return orca::schema::slot_to_posix(slot_config_, tip_);
  }

  std::size_t queries() const { return queries_; }
  std::size_t submissions() const { return submissions_; }

  orca::schema::result<std::vector<orca::schema::utxo_t>> utxos_at(
      const orca::schema::bytes_view_t& address) override {
    if (network_down_) {
      return unreachable<std::vector<orca::schema::utxo_t>>();
    }
    ++queries_;
    auto out = std::vector<orca::schema::utxo_t>{};
    for (const auto& [reference, output] : utxos_) {
      if (std::ranges::equal(output.address, address)) {
        out.push_back(orca::schema::utxo_t{.input = reference,
                                           .output = output});
      }
    }
    return orca::schema::make_result(std::move(out));
  }

  orca::schema::result<std::vector<orca::schema::utxo_t>> utxos_by_reference(
      const std::vector<orca::schema::output_reference_t>& references)
      override {
    if (network_down_) {
      return unreachable<std::vector<orca::schema::utxo_t>>();
    }
    ++queries_;
    auto out = std::vector<orca::schema::utxo_t>{};
    for (const auto& reference : references) {
      auto it = utxos_.find(reference);
      if (it != std::end(utxos_)) {
        out.push_back(orca::schema::utxo_t{.input = it->first,
                                           .output = it->second});
      }
    }
    return orca::schema::make_result(std::move(out));
  }

  orca::schema::result<orca::schema::slot_t> tip() override {
    if (network_down_) {
      return unreachable<orca::schema::slot_t>();
    }
    return orca::schema::make_result(tip_);
  }

  orca::schema::result<orca::schema::protocol_parameters_t>
  protocol_parameters() override {
    if (network_down_) {
      return unreachable<orca::schema::protocol_parameters_t>();
    }
    return orca::schema::make_result(parameters_);
  }

  orca::schema::slot_config_t slot_config() const override {
    return slot_config_;
  }

  orca::schema::result<orca::schema::tx_id_t> submit(
      const orca::schema::bytes_view_t& signed_transaction) override {
    if (network_down_) {
      return unreachable<orca::schema::tx_id_t>();
    }
    ++submissions_;
    auto decoded = orca::codec::decode_transaction(signed_transaction);
    if (!decoded) {
      return reject("DeserialiseFailure");
    }
    const auto& body = decoded->body;
    auto tx_id = orca::codec::transaction_id(body);

    auto consumed = orca::schema::value_t{};
    for (const auto& input : body.inputs) {
      auto it = utxos_.find(input);
      if (it == std::end(utxos_)) {
        return reject("BadInputsUTxO");
      }
      consumed = orca::schema::add(consumed, it->second.value);
    }
    if (body.ttl && tip_ > *body.ttl) {
      return reject("OutsideValidityIntervalUTxO");
    }
    if (body.validity_start && tip_ < *body.validity_start) {
      return reject("OutsideValidityIntervalUTxO");
    }

    auto signers = std::set<orca::schema::key_hash_t>{};
    for (const auto& witness : decoded->witnesses.vkey_witnesses) {
      if (!orca::crypto::verify_signature(
              orca::schema::bytes_view_t{tx_id.data(), tx_id.size()},
              witness.vkey, witness.signature)) {
        return reject("InvalidWitnessesUTXOW");
      }
      signers.insert(orca::hash::key_hash(witness.vkey));
    }
    for (const auto& required : body.required_signers) {
      if (!signers.contains(required)) {
        return reject("MissingVKeyWitnessesUTXOW");
      }
    }

    auto minted = orca::schema::apply_mint(consumed, body.mint);
    auto produced = orca::schema::make_value(body.fee);
    for (const auto& output : body.outputs) {
      produced = orca::schema::add(produced, output.value);
    }
    if (!minted || *minted != produced) {
      return reject("ValueNotConservedUTxO");
    }

    for (const auto& input : body.inputs) {
      utxos_.erase(input);
    }
    for (std::size_t i = 0; i < body.outputs.size(); ++i) {
      utxos_.emplace(
          orca::schema::output_reference_t{.tx_id = tx_id,
                                           .index = static_cast<uint32_t>(i)},
          body.outputs[i]);
    }
    applied_.emplace(tx_id, 0);
    return orca::schema::make_result(tx_id);
  }

  orca::schema::result<bool> is_confirmed(
      const orca::schema::tx_id_t& tx_id) override {
    if (network_down_) {
      return unreachable<bool>();
    }
    auto it = applied_.find(tx_id);
    if (it == std::end(applied_)) {
      return orca::schema::make_result(false);
    }
    return orca::schema::make_result(it->second++ >= confirmation_delay_);
  }

 private:
  template <typename T>
  static orca::schema::result<T> unreachable() {
    return orca::schema::make_error<T>(orca::schema::error_code::network_error,
                                       "node unreachable");
  }

  static orca::schema::result<orca::schema::tx_id_t> reject(
      const char* reason) {
    return orca::schema::make_error<orca::schema::tx_id_t>(
        orca::schema::error_code::rejected, "ledger rejected transaction",
        reason);
  }

  static orca::schema::tx_id_t genesis_id() {
    auto id = orca::schema::tx_id_t{};
    id.fill(0xee);
    return id;
  }

  std::map<orca::schema::output_reference_t, orca::schema::transaction_output_t>
      utxos_;
  std::map<orca::schema::tx_id_t, std::size_t> applied_;
  orca::schema::protocol_parameters_t parameters_;
  orca::schema::slot_config_t slot_config_;
  orca::schema::slot_t tip_{100'000};
  uint32_t next_genesis_index_{0};
  std::size_t confirmation_delay_{0};
  std::size_t queries_{0};
  std::size_t submissions_{0};
  bool network_down_{false};
};

}  // namespace orca::testing
