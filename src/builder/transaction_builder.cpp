#include <orca/builder/transaction_builder.hpp>
#include <orca/codec/state_codec.hpp>
#include <orca/common/critical.hpp>
#include <orca/hash/blake2b.hpp>
#include <orca/schema/address.hpp>
#include <orca/schema/encoding/cbor/encoder.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

using namespace orca::schema;

namespace orca::builder {

namespace {

using encoder_t = orca::schema::encoding::encoder<
    orca::schema::encoding::cbor_encoder_tag>;

// Parts of the transaction fixed by the transition, before balancing.
struct draft_t final {
  std::vector<utxo_t> fixed_inputs;
  std::vector<transaction_output_t> outputs;
  mint_t mint;
  std::vector<bytes_t> scripts;
  std::vector<output_reference_t> reference_inputs;
  std::optional<bytes_t> spend_redeemer;
  std::optional<bytes_t> mint_redeemer;
  std::vector<key_hash_t> required_signers;

  bool runs_scripts() const { return spend_redeemer || mint_redeemer; }
};

lovelace_t ceil_ratio(const uint64_t amount, const rational_t& ratio) {
  if (ratio.denominator == 0) {
    orca::common::critical("protocol parameter with zero denominator");
  }
  return ((amount * ratio.numerator) + ratio.denominator - 1) /
         ratio.denominator;
}

value_t sum_outputs(const std::vector<transaction_output_t>& outputs) {
  auto total = value_t{};
  for (const auto& output : outputs) {
    total = add(total, output.value);
  }
  return total;
}

value_t sum_inputs(const std::vector<utxo_t>& inputs) {
  auto total = value_t{};
  for (const auto& input : inputs) {
    total = add(total, input.output.value);
  }
  return total;
}

value_t burned_value(const mint_t& mint) {
  auto burned = value_t{};
  for (const auto& [asset, qty] : mint) {
    if (qty < 0) {
      adjust_asset(burned, asset, -qty);
    }
  }
  return burned;
}

value_t minted_value(const mint_t& mint) {
  auto minted = value_t{};
  for (const auto& [asset, qty] : mint) {
    if (qty > 0) {
      adjust_asset(minted, asset, qty);
    }
  }
  return minted;
}

void raise_to_minimum(transaction_output_t& output,
                      const protocol_parameters_t& parameters) {
  output.value.coin = std::max(
      output.value.coin,
      orca::selection::minimum_lovelace(output, parameters));
}

draft_t make_draft(const oracle_config_t& config,
                   const orca::chain::chain_snapshot_t& snapshot,
                   const action_request_t& request,
                   const orca::policy::transition_t& transition) {
  const auto& state_utxo = snapshot.oracle.utxo;
  const auto& fee_token = snapshot.oracle.state.settings.fee_token;
  const auto& parameters = snapshot.parameters;

  auto draft = draft_t{};
  draft.required_signers = transition.required_signers;

  if (transition.next_state || transition.burn_state_token) {
    draft.fixed_inputs.push_back(state_utxo);
    draft.spend_redeemer = orca::codec::encode_redeemer(request.payload);
    if (snapshot.reference_script) {
      draft.reference_inputs.push_back(snapshot.reference_script->input);
    } else {
      draft.scripts.push_back(config.validator_script);
    }
  }

  auto paid = quantity_t{};
  for (const auto& payout : transition.payouts) {
    paid += payout.amount;
  }

  if (transition.next_state) {
    auto output = transaction_output_t{
        .address = config.oracle_address,
        .value = state_utxo.output.value,
        .datum = orca::codec::encode_state(*transition.next_state)};
    if (!adjust_asset(output.value, fee_token, transition.funding - paid)) {
      orca::common::critical("state output fee-token balance went negative");
    }
    raise_to_minimum(output, parameters);
    draft.outputs.push_back(std::move(output));
  }

  // Whatever the state UTxO held besides the NFT and the fee tokens.
  auto residual = state_utxo.output.value;
  adjust_asset(residual, config.state_nft,
               -quantity_of(residual, config.state_nft));
  adjust_asset(residual, fee_token, -quantity_of(residual, fee_token));
  auto residual_paid = false;

  for (const auto& payout : transition.payouts) {
    auto value = make_value(0, fee_token, payout.amount);
    auto takes_residual = transition.residual_recipient && !residual_paid &&
                          payout.recipient == *transition.residual_recipient;
    if (payout.amount <= 0 && !takes_residual) {
      continue;
    }
    if (takes_residual) {
      value = add(value, residual);
      residual_paid = true;
    }
    auto output = transaction_output_t{
        .address = make_enterprise_address(config.network, payout.recipient),
        .value = std::move(value)};
    raise_to_minimum(output, parameters);
    draft.outputs.push_back(std::move(output));
  }
  if (transition.residual_recipient && !residual_paid) {
    orca::common::critical("residual state value has no recipient");
  }

  if (transition.burn_state_token) {
    draft.mint[config.state_nft] = -1;
    draft.mint_redeemer = orca::codec::encode_burn_redeemer();
    draft.scripts.push_back(config.minting_policy_script);
  }

  if (std::holds_alternative<create_reference_script_t>(request.payload)) {
    auto output =
        transaction_output_t{.address = config.reference_script_address,
                             .value = make_value(0),
                             .reference_script = config.validator_script};
    raise_to_minimum(output, parameters);
    draft.outputs.push_back(std::move(output));
  }
  return draft;
}

std::optional<utxo_t> pick_collateral(
    const orca::chain::chain_snapshot_t& snapshot,
    const std::set<output_reference_t>& exclude,
    const lovelace_t needed) {
  auto best = std::optional<utxo_t>{};
  for (const auto& utxo : snapshot.wallet_utxos) {
    if (exclude.contains(utxo.input) || !utxo.output.value.assets.empty() ||
        utxo.output.value.coin < needed) {
      continue;
    }
    if (!best || utxo.output.value.coin > best->output.value.coin) {
      best = utxo;
    }
  }
  return best;
}

lovelace_t estimate_fee(const transaction_t& tx,
                        const std::size_t signers,
                        const protocol_parameters_t& parameters,
                        std::size_t& size) {
  auto padded = tx;
  padded.witnesses.vkey_witnesses.assign(signers, vkey_witness_t{});
  size = orca::codec::encode_transaction(padded).size();
  auto fee = (parameters.min_fee_a * size) + parameters.min_fee_b;
  for (const auto& redeemer : tx.witnesses.redeemers) {
    fee += execution_cost(redeemer.ex_units, parameters);
  }
  return fee;
}

hash32_t script_data_hash(const std::vector<redeemer_t>& redeemers,
                          const protocol_parameters_t& parameters) {
  auto material = encoder_t{}.encode(redeemers);
  material.insert(std::end(material), std::begin(parameters.language_views),
                  std::end(parameters.language_views));
  return orca::hash::blake2b_256(make_bytes_view(material));
}

void check_conservation(const std::vector<utxo_t>& inputs,
                        const transaction_body_t& body) {
  auto consumed = apply_mint(sum_inputs(inputs), body.mint);
  auto produced = add(sum_outputs(body.outputs), make_value(body.fee));
  if (!consumed || *consumed != produced) {
    spdlog::critical("Value not conserved: consumed {}, produced {}",
                     consumed ? describe(*consumed) : std::string{"invalid"},
                     describe(produced));
    orca::common::critical("built transaction does not conserve value");
  }
}

}  // namespace

lovelace_t execution_cost(const ex_units_t& units,
                          const protocol_parameters_t& parameters) {
  return ceil_ratio(units.memory, parameters.price_memory) +
         ceil_ratio(units.steps, parameters.price_steps);
}

lovelace_t required_collateral(const lovelace_t fee,
                               const lovelace_t configured_minimum,
                               const protocol_parameters_t& parameters) {
  auto scaled =
      ((fee * parameters.collateral_percentage) + 99) / uint64_t{100};
  return std::max(scaled, configured_minimum);
}

transaction_builder::transaction_builder(
    oracle_config_t config,
    orca::selection::coin_selector_t selector)
    : config_(std::move(config)), selector_(std::move(selector)) {}

result<built_transaction_t> transaction_builder::build(
    orca::chain::chain_query& query,
    const bytes_view_t& wallet_address,
    const action_request_t& request) const {
  auto snapshot = query.resolve_snapshot(wallet_address);
  if (!snapshot) {
    return forward_error<built_transaction_t>(snapshot);
  }
  return build(*snapshot, request);
}

result<built_transaction_t> transaction_builder::build(
    const orca::chain::chain_snapshot_t& snapshot,
    const action_request_t& request) const {
  const auto& state_utxo = snapshot.oracle.utxo;
  const auto& state = snapshot.oracle.state;

  auto context = orca::policy::transition_context_t{
      .now = snapshot.now,
      .fee_token_balance =
          quantity_of(state_utxo.output.value, state.settings.fee_token),
      .reference_script_exists = snapshot.reference_script.has_value()};
  auto transition = orca::policy::evaluate_transition(state, request, context);
  if (!transition) {
    return forward_error<built_transaction_t>(transition);
  }

  auto draft = make_draft(config_, snapshot, request, *transition);
  if (auto wallet_key = payment_key_hash(snapshot.wallet_address)) {
    draft.required_signers.push_back(*wallet_key);
  }
  std::sort(std::begin(draft.required_signers),
            std::end(draft.required_signers));
  draft.required_signers.erase(std::unique(std::begin(draft.required_signers),
                                           std::end(draft.required_signers)),
                               std::end(draft.required_signers));

  auto exclude = std::set<output_reference_t>{state_utxo.input};
  if (snapshot.reference_script) {
    exclude.insert(snapshot.reference_script->input);
  }

  auto request_template = orca::selection::selection_request_t{
      .provided = add(sum_inputs(draft.fixed_inputs), minted_value(draft.mint)),
      .candidates = snapshot.wallet_utxos,
      .exclude = exclude,
      .change_address = snapshot.wallet_address,
      .parameters = snapshot.parameters};
  auto fixed_spend = add(sum_outputs(draft.outputs), burned_value(draft.mint));

  auto fee = lovelace_t{snapshot.parameters.min_fee_b};
  auto built = std::optional<transaction_t>{};
  auto inputs = std::vector<utxo_t>{};
  for (auto iteration = 0; iteration < kMaxFeeIterations; ++iteration) {
    auto selection_request = request_template;
    selection_request.required = add(fixed_spend, make_value(fee));
    auto selection = selector_(selection_request);
    if (!selection) {
      return forward_error<built_transaction_t>(selection);
    }

    inputs = draft.fixed_inputs;
    inputs.insert(std::end(inputs), std::begin(selection->inputs),
                  std::end(selection->inputs));
    std::sort(std::begin(inputs), std::end(inputs),
              [](const utxo_t& lhs, const utxo_t& rhs) {
                return lhs.input < rhs.input;
              });

    auto tx = transaction_t{};
    auto& body = tx.body;
    for (const auto& input : inputs) {
      body.inputs.push_back(input.input);
    }
    body.outputs = draft.outputs;
    if (selection->change) {
      body.outputs.push_back(*selection->change);
    }
    body.fee = fee + selection->folded_into_fee;
    body.validity_start = snapshot.tip;
    body.ttl = snapshot.tip + config_.ttl_slots;
    body.mint = draft.mint;
    body.required_signers = draft.required_signers;
    body.reference_inputs = draft.reference_inputs;
    tx.witnesses.plutus_v2_scripts = draft.scripts;

    if (draft.spend_redeemer) {
      auto position = std::ranges::find(body.inputs, state_utxo.input);
      tx.witnesses.redeemers.push_back(redeemer_t{
          .tag = redeemer_tag_t::spend,
          .index = static_cast<uint32_t>(
              std::distance(std::begin(body.inputs), position)),
          .data = *draft.spend_redeemer,
          .ex_units = config_.spend_ex_units});
    }
    if (draft.mint_redeemer) {
      tx.witnesses.redeemers.push_back(
          redeemer_t{.tag = redeemer_tag_t::mint,
                     .index = 0,
                     .data = *draft.mint_redeemer,
                     .ex_units = config_.mint_ex_units});
    }

    if (draft.runs_scripts()) {
      auto needed = required_collateral(body.fee, config_.collateral_minimum,
                                        snapshot.parameters);
      auto collateral = pick_collateral(snapshot, exclude, needed);
      if (!collateral) {
        return make_error<built_transaction_t>(
            error_code::insufficient_funds,
            "wallet holds no pure-coin UTxO usable as collateral",
            fmt::format("collateral of {} lovelace required", needed));
      }
      body.collateral.push_back(collateral->input);
      body.script_data_hash =
          script_data_hash(tx.witnesses.redeemers, snapshot.parameters);
    }

    auto size = std::size_t{};
    auto estimate = estimate_fee(tx, draft.required_signers.size(),
                                 snapshot.parameters, size);
    spdlog::debug("Fee iteration {}: fee {}, estimate {}, size {} bytes",
                  iteration, body.fee, estimate, size);
    if (size > snapshot.parameters.max_tx_size) {
      return make_error<built_transaction_t>(
          error_code::fee_estimation_failed, "transaction exceeds size limit",
          fmt::format("{} > {} bytes", size,
                      snapshot.parameters.max_tx_size));
    }
    if (estimate <= body.fee) {
      built = std::move(tx);
      break;
    }
    fee = estimate;
  }

  if (!built) {
    return make_error<built_transaction_t>(
        error_code::fee_estimation_failed, "fee estimation did not converge",
        fmt::format("{} iterations", kMaxFeeIterations));
  }

  check_conservation(inputs, built->body);

  auto out = built_transaction_t{};
  out.tx_id = orca::codec::transaction_id(built->body);
  out.bytes = orca::codec::encode_transaction(*built);
  out.transaction = std::move(*built);
  out.required_signers = draft.required_signers;
  out.next_state = transition->next_state;

  spdlog::info("Built {} transaction {} ({} inputs, {} outputs, fee {})",
               action_name(request.payload), to_hex(out.tx_id),
               out.transaction.body.inputs.size(),
               out.transaction.body.outputs.size(), out.transaction.body.fee);
  return make_result(std::move(out));
}

}  // namespace orca::builder
