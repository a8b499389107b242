#include <orca/schema/encoding/cbor/encoder.hpp>
#include <orca/selection/coin_selector.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

using namespace orca::schema;

namespace orca::selection {

namespace {

using encoder_t = orca::schema::encoding::encoder<
    orca::schema::encoding::cbor_encoder_tag>;

inline constexpr auto kUtxoEntryOverhead = uint64_t{160};

lovelace_t minimum_for_size(const transaction_output_t& output,
                            const protocol_parameters_t& parameters) {
  auto encoded = encoder_t{}.encode(output);
  return (kUtxoEntryOverhead + encoded.size()) *
         parameters.coins_per_utxo_byte;
}

struct selection_state final {
  std::vector<const utxo_t*> remaining;
  std::vector<utxo_t> chosen;
  value_t total;

  void take(std::vector<const utxo_t*>::iterator it) {
    total = add(total, (*it)->output.value);
    chosen.push_back(**it);
    remaining.erase(it);
  }
};

// Largest holding of `asset`; ties keep the coin ordering of `remaining`.
std::vector<const utxo_t*>::iterator largest_holder(selection_state& state,
                                                    const asset_id_t& asset) {
  auto best = std::end(state.remaining);
  for (auto it = std::begin(state.remaining); it != std::end(state.remaining);
       ++it) {
    if (quantity_of((*it)->output.value, asset) <= 0) {
      continue;
    }
    if (best == std::end(state.remaining) ||
        quantity_of((*it)->output.value, asset) >
            quantity_of((*best)->output.value, asset)) {
      best = it;
    }
  }
  return best;
}

value_t missing_value(const value_t& have, const value_t& need) {
  return saturating_subtract(need, have);
}

result<selection_t> insufficient(const value_t& missing) {
  spdlog::warn("Coin selection short by {}", describe(missing));
  return make_error<selection_t>(error_code::insufficient_funds,
                                 "wallet cannot cover the transaction",
                                 fmt::format("missing {}", describe(missing)));
}

}  // namespace

lovelace_t minimum_lovelace(const transaction_output_t& output,
                            const protocol_parameters_t& parameters) {
  auto sized = output;
  auto minimum = minimum_for_size(sized, parameters);
  // Raising the coin can lengthen its encoding; settle on a fixed point.
  for (auto i = 0; i < 4 && sized.value.coin < minimum; ++i) {
    sized.value.coin = minimum;
    minimum = minimum_for_size(sized, parameters);
  }
  return std::max(minimum, minimum_for_size(sized, parameters));
}

result<selection_t> select_largest_first(const selection_request_t& request) {
  auto state = selection_state{};
  state.total = request.provided;
  for (const auto& utxo : request.candidates) {
    if (!request.exclude.contains(utxo.input)) {
      state.remaining.push_back(&utxo);
    }
  }
  std::sort(std::begin(state.remaining), std::end(state.remaining),
            [](const utxo_t* lhs, const utxo_t* rhs) {
              if (lhs->output.value.coin != rhs->output.value.coin) {
                return lhs->output.value.coin > rhs->output.value.coin;
              }
              return lhs->input < rhs->input;
            });

  for (const auto& [asset, qty] : request.required.assets) {
    while (quantity_of(state.total, asset) < qty) {
      auto holder = largest_holder(state, asset);
      if (holder == std::end(state.remaining)) {
        return insufficient(missing_value(state.total, request.required));
      }
      state.take(holder);
    }
  }

  auto out = selection_t{};
  while (true) {
    if (!covers(state.total, request.required)) {
      if (state.remaining.empty()) {
        return insufficient(missing_value(state.total, request.required));
      }
      state.take(std::begin(state.remaining));
      continue;
    }

    auto change_value = saturating_subtract(state.total, request.required);
    if (is_zero(change_value)) {
      out.change.reset();
      break;
    }
    auto change = transaction_output_t{.address = request.change_address,
                                       .value = change_value};
    auto minimum = minimum_lovelace(change, request.parameters);
    if (change_value.coin >= minimum) {
      out.change = std::move(change);
      break;
    }
    if (change_value.assets.empty()) {
      out.folded_into_fee = change_value.coin;
      out.change.reset();
      break;
    }
    // Token change needs enough coin to stand as its own output.
    if (state.remaining.empty()) {
      return insufficient(make_value(minimum - change_value.coin));
    }
    state.take(std::begin(state.remaining));
  }

  std::sort(std::begin(state.chosen), std::end(state.chosen),
            [](const utxo_t& lhs, const utxo_t& rhs) {
              return lhs.input < rhs.input;
            });
  out.inputs = std::move(state.chosen);
  spdlog::debug("Selected {} input(s), change {}, folded {}",
                out.inputs.size(),
                out.change ? describe(out.change->value) : std::string{"none"},
                out.folded_into_fee);
  return make_result(std::move(out));
}

}  // namespace orca::selection
