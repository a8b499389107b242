#include <orca/codec/state_codec.hpp>
#include <orca/policy/consensus.hpp>
#include <orca/policy/state_machine.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <set>

using namespace orca::schema;

namespace orca::policy {

namespace {

using transition_result_t = result<transition_t>;

transition_result_t illegal(std::string log, std::string info = {}) {
  return make_error<transition_t>(error_code::illegal_transition,
                                  std::move(log), std::move(info));
}

std::vector<key_hash_t> sorted_unique(std::vector<key_hash_t> keys) {
  std::sort(std::begin(keys), std::end(keys));
  keys.erase(std::unique(std::begin(keys), std::end(keys)), std::end(keys));
  return keys;
}

bool has_duplicates(const std::vector<key_hash_t>& keys) {
  return sorted_unique(keys).size() != keys.size();
}

// Owner actions: the owner signs together with at least `threshold` distinct
// members of the platform list.
std::optional<std::string> owner_violation(const oracle_state_t& state,
                                           const action_request_t& request) {
  const auto& settings = state.settings;
  if (request.caller != settings.owner) {
    return fmt::format("caller {} is not the oracle owner",
                       to_hex(request.caller));
  }
  if (has_duplicates(request.platform_signers)) {
    return std::string{"platform signers repeat a key"};
  }
  for (const auto& signer : request.platform_signers) {
    if (std::ranges::find(settings.platform.signers, signer) ==
        std::end(settings.platform.signers)) {
      return fmt::format("{} is not a platform signer", to_hex(signer));
    }
  }
  if (request.platform_signers.size() < settings.platform.threshold) {
    return fmt::format("{} platform signatures offered, {} required",
                       request.platform_signers.size(),
                       settings.platform.threshold);
  }
  return std::nullopt;
}

std::vector<key_hash_t> owner_signers(const oracle_state_t& state,
                                      const action_request_t& request) {
  auto signers = request.platform_signers;
  signers.push_back(state.settings.owner);
  return sorted_unique(std::move(signers));
}

transition_t update_with(const oracle_state_t& next,
                         std::vector<key_hash_t> signers) {
  auto out = transition_t{};
  out.next_state = next;
  out.required_signers = sorted_unique(std::move(signers));
  return out;
}

transition_result_t node_update(const oracle_state_t& state,
                                const action_request_t& request,
                                const node_update_t& action,
                                const transition_context_t& context) {
  if (request.caller != action.node) {
    return illegal("node update must be signed by the node itself");
  }
  if (find_node(state, action.node) == nullptr) {
    return illegal("node is not registered", to_hex(action.node));
  }
  if (action.price <= 0) {
    return illegal("price must be positive");
  }
  auto next = state;
  find_node(next, action.node)->feed =
      data_feed_t{.value = action.price, .last_update = context.now};
  return make_result(update_with(next, {action.node}));
}

transition_result_t node_collect(const oracle_state_t& state,
                                 const action_request_t& request,
                                 const node_collect_t& action) {
  if (request.caller != action.node) {
    return illegal("rewards can only be collected by the node itself");
  }
  const auto* node = find_node(state, action.node);
  if (node == nullptr) {
    return illegal("node is not registered", to_hex(action.node));
  }
  if (node->reward <= 0) {
    return illegal("node has no reward to collect", to_hex(action.node));
  }
  auto next = state;
  find_node(next, action.node)->reward = 0;
  auto out = update_with(next, {action.node});
  out.payouts.push_back(payout_t{.recipient = action.node,
                                 .amount = node->reward});
  return make_result(std::move(out));
}

transition_result_t platform_collect(const oracle_state_t& state,
                                     const action_request_t& request) {
  if (auto violation = owner_violation(state, request)) {
    return illegal(*violation);
  }
  if (state.platform_reward <= 0) {
    return illegal("platform has no reward to collect");
  }
  auto next = state;
  next.platform_reward = 0;
  auto out = update_with(next, owner_signers(state, request));
  out.payouts.push_back(payout_t{.recipient = state.settings.owner,
                                 .amount = state.platform_reward});
  return make_result(std::move(out));
}

transition_result_t aggregate(const oracle_state_t& state,
                              const action_request_t& request,
                              const aggregate_t& action,
                              const transition_context_t& context) {
  const auto& settings = state.settings;
  if (request.caller != action.aggregator) {
    return illegal("aggregation must be signed by the aggregator");
  }
  if (find_node(state, action.aggregator) == nullptr) {
    return illegal("aggregator is not a registered node",
                   to_hex(action.aggregator));
  }

  auto fresh = fresh_nodes(state, context.now);
  if (fresh.size() < settings.min_nodes) {
    return illegal("not enough fresh node feeds",
                   fmt::format("{} fresh, {} required", fresh.size(),
                               settings.min_nodes));
  }

  auto feeds = std::vector<int64_t>{};
  feeds.reserve(fresh.size());
  for (const auto* node : fresh) {
    feeds.push_back(node->feed->value);
  }
  auto agreed =
      consensus(feeds, settings.iqr_multiplier, settings.divergence);

  auto due = !state.price || state.price->expiry <= context.now ||
             change_basis_points(state.price->price, agreed.median) >=
                 settings.aggregate_change;
  if (!due) {
    return illegal("aggregate is not due",
                   "price neither expired nor moved enough");
  }

  auto rewarded = std::vector<key_hash_t>{};
  for (const auto* node : fresh) {
    if (std::ranges::binary_search(agreed.on_consensus, node->feed->value)) {
      rewarded.push_back(node->operator_key);
    }
  }

  const auto& fees = settings.rewards;
  auto cost = (fees.node_fee * static_cast<quantity_t>(rewarded.size())) +
              fees.aggregate_fee + fees.platform_fee;
  auto reserve = context.fee_token_balance - allocated_rewards(state);
  if (reserve < cost) {
    return make_error<transition_t>(
        error_code::insufficient_funds,
        "reserve cannot pay the aggregation rewards",
        fmt::format("reserve {}, required {}, missing {}", reserve, cost,
                    cost - reserve));
  }

  auto next = state;
  for (const auto& key : rewarded) {
    find_node(next, key)->reward += fees.node_fee;
  }
  find_node(next, action.aggregator)->reward += fees.aggregate_fee;
  next.platform_reward += fees.platform_fee;
  next.price = price_data_t{.price = agreed.median,
                            .timestamp = context.now,
                            .expiry = context.now + settings.aggregate_time};

  spdlog::debug("Aggregated {} fresh feeds to {} with {} on consensus",
                fresh.size(), agreed.median, rewarded.size());
  return make_result(update_with(next, {action.aggregator}));
}

transition_result_t edit_settings(const oracle_state_t& state,
                                  const action_request_t& request,
                                  const edit_settings_t& action) {
  if (auto violation = owner_violation(state, request)) {
    return illegal(*violation);
  }
  if (action.settings == state.settings) {
    return illegal("settings are unchanged");
  }
  if (auto violation = orca::codec::settings_violation(action.settings)) {
    return illegal("invalid settings", *violation);
  }
  auto next = state;
  next.settings = action.settings;
  return make_result(update_with(next, owner_signers(state, request)));
}

transition_result_t add_nodes(const oracle_state_t& state,
                              const action_request_t& request,
                              const add_nodes_t& action) {
  if (auto violation = owner_violation(state, request)) {
    return illegal(*violation);
  }
  if (action.nodes.empty()) {
    return illegal("no nodes to add");
  }
  if (has_duplicates(action.nodes)) {
    return illegal("node list repeats a key");
  }
  auto next = state;
  for (const auto& key : action.nodes) {
    if (find_node(state, key) != nullptr) {
      return illegal("node is already registered", to_hex(key));
    }
    next.nodes.push_back(node_entry_t{.operator_key = key});
  }
  return make_result(update_with(next, owner_signers(state, request)));
}

transition_result_t remove_nodes(const oracle_state_t& state,
                                 const action_request_t& request,
                                 const remove_nodes_t& action) {
  if (auto violation = owner_violation(state, request)) {
    return illegal(*violation);
  }
  if (action.nodes.empty()) {
    return illegal("no nodes to remove");
  }
  if (has_duplicates(action.nodes)) {
    return illegal("node list repeats a key");
  }

  auto payouts = std::vector<payout_t>{};
  for (const auto& key : action.nodes) {
    const auto* node = find_node(state, key);
    if (node == nullptr) {
      return illegal("node is not registered", to_hex(key));
    }
    if (node->reward > 0) {
      if (!action.settle_rewards) {
        return illegal("node holds an unclaimed reward",
                       fmt::format("{} holds {}", to_hex(key), node->reward));
      }
      payouts.push_back(payout_t{.recipient = key, .amount = node->reward});
    }
  }

  auto next = state;
  std::erase_if(next.nodes, [&](const node_entry_t& node) {
    return std::ranges::find(action.nodes, node.operator_key) !=
           std::end(action.nodes);
  });
  auto out = update_with(next, owner_signers(state, request));
  out.payouts = std::move(payouts);
  return make_result(std::move(out));
}

transition_result_t close_oracle(const oracle_state_t& state,
                                 const action_request_t& request,
                                 const close_oracle_t& action,
                                 const transition_context_t& context) {
  if (auto violation = owner_violation(state, request)) {
    return illegal(*violation);
  }
  auto out = transition_t{};
  out.burn_state_token = true;
  out.required_signers = owner_signers(state, request);
  out.residual_recipient = state.settings.owner;

  auto node_rewards = quantity_t{};
  for (const auto& node : state.nodes) {
    node_rewards += node.reward;
  }

  if (action.disbursement == disbursement_t::to_owner) {
    if (node_rewards != 0) {
      return illegal("nodes still hold rewards",
                     fmt::format("{} unpaid", node_rewards));
    }
    out.payouts.push_back(payout_t{.recipient = state.settings.owner,
                                   .amount = context.fee_token_balance});
    return make_result(std::move(out));
  }

  if (node_rewards > context.fee_token_balance) {
    return make_error<transition_t>(
        error_code::insufficient_funds,
        "reserve cannot pay the node rewards",
        fmt::format("balance {}, rewards {}, missing {}",
                    context.fee_token_balance, node_rewards,
                    node_rewards - context.fee_token_balance));
  }
  for (const auto& node : state.nodes) {
    if (node.reward > 0) {
      out.payouts.push_back(
          payout_t{.recipient = node.operator_key, .amount = node.reward});
    }
  }
  out.payouts.push_back(
      payout_t{.recipient = state.settings.owner,
               .amount = context.fee_token_balance - node_rewards});
  return make_result(std::move(out));
}

transition_result_t add_funds(const oracle_state_t& state,
                              const action_request_t& request,
                              const add_funds_t& action) {
  if (action.amount <= 0) {
    return illegal("funding amount must be positive");
  }
  auto out = update_with(state, {request.caller});
  out.funding = action.amount;
  return make_result(std::move(out));
}

transition_result_t create_reference_script(
    const oracle_state_t& state,
    const action_request_t& request,
    const transition_context_t& context) {
  if (auto violation = owner_violation(state, request)) {
    return illegal(*violation);
  }
  if (context.reference_script_exists) {
    return illegal("reference script is already published");
  }
  auto out = transition_t{};
  out.required_signers = owner_signers(state, request);
  return make_result(std::move(out));
}

transition_result_t dispatch(const oracle_state_t& state,
                             const action_request_t& request,
                             const transition_context_t& context) {
  if (state.status == lifecycle_status_t::closed) {
    return illegal("oracle is closed");
  }
  return std::visit(
      overloaded{
          [&](const node_update_t& action) {
            return node_update(state, request, action, context);
          },
          [&](const node_collect_t& action) {
            return node_collect(state, request, action);
          },
          [&](const platform_collect_t&) {
            return platform_collect(state, request);
          },
          [&](const aggregate_t& action) {
            return aggregate(state, request, action, context);
          },
          [&](const edit_settings_t& action) {
            return edit_settings(state, request, action);
          },
          [&](const add_nodes_t& action) {
            return add_nodes(state, request, action);
          },
          [&](const remove_nodes_t& action) {
            return remove_nodes(state, request, action);
          },
          [&](const close_oracle_t& action) {
            return close_oracle(state, request, action, context);
          },
          [&](const add_funds_t& action) {
            return add_funds(state, request, action);
          },
          [&](const create_reference_script_t&) {
            return create_reference_script(state, request, context);
          }},
      request.payload);
}

}  // namespace

std::vector<const node_entry_t*> fresh_nodes(
    const oracle_state_t& state,
    const timestamp_milliseconds_t now) {
  auto fresh = std::vector<const node_entry_t*>{};
  for (const auto& node : state.nodes) {
    if (!node.feed) {
      continue;
    }
    const auto& feed = *node.feed;
    if (state.price && feed.last_update <= state.price->timestamp) {
      continue;
    }
    if (feed.last_update <= now &&
        now <= feed.last_update + state.settings.node_staleness) {
      fresh.push_back(&node);
    }
  }
  return fresh;
}

result<transition_t> evaluate_transition(const oracle_state_t& state,
                                         const action_request_t& request,
                                         const transition_context_t& context) {
  auto name = action_name(request.payload);
  auto evaluated = dispatch(state, request, context);
  if (!evaluated) {
    spdlog::warn("Rejected {}: {} {}", name, evaluated.log, evaluated.info);
    return evaluated;
  }

  auto paid = quantity_t{};
  for (const auto& payout : evaluated->payouts) {
    if (payout.amount < 0) {
      spdlog::warn("Rejected {}: negative payout to {}", name,
                   to_hex(payout.recipient));
      return make_error<transition_t>(
          error_code::insufficient_funds,
          "state UTxO cannot fund a negative payout",
          fmt::format("{} to {}", payout.amount, to_hex(payout.recipient)));
    }
    paid += payout.amount;
  }
  if (paid > context.fee_token_balance) {
    spdlog::warn("Rejected {}: payouts exceed the fee-token balance", name);
    return make_error<transition_t>(
        error_code::insufficient_funds,
        "state UTxO holds too few fee tokens for the payouts",
        fmt::format("balance {}, payouts {}", context.fee_token_balance,
                    paid));
  }

  spdlog::info("Accepted {} with {} required signer(s)", name,
               evaluated->required_signers.size());
  return evaluated;
}

}  // namespace orca::policy
