#include <orca/codec/state_codec.hpp>
#include <orca/hash/blake2b.hpp>
#include <orca/submission/submission_gate.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

using namespace orca::schema;

namespace orca::submission {

namespace {

std::vector<key_hash_t> missing_signers(const transaction_t& tx) {
  auto missing = std::vector<key_hash_t>{};
  for (const auto& signer : tx.body.required_signers) {
    auto signed_by = std::ranges::any_of(
        tx.witnesses.vkey_witnesses, [&](const vkey_witness_t& witness) {
          return orca::hash::key_hash(witness.vkey) == signer;
        });
    if (!signed_by) {
      missing.push_back(signer);
    }
  }
  return missing;
}

std::string join_hex(const std::vector<key_hash_t>& keys) {
  auto out = std::string{};
  for (const auto& key : keys) {
    if (!out.empty()) {
      out += ",";
    }
    out += to_hex(key);
  }
  return out;
}

}  // namespace

submission_gate::submission_gate(submission_service& service)
    : service_(service) {}

result<tx_id_t> submission_gate::submit(const bytes_view_t& signed_transaction) {
  auto decoded = orca::codec::decode_transaction(signed_transaction);
  if (!decoded) {
    return forward_error<tx_id_t>(decoded);
  }
  auto tx_id = orca::codec::transaction_id(decoded->body);

  auto missing = missing_signers(*decoded);
  if (!missing.empty()) {
    spdlog::warn("Refusing to submit {}: {} signature(s) missing",
                 to_hex(tx_id), missing.size());
    return make_error<tx_id_t>(error_code::invalid_witness,
                               "witness set does not cover required signers",
                               join_hex(missing));
  }

  auto submitted = service_.submit(signed_transaction);
  if (!submitted) {
    if (retryable(submitted.code)) {
      spdlog::warn("Submission of {} failed in transit: {}", to_hex(tx_id),
                   submitted.log);
    } else {
      spdlog::error("Submission of {} rejected: {} {}", to_hex(tx_id),
                    submitted.log, submitted.info);
    }
    return submitted;
  }
  spdlog::info("Submitted transaction {}", to_hex(tx_id));
  return make_result(tx_id);
}

result<tx_id_t> submission_gate::submit_checked(
    const bytes_view_t& signed_transaction,
    orca::chain::chain_query& query) {
  auto decoded = orca::codec::decode_transaction(signed_transaction);
  if (!decoded) {
    return forward_error<tx_id_t>(decoded);
  }
  const auto& body = decoded->body;

  auto unspent = query.resolve_inputs(body.inputs);
  if (!unspent) {
    return forward_error<tx_id_t>(unspent);
  }
  if (unspent->size() != body.inputs.size()) {
    auto spent = std::string{};
    for (const auto& input : body.inputs) {
      auto found = std::ranges::any_of(
          *unspent, [&](const utxo_t& utxo) { return utxo.input == input; });
      if (!found) {
        if (!spent.empty()) {
          spent += ",";
        }
        spent += to_string(input);
      }
    }
    spdlog::warn("Transaction spends consumed outputs: {}", spent);
    return make_error<tx_id_t>(error_code::stale_transaction,
                               "inputs were spent by another transaction",
                               spent);
  }

  auto slot = query.current_slot();
  if (!slot) {
    return forward_error<tx_id_t>(slot);
  }
  if (body.ttl && *slot > *body.ttl) {
    return make_error<tx_id_t>(
        error_code::stale_transaction, "validity interval has closed",
        fmt::format("ttl {}, tip {}", *body.ttl, *slot));
  }
  return submit(signed_transaction);
}

result<transaction_status_t> submission_gate::wait_for_confirmation(
    const tx_id_t& tx_id,
    const std::size_t attempts,
    const std::chrono::milliseconds interval) {
  for (auto attempt = std::size_t{0}; attempt < attempts; ++attempt) {
    if (attempt > 0) {
      std::this_thread::sleep_for(interval);
    }
    auto confirmed = service_.is_confirmed(tx_id);
    if (!confirmed) {
      if (!retryable(confirmed.code)) {
        return forward_error<transaction_status_t>(confirmed);
      }
      spdlog::debug("Confirmation poll {} for {} failed: {}", attempt,
                    to_hex(tx_id), confirmed.log);
      continue;
    }
    if (*confirmed) {
      spdlog::info("Transaction {} confirmed", to_hex(tx_id));
      return make_result(transaction_status_t::confirmed);
    }
  }
  return make_result(transaction_status_t::submitted);
}

}  // namespace orca::submission
