#pragma once

#include <orca/chain/chain_query.hpp>
#include <orca/schema/primitives.hpp>
#include <orca/schema/result.hpp>
#include <orca/schema/transaction_status.hpp>
#include <orca/submission/submission_service.hpp>

#include <chrono>
#include <cstddef>

namespace orca::submission {

/// Last step of every flow. A network_error answer means the identical bytes
/// may be sent again; rejected means the flow must start over from a fresh
/// snapshot.
class submission_gate final {
 public:
  explicit submission_gate(submission_service& service);

  /// Refuses bytes whose witnesses do not cover the body's required signers,
  /// otherwise forwards them and classifies the answer.
  orca::schema::result<orca::schema::tx_id_t> submit(
      const orca::schema::bytes_view_t& signed_transaction);

  /// As `submit`, after checking that every input is still unspent and the
  /// validity interval has not closed. Stale transactions fail with
  /// stale_transaction and never reach the service.
  orca::schema::result<orca::schema::tx_id_t> submit_checked(
      const orca::schema::bytes_view_t& signed_transaction,
      orca::chain::chain_query& query);

  /// Poll until confirmed. Returns `submitted` when `attempts` run out.
  orca::schema::result<orca::schema::transaction_status_t>
  wait_for_confirmation(const orca::schema::tx_id_t& tx_id,
                        std::size_t attempts,
                        std::chrono::milliseconds interval);

 private:
  submission_service& service_;
};

}  // namespace orca::submission
