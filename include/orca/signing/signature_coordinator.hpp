#pragma once

#include <orca/schema/encoding/scale/encoder.hpp>
#include <orca/schema/primitives.hpp>
#include <orca/schema/result.hpp>
#include <orca/schema/signing_session.hpp>
#include <orca/schema/transaction.hpp>
#include <orca/signing/signature_verifier.hpp>
#include <orca/storage/rocksdb/storage.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace orca::signing {

/// Collects vkey witnesses for transactions until every required signer has
/// signed.
///
/// A session is keyed by the transaction id, so starting the same
/// transaction twice resumes the existing session. Contributions may arrive
/// in any order; a repeated contribution leaves the session unchanged. When
/// opened on a database path, every session is written through to RocksDB
/// and reloaded on construction.
class signature_coordinator final {
 public:
  /// Sessions live in memory only.
  signature_coordinator();

  explicit signature_coordinator(const std::string& db_path);

  signature_coordinator(const signature_coordinator&) = delete;
  signature_coordinator& operator=(const signature_coordinator&) = delete;

  /// Install runtime signature verifier callback. Defaults to OpenSSL
  /// ed25519 verification.
  void set_signature_verifier(signature_verifier_t verifier);

  /// Open (or resume) the session for an unsigned transaction.
  orca::schema::result<orca::schema::tx_id_t> start(
      const orca::schema::bytes_view_t& transaction,
      std::vector<orca::schema::key_hash_t> required_signers);

  /// Add `signer`'s witness. unexpected_signer when `signer` is not
  /// required, invalid_witness when the key does not hash to `signer` or the
  /// signature does not verify; the session is unchanged on any failure.
  orca::schema::result<orca::schema::session_status_t> contribute(
      const orca::schema::tx_id_t& session_id,
      const orca::schema::key_hash_t& signer,
      const orca::schema::vkey_witness_t& witness);

  orca::schema::result<orca::schema::session_status_t> status(
      const orca::schema::tx_id_t& session_id) const;

  /// Drop a session before submission. Nothing outside the coordinator
  /// observes it.
  orca::schema::result<orca::schema::unit> abandon(
      const orca::schema::tx_id_t& session_id);

  /// SCALE envelope with the transaction and the witnesses held so far.
  orca::schema::result<orca::schema::bytes_t> export_envelope(
      const orca::schema::tx_id_t& session_id) const;

  /// Start or resume the envelope's session and merge its witnesses.
  orca::schema::result<orca::schema::session_status_t> import_envelope(
      const orca::schema::bytes_view_t& envelope);

  std::vector<orca::schema::tx_id_t> sessions() const;

 private:
  orca::schema::result<orca::schema::tx_id_t> start_locked(
      const orca::schema::bytes_view_t& transaction,
      std::vector<orca::schema::key_hash_t> required_signers);
  orca::schema::result<orca::schema::session_status_t> contribute_locked(
      const orca::schema::tx_id_t& session_id,
      const orca::schema::key_hash_t& signer,
      const orca::schema::vkey_witness_t& witness);
  orca::schema::session_status_t status_locked(
      const orca::schema::signing_session_t& session) const;
  void persist(const orca::schema::signing_session_t& session) const;
  void load_persisted_sessions();

  mutable std::mutex mutex_;
  std::optional<orca::storage::storage<orca::storage::rocksdb_storage_tag>>
      storage_;
  signature_verifier_t signature_verifier_;
  std::map<orca::schema::tx_id_t, orca::schema::signing_session_t> sessions_;
};

}  // namespace orca::signing
