#include <orca/codec/state_codec.hpp>
#include <orca/common/critical.hpp>
#include <orca/crypto/verify.hpp>
#include <orca/hash/blake2b.hpp>
#include <orca/schema/encoding/scale/encoder.hpp>
#include <orca/schema/key/session.hpp>
#include <orca/schema/signing_envelope.hpp>
#include <orca/signing/signature_coordinator.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

using namespace orca::schema;

namespace orca::signing {

namespace {

using encoder_t = orca::schema::encoding::encoder<
    orca::schema::encoding::scale_encoder_tag>;

std::vector<key_hash_t> sorted_unique(std::vector<key_hash_t> keys) {
  std::sort(std::begin(keys), std::end(keys));
  keys.erase(std::unique(std::begin(keys), std::end(keys)), std::end(keys));
  return keys;
}

bool has_witness_from(const signing_session_t& session,
                      const key_hash_t& signer) {
  return std::ranges::any_of(session.witnesses,
                             [&](const vkey_witness_t& witness) {
                               return orca::hash::key_hash(witness.vkey) ==
                                      signer;
                             });
}

result<session_status_t> session_not_found(const tx_id_t& session_id) {
  return make_error<session_status_t>(error_code::session_not_found,
                                      "no signing session for transaction",
                                      to_hex(session_id));
}

}  // namespace

signature_coordinator::signature_coordinator()
    : signature_verifier_(orca::crypto::verify_signature) {}

signature_coordinator::signature_coordinator(const std::string& db_path)
    : signature_verifier_(orca::crypto::verify_signature) {
  auto lock = std::scoped_lock{mutex_};
  storage_ = orca::storage::make_storage<orca::storage::rocksdb_storage_tag>(
      db_path);
  load_persisted_sessions();
  spdlog::info("Signature coordinator resumed {} session(s)",
               sessions_.size());
}

void signature_coordinator::set_signature_verifier(
    signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  signature_verifier_ = std::move(verifier);
}

result<tx_id_t> signature_coordinator::start(
    const bytes_view_t& transaction,
    std::vector<key_hash_t> required_signers) {
  auto lock = std::scoped_lock{mutex_};
  return start_locked(transaction, std::move(required_signers));
}

result<tx_id_t> signature_coordinator::start_locked(
    const bytes_view_t& transaction,
    std::vector<key_hash_t> required_signers) {
  auto decoded = orca::codec::decode_transaction(transaction);
  if (!decoded) {
    return forward_error<tx_id_t>(decoded);
  }
  auto session_id = orca::codec::transaction_id(decoded->body);
  if (sessions_.contains(session_id)) {
    spdlog::debug("Resuming signing session {}", to_hex(session_id));
    return make_result(session_id);
  }

  auto session = signing_session_t{};
  session.session_id = session_id;
  session.transaction = make_bytes(transaction);
  // Signers the body names are required whatever the caller passed.
  required_signers.insert(std::end(required_signers),
                          std::begin(decoded->body.required_signers),
                          std::end(decoded->body.required_signers));
  session.required_signers = sorted_unique(std::move(required_signers));
  persist(session);
  sessions_.emplace(session_id, std::move(session));
  spdlog::info("Started signing session {} for {} signer(s)",
               to_hex(session_id), sessions_[session_id].required_signers.size());
  return make_result(session_id);
}

result<session_status_t> signature_coordinator::contribute(
    const tx_id_t& session_id,
    const key_hash_t& signer,
    const vkey_witness_t& witness) {
  auto lock = std::scoped_lock{mutex_};
  return contribute_locked(session_id, signer, witness);
}

result<session_status_t> signature_coordinator::contribute_locked(
    const tx_id_t& session_id,
    const key_hash_t& signer,
    const vkey_witness_t& witness) {
  auto it = sessions_.find(session_id);
  if (it == std::end(sessions_)) {
    return session_not_found(session_id);
  }
  auto& session = it->second;

  if (!std::ranges::binary_search(session.required_signers, signer)) {
    spdlog::warn("Session {} rejected unexpected signer {}",
                 to_hex(session_id), to_hex(signer));
    return make_error<session_status_t>(error_code::unexpected_signer,
                                        "signer is not required",
                                        to_hex(signer));
  }
  if (orca::hash::key_hash(witness.vkey) != signer) {
    return make_error<session_status_t>(
        error_code::invalid_witness,
        "verification key does not belong to the signer", to_hex(signer));
  }
  if (has_witness_from(session, signer)) {
    return make_result(status_locked(session));
  }
  if (!signature_verifier_(
          bytes_view_t{session_id.data(), session_id.size()}, witness.vkey,
          witness.signature)) {
    spdlog::warn("Session {} rejected a bad signature from {}",
                 to_hex(session_id), to_hex(signer));
    return make_error<session_status_t>(error_code::invalid_witness,
                                        "signature does not verify",
                                        to_hex(signer));
  }

  auto updated = session;
  updated.witnesses.push_back(witness);
  std::sort(std::begin(updated.witnesses), std::end(updated.witnesses),
            [](const vkey_witness_t& lhs, const vkey_witness_t& rhs) {
              return lhs.vkey < rhs.vkey;
            });
  persist(updated);
  session = std::move(updated);

  auto status = status_locked(session);
  if (std::holds_alternative<session_complete_t>(status)) {
    spdlog::info("Session {} is fully signed", to_hex(session_id));
  } else {
    spdlog::info("Session {} collected {} of {} signature(s)",
                 to_hex(session_id), session.witnesses.size(),
                 session.required_signers.size());
  }
  return make_result(std::move(status));
}

result<session_status_t> signature_coordinator::status(
    const tx_id_t& session_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = sessions_.find(session_id);
  if (it == std::end(sessions_)) {
    return session_not_found(session_id);
  }
  return make_result(status_locked(it->second));
}

session_status_t signature_coordinator::status_locked(
    const signing_session_t& session) const {
  auto pending = session_pending_t{};
  pending.required = session.required_signers.size();
  for (const auto& signer : session.required_signers) {
    if (has_witness_from(session, signer)) {
      ++pending.collected;
    } else {
      pending.missing.push_back(signer);
    }
  }
  if (!pending.missing.empty()) {
    return pending;
  }

  auto decoded =
      orca::codec::decode_transaction(make_bytes_view(session.transaction));
  if (!decoded) {
    orca::common::critical("stored session holds an undecodable transaction");
  }
  auto signed_tx = std::move(*decoded);
  signed_tx.witnesses.vkey_witnesses = session.witnesses;
  return session_complete_t{
      .tx_id = session.session_id,
      .signed_transaction = orca::codec::encode_transaction(signed_tx)};
}

result<unit> signature_coordinator::abandon(const tx_id_t& session_id) {
  auto lock = std::scoped_lock{mutex_};
  if (sessions_.erase(session_id) == 0) {
    return make_error<unit>(error_code::session_not_found,
                            "no signing session for transaction",
                            to_hex(session_id));
  }
  if (storage_) {
    auto key = orca::schema::key::make_session_key(session_id);
    storage_->erase(make_bytes_view(key));
  }
  spdlog::info("Abandoned signing session {}", to_hex(session_id));
  return make_result(unit{});
}

result<bytes_t> signature_coordinator::export_envelope(
    const tx_id_t& session_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = sessions_.find(session_id);
  if (it == std::end(sessions_)) {
    return make_error<bytes_t>(error_code::session_not_found,
                               "no signing session for transaction",
                               to_hex(session_id));
  }
  const auto& session = it->second;
  auto envelope = signing_envelope_t{};
  envelope.transaction = session.transaction;
  envelope.required_signers = session.required_signers;
  envelope.witnesses = session.witnesses;
  return make_result(encoder_t{}.encode(envelope));
}

result<session_status_t> signature_coordinator::import_envelope(
    const bytes_view_t& envelope) {
  auto error = std::string{};
  auto decoded = encoder_t{}.try_decode<signing_envelope_t>(envelope, error);
  if (!decoded) {
    return make_error<session_status_t>(error_code::schema_mismatch,
                                        "malformed signing envelope", error);
  }

  auto transaction = orca::codec::decode_transaction(
      make_bytes_view(decoded->transaction));
  if (!transaction) {
    return forward_error<session_status_t>(transaction);
  }
  auto tx_id = orca::codec::transaction_id(transaction->body);

  auto lock = std::scoped_lock{mutex_};
  auto required = decoded->required_signers;
  required.insert(std::end(required),
                  std::begin(transaction->body.required_signers),
                  std::end(transaction->body.required_signers));
  if (auto it = sessions_.find(tx_id); it != std::end(sessions_)) {
    required.insert(std::end(required),
                    std::begin(it->second.required_signers),
                    std::end(it->second.required_signers));
  }
  required = sorted_unique(std::move(required));

  // The envelope is merged whole or not at all.
  for (const auto& witness : decoded->witnesses) {
    auto signer = orca::hash::key_hash(witness.vkey);
    if (!std::ranges::binary_search(required, signer)) {
      spdlog::warn("Envelope for {} carries unexpected signer {}",
                   to_hex(tx_id), to_hex(signer));
      return make_error<session_status_t>(error_code::unexpected_signer,
                                          "signer is not required",
                                          to_hex(signer));
    }
    if (!signature_verifier_(bytes_view_t{tx_id.data(), tx_id.size()},
                             witness.vkey, witness.signature)) {
      spdlog::warn("Envelope for {} carries a bad signature from {}",
                   to_hex(tx_id), to_hex(signer));
      return make_error<session_status_t>(error_code::invalid_witness,
                                          "signature does not verify",
                                          to_hex(signer));
    }
  }

  auto session_id = start_locked(make_bytes_view(decoded->transaction),
                                 decoded->required_signers);
  if (!session_id) {
    return forward_error<session_status_t>(session_id);
  }
  for (const auto& witness : decoded->witnesses) {
    auto contributed = contribute_locked(
        *session_id, orca::hash::key_hash(witness.vkey), witness);
    if (!contributed) {
      return contributed;
    }
  }
  return make_result(status_locked(sessions_.at(*session_id)));
}

std::vector<tx_id_t> signature_coordinator::sessions() const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<tx_id_t>{};
  out.reserve(sessions_.size());
  for (const auto& [session_id, session] : sessions_) {
    out.push_back(session_id);
  }
  return out;
}

void signature_coordinator::persist(const signing_session_t& session) const {
  if (!storage_) {
    return;
  }
  auto encoder = encoder_t{};
  auto key = orca::schema::key::make_session_key(session.session_id);
  storage_->put(encoder, make_bytes_view(key), session);
}

void signature_coordinator::load_persisted_sessions() {
  auto prefix = make_bytes(orca::schema::key::kSessionKeyPrefix);
  auto entries = storage_->list_by_prefix(make_bytes_view(prefix));
  auto encoder = encoder_t{};
  for (const auto& [key, value] : entries) {
    auto error = std::string{};
    auto session =
        encoder.try_decode<signing_session_t>(make_bytes_view(value), error);
    if (!session) {
      spdlog::warn("Skipping undecodable session record: {}", error);
      continue;
    }
    sessions_.emplace(session->session_id, std::move(*session));
  }
}

}  // namespace orca::signing
