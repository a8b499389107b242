#include <orca/schema/key/session.hpp>

#include <iterator>

namespace orca::schema::key {

bytes_t make_session_key(const tx_id_t& session_id) {
  auto key = make_bytes(kSessionKeyPrefix);
  key.insert(std::end(key), std::begin(session_id), std::end(session_id));
  return key;
}

}  // namespace orca::schema::key
