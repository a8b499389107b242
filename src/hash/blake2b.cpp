#include <orca/common/critical.hpp>
#include <orca/hash/blake2b.hpp>

#include <sodium.h>

#include <iterator>

namespace orca::hash {

namespace {

template <std::size_t N>
std::array<uint8_t, N> generic_hash(const orca::schema::bytes_view_t& bytes) {
  static_assert(N >= crypto_generichash_blake2b_BYTES_MIN &&
                N <= crypto_generichash_blake2b_BYTES_MAX);
  auto out = std::array<uint8_t, N>{};
  if (crypto_generichash_blake2b(out.data(), out.size(), bytes.data(),
                                 bytes.size(), nullptr, 0) != 0) {
    orca::common::critical("blake2b hashing failed");
  }
  return out;
}

}  // namespace

orca::schema::hash32_t blake2b_256(const orca::schema::bytes_view_t& bytes) {
  return generic_hash<32>(bytes);
}

orca::schema::hash28_t blake2b_224(const orca::schema::bytes_view_t& bytes) {
  return generic_hash<28>(bytes);
}

orca::schema::key_hash_t key_hash(
    const orca::schema::ed25519_public_key_t& public_key) {
  return blake2b_224(
      orca::schema::bytes_view_t{public_key.data(), public_key.size()});
}

orca::schema::script_hash_t plutus_v2_script_hash(
    const orca::schema::bytes_view_t& script) {
  auto tagged = orca::schema::bytes_t{};
  tagged.reserve(script.size() + 1);
  tagged.push_back(0x02);
  tagged.insert(std::end(tagged), std::begin(script), std::end(script));
  return blake2b_224(orca::schema::make_bytes_view(tagged));
}

}  // namespace orca::hash
