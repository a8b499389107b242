#include <orca/common/critical.hpp>
#include <orca/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace orca::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_make_fixed(std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(*decoded), std::end(*decoded), std::begin(out));
  return out;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(const std::string_view& input) {
  auto hex = normalize_hex(input);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

bytes_t from_hex(const std::string_view& hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded) {
    orca::common::critical("invalid hex string");
  }
  return *decoded;
}

hash32_t make_hash32(const bytes_view_t& bytes) {
  if (bytes.size() != 32) {
    orca::common::critical("make_hash32 expected exactly 32 bytes");
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  return try_make_fixed<32>(hex);
}

std::optional<hash28_t> try_make_hash28(const std::string_view& hex) {
  return try_make_fixed<28>(hex);
}

hash28_t make_hash28(const std::string_view& hex) {
  auto hash = try_make_hash28(hex);
  if (!hash) {
    orca::common::critical("make_hash28 expected 28 bytes of hex");
  }
  return *hash;
}

hash32_t make_zero_hash() {
  return hash32_t{};
}

}  // namespace orca::schema
