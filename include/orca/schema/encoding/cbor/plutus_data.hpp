#pragma once

#include <orca/schema/encoding/cbor/reader.hpp>
#include <orca/schema/encoding/cbor/writer.hpp>
#include <orca/schema/primitives.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <string_view>

// Plutus data building blocks. Lists follow the layout cardano tooling emits:
// an empty list is a definite `[]`, any other list is indefinite-length.
namespace orca::schema::encoding::cbor {

struct list_header final {
  bool indefinite{};
  uint64_t size{};
};

void begin_list(writer& out, std::size_t size);
void end_list(writer& out, std::size_t size);

/// Write constructor `index` followed by the opening of its field list.
void begin_constr(writer& out, uint64_t index, std::size_t fields);

/// Byte strings longer than 64 bytes are split into 64-byte chunks.
void write_bounded_bytes(writer& out, const bytes_view_t& bytes);

list_header read_list(reader& in);
void end_list(reader& in, const list_header& header);

/// Read a constructor header and return its index. The field list is left
/// unread; pass the index to `read_fields`.
uint64_t read_constr(reader& in);

/// Open the field list and check it has exactly `expected` entries.
list_header read_fields(reader& in,
                        uint64_t expected,
                        std::string_view what);

/// Read constructor + field list and require both to match.
list_header expect_constr(reader& in,
                          uint64_t index,
                          uint64_t expected_fields,
                          std::string_view what);

template <std::size_t N>
std::array<uint8_t, N> read_fixed_bytes(reader& in, const std::string_view what) {
  auto bytes = in.read_bytes();
  if (bytes.size() != N) {
    throw decode_error{fmt::format("{}: expected {} bytes, found {}", what, N,
                                   bytes.size())};
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(out));
  return out;
}

}  // namespace orca::schema::encoding::cbor
