#pragma once

#include <orca/schema/encoding/cbor/writer.hpp>
#include <orca/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace orca::schema::encoding::cbor {

/// Raised on malformed input or on a well-formed item of the wrong shape.
class decode_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Forward-only cursor over one CBOR buffer. Every read validates the major
/// type and throws `decode_error` on mismatch or truncation.
class reader final {
 public:
  explicit reader(bytes_view_t bytes);

  bool at_end() const { return offset_ >= bytes_.size(); }
  std::size_t offset() const { return offset_; }
  major_type peek_type() const;
  bool next_is_break() const;
  bool next_is_null() const;

  uint64_t read_unsigned();
  int64_t read_integer();
  bytes_t read_bytes();
  std::string read_text();
  /// std::nullopt for an indefinite-length array.
  std::optional<uint64_t> read_array_header();
  std::optional<uint64_t> read_map_header();
  uint64_t read_tag();
  uint64_t peek_tag() const;
  bool read_bool();
  void read_null();
  void read_break();

  /// Skip one complete item and return its encoded bytes.
  bytes_view_t read_raw_item();
  /// Count the items left in the current indefinite container without
  /// consuming them.
  uint64_t count_until_break() const;
  void expect_end() const;

 private:
  uint8_t peek_byte() const;
  uint8_t read_byte();
  uint64_t read_argument(uint8_t additional);
  bytes_view_t take(std::size_t size);
  void skip_item();

  bytes_view_t bytes_;
  std::size_t offset_{};
};

}  // namespace orca::schema::encoding::cbor
