#pragma once

#include <orca/schema/primitives.hpp>

#include <cstdint>
#include <string_view>

namespace orca::schema::encoding::cbor {

enum class major_type : uint8_t {
  unsigned_integer = 0,
  negative_integer = 1,
  byte_string = 2,
  text_string = 3,
  array = 4,
  map = 5,
  tag = 6,
  simple = 7
};

/// Append-only RFC 8949 writer. Integers and lengths always use the shortest
/// argument form, which keeps encodings canonical.
class writer final {
 public:
  void write_unsigned(uint64_t value);
  void write_integer(int64_t value);
  void write_bytes(const bytes_view_t& bytes);
  void write_text(std::string_view text);
  void write_array_header(uint64_t size);
  void write_map_header(uint64_t size);
  void write_tag(uint64_t tag);
  void write_bool(bool value);
  void write_null();
  void begin_indefinite_array();
  void begin_indefinite_bytes();
  void write_break();
  /// Append an already encoded item verbatim.
  void write_raw(const bytes_view_t& encoded);

  const bytes_t& bytes() const { return out_; }
  bytes_t release() { return std::move(out_); }

 private:
  void write_head(major_type type, uint64_t argument);

  bytes_t out_;
};

}  // namespace orca::schema::encoding::cbor
