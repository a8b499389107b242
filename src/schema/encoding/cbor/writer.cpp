#include <orca/schema/encoding/cbor/writer.hpp>

#include <boost/endian/conversion.hpp>

#include <array>
#include <cstring>
#include <iterator>

namespace orca::schema::encoding::cbor {

namespace {

template <typename T>
void append_big_endian(bytes_t& out, const T value) {
  auto big = boost::endian::native_to_big(value);
  auto raw = std::array<uint8_t, sizeof(T)>{};
  std::memcpy(raw.data(), &big, sizeof(T));
  out.insert(std::end(out), std::begin(raw), std::end(raw));
}

}  // namespace

void writer::write_head(const major_type type, const uint64_t argument) {
  auto major = static_cast<uint8_t>(static_cast<uint8_t>(type) << 5u);
  if (argument < 24) {
    out_.push_back(static_cast<uint8_t>(major | argument));
  } else if (argument <= 0xFFu) {
    out_.push_back(static_cast<uint8_t>(major | 24u));
    out_.push_back(static_cast<uint8_t>(argument));
  } else if (argument <= 0xFFFFu) {
    out_.push_back(static_cast<uint8_t>(major | 25u));
    append_big_endian(out_, static_cast<uint16_t>(argument));
  } else if (argument <= 0xFFFFFFFFu) {
    out_.push_back(static_cast<uint8_t>(major | 26u));
    append_big_endian(out_, static_cast<uint32_t>(argument));
  } else {
    out_.push_back(static_cast<uint8_t>(major | 27u));
    append_big_endian(out_, argument);
  }
}

void writer::write_unsigned(const uint64_t value) {
  write_head(major_type::unsigned_integer, value);
}

void writer::write_integer(const int64_t value) {
  if (value >= 0) {
    write_head(major_type::unsigned_integer, static_cast<uint64_t>(value));
  } else {
    // -1 - n without overflowing on INT64_MIN
    write_head(major_type::negative_integer,
               static_cast<uint64_t>(-(value + 1)));
  }
}

void writer::write_bytes(const bytes_view_t& bytes) {
  write_head(major_type::byte_string, bytes.size());
  out_.insert(std::end(out_), std::begin(bytes), std::end(bytes));
}

void writer::write_text(const std::string_view text) {
  write_head(major_type::text_string, text.size());
  out_.insert(std::end(out_), std::begin(text), std::end(text));
}

void writer::write_array_header(const uint64_t size) {
  write_head(major_type::array, size);
}

void writer::write_map_header(const uint64_t size) {
  write_head(major_type::map, size);
}

void writer::write_tag(const uint64_t tag) {
  write_head(major_type::tag, tag);
}

void writer::write_bool(const bool value) {
  out_.push_back(value ? 0xF5u : 0xF4u);
}

void writer::write_null() {
  out_.push_back(0xF6u);
}

void writer::begin_indefinite_array() {
  out_.push_back(0x9Fu);
}

void writer::begin_indefinite_bytes() {
  out_.push_back(0x5Fu);
}

void writer::write_break() {
  out_.push_back(0xFFu);
}

void writer::write_raw(const bytes_view_t& encoded) {
  out_.insert(std::end(out_), std::begin(encoded), std::end(encoded));
}

}  // namespace orca::schema::encoding::cbor
