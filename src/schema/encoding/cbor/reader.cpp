#include <orca/schema/encoding/cbor/reader.hpp>

#include <spdlog/fmt/fmt.h>

#include <limits>

namespace orca::schema::encoding::cbor {

namespace {

inline constexpr uint8_t kIndefinite = 31;
inline constexpr uint8_t kBreak = 0xFFu;

std::string_view type_name(const major_type type) {
  switch (type) {
    case major_type::unsigned_integer:
      return "unsigned integer";
    case major_type::negative_integer:
      return "negative integer";
    case major_type::byte_string:
      return "byte string";
    case major_type::text_string:
      return "text string";
    case major_type::array:
      return "array";
    case major_type::map:
      return "map";
    case major_type::tag:
      return "tag";
    case major_type::simple:
      return "simple value";
  }
  return "unknown";
}

}  // namespace

reader::reader(const bytes_view_t bytes) : bytes_{bytes} {}

uint8_t reader::peek_byte() const {
  if (at_end()) {
    throw decode_error{"unexpected end of input"};
  }
  return bytes_[offset_];
}

uint8_t reader::read_byte() {
  auto byte = peek_byte();
  ++offset_;
  return byte;
}

bytes_view_t reader::take(const std::size_t size) {
  if (size > bytes_.size() - offset_) {
    throw decode_error{fmt::format("truncated item: need {} bytes, have {}",
                                   size, bytes_.size() - offset_)};
  }
  auto out = bytes_.subspan(offset_, size);
  offset_ += size;
  return out;
}

uint64_t reader::read_argument(const uint8_t additional) {
  if (additional < 24) {
    return additional;
  }
  auto width = std::size_t{0};
  switch (additional) {
    case 24:
      width = 1;
      break;
    case 25:
      width = 2;
      break;
    case 26:
      width = 4;
      break;
    case 27:
      width = 8;
      break;
    default:
      throw decode_error{
          fmt::format("unsupported additional information {}", additional)};
  }
  auto raw = take(width);
  auto value = uint64_t{0};
  for (const auto byte : raw) {
    value = (value << 8u) | byte;
  }
  return value;
}

major_type reader::peek_type() const {
  return static_cast<major_type>(peek_byte() >> 5u);
}

bool reader::next_is_break() const {
  return peek_byte() == kBreak;
}

bool reader::next_is_null() const {
  return peek_byte() == 0xF6u;
}

uint64_t reader::read_unsigned() {
  auto initial = read_byte();
  auto type = static_cast<major_type>(initial >> 5u);
  if (type != major_type::unsigned_integer) {
    throw decode_error{fmt::format("expected unsigned integer, found {}",
                                   type_name(type))};
  }
  return read_argument(initial & 0x1Fu);
}

int64_t reader::read_integer() {
  auto initial = read_byte();
  auto type = static_cast<major_type>(initial >> 5u);
  if (type != major_type::unsigned_integer &&
      type != major_type::negative_integer) {
    throw decode_error{
        fmt::format("expected integer, found {}", type_name(type))};
  }
  auto argument = read_argument(initial & 0x1Fu);
  if (argument > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    throw decode_error{"integer out of 64-bit range"};
  }
  auto magnitude = static_cast<int64_t>(argument);
  return type == major_type::unsigned_integer ? magnitude : -1 - magnitude;
}

bytes_t reader::read_bytes() {
  auto initial = read_byte();
  auto type = static_cast<major_type>(initial >> 5u);
  if (type != major_type::byte_string) {
    throw decode_error{
        fmt::format("expected byte string, found {}", type_name(type))};
  }
  if ((initial & 0x1Fu) == kIndefinite) {
    auto out = bytes_t{};
    while (!next_is_break()) {
      auto chunk = read_bytes();
      out.insert(std::end(out), std::begin(chunk), std::end(chunk));
    }
    read_break();
    return out;
  }
  auto size = read_argument(initial & 0x1Fu);
  return make_bytes(take(size));
}

std::string reader::read_text() {
  auto initial = read_byte();
  auto type = static_cast<major_type>(initial >> 5u);
  if (type != major_type::text_string) {
    throw decode_error{
        fmt::format("expected text string, found {}", type_name(type))};
  }
  auto size = read_argument(initial & 0x1Fu);
  return make_string(take(size));
}

std::optional<uint64_t> reader::read_array_header() {
  auto initial = read_byte();
  auto type = static_cast<major_type>(initial >> 5u);
  if (type != major_type::array) {
    throw decode_error{
        fmt::format("expected array, found {}", type_name(type))};
  }
  if ((initial & 0x1Fu) == kIndefinite) {
    return std::nullopt;
  }
  return read_argument(initial & 0x1Fu);
}

std::optional<uint64_t> reader::read_map_header() {
  auto initial = read_byte();
  auto type = static_cast<major_type>(initial >> 5u);
  if (type != major_type::map) {
    throw decode_error{fmt::format("expected map, found {}", type_name(type))};
  }
  if ((initial & 0x1Fu) == kIndefinite) {
    return std::nullopt;
  }
  return read_argument(initial & 0x1Fu);
}

uint64_t reader::read_tag() {
  auto initial = read_byte();
  auto type = static_cast<major_type>(initial >> 5u);
  if (type != major_type::tag) {
    throw decode_error{fmt::format("expected tag, found {}", type_name(type))};
  }
  return read_argument(initial & 0x1Fu);
}

uint64_t reader::peek_tag() const {
  auto copy = *this;
  return copy.read_tag();
}

bool reader::read_bool() {
  auto byte = read_byte();
  if (byte == 0xF5u) {
    return true;
  }
  if (byte == 0xF4u) {
    return false;
  }
  throw decode_error{"expected boolean"};
}

void reader::read_null() {
  if (read_byte() != 0xF6u) {
    throw decode_error{"expected null"};
  }
}

void reader::read_break() {
  if (read_byte() != kBreak) {
    throw decode_error{"expected break"};
  }
}

void reader::skip_item() {
  auto initial = read_byte();
  auto type = static_cast<major_type>(initial >> 5u);
  auto additional = static_cast<uint8_t>(initial & 0x1Fu);
  if (additional == kIndefinite) {
    if (type == major_type::simple) {
      throw decode_error{"unexpected break"};
    }
    while (!next_is_break()) {
      skip_item();
    }
    read_break();
    return;
  }
  auto argument = read_argument(additional);
  switch (type) {
    case major_type::unsigned_integer:
    case major_type::negative_integer:
    case major_type::simple:
      return;
    case major_type::byte_string:
    case major_type::text_string:
      take(argument);
      return;
    case major_type::array:
      for (auto i = uint64_t{0}; i < argument; ++i) {
        skip_item();
      }
      return;
    case major_type::map:
      for (auto i = uint64_t{0}; i < argument; ++i) {
        skip_item();
        skip_item();
      }
      return;
    case major_type::tag:
      skip_item();
      return;
  }
}

bytes_view_t reader::read_raw_item() {
  auto start = offset_;
  skip_item();
  return bytes_.subspan(start, offset_ - start);
}

uint64_t reader::count_until_break() const {
  auto copy = *this;
  auto count = uint64_t{0};
  while (!copy.next_is_break()) {
    copy.skip_item();
    ++count;
  }
  return count;
}

void reader::expect_end() const {
  if (!at_end()) {
    throw decode_error{fmt::format("{} trailing bytes after item",
                                   bytes_.size() - offset_)};
  }
}

}  // namespace orca::schema::encoding::cbor
