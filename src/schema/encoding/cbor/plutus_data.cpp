#include <orca/schema/encoding/cbor/plutus_data.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace orca::schema::encoding::cbor {

namespace {

inline constexpr std::size_t kMaxChunk = 64;
inline constexpr uint64_t kGeneralConstrTag = 102;

}  // namespace

void begin_list(writer& out, const std::size_t size) {
  if (size == 0) {
    out.write_array_header(0);
  } else {
    out.begin_indefinite_array();
  }
}

void end_list(writer& out, const std::size_t size) {
  if (size != 0) {
    out.write_break();
  }
}

void begin_constr(writer& out, const uint64_t index, const std::size_t fields) {
  if (index <= 6) {
    out.write_tag(121 + index);
  } else if (index <= 127) {
    out.write_tag(1280 + (index - 7));
  } else {
    out.write_tag(kGeneralConstrTag);
    out.write_array_header(2);
    out.write_unsigned(index);
  }
  begin_list(out, fields);
}

void write_bounded_bytes(writer& out, const bytes_view_t& bytes) {
  if (bytes.size() <= kMaxChunk) {
    out.write_bytes(bytes);
    return;
  }
  out.begin_indefinite_bytes();
  for (auto offset = std::size_t{0}; offset < bytes.size();
       offset += kMaxChunk) {
    auto size = std::min(kMaxChunk, bytes.size() - offset);
    out.write_bytes(bytes.subspan(offset, size));
  }
  out.write_break();
}

list_header read_list(reader& in) {
  auto size = in.read_array_header();
  if (!size) {
    return list_header{.indefinite = true, .size = in.count_until_break()};
  }
  return list_header{.indefinite = false, .size = *size};
}

void end_list(reader& in, const list_header& header) {
  if (header.indefinite) {
    in.read_break();
  }
}

uint64_t read_constr(reader& in) {
  auto tag = in.read_tag();
  if (tag >= 121 && tag <= 127) {
    return tag - 121;
  }
  if (tag >= 1280 && tag <= 1400) {
    return tag - 1280 + 7;
  }
  if (tag == kGeneralConstrTag) {
    auto size = in.read_array_header();
    if (!size || *size != 2) {
      throw decode_error{"general constructor must be a 2-element array"};
    }
    return in.read_unsigned();
  }
  throw decode_error{fmt::format("tag {} is not a constructor", tag)};
}

list_header read_fields(reader& in,
                        const uint64_t expected,
                        const std::string_view what) {
  auto header = read_list(in);
  if (header.size != expected) {
    throw decode_error{fmt::format("{}: expected {} fields, found {}", what,
                                   expected, header.size)};
  }
  return header;
}

list_header expect_constr(reader& in,
                          const uint64_t index,
                          const uint64_t expected_fields,
                          const std::string_view what) {
  auto found = read_constr(in);
  if (found != index) {
    throw decode_error{fmt::format("{}: expected constructor {}, found {}",
                                   what, index, found)};
  }
  return read_fields(in, expected_fields, what);
}

}  // namespace orca::schema::encoding::cbor
